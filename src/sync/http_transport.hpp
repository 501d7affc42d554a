#pragma once

#include "sync/sync_transport.hpp"
#include <QByteArray>
#include <QNetworkRequest>
#include <QString>
#include <QUrl>
#include <chrono>
#include <memory>

class QNetworkAccessManager;

namespace vellum::sync {

/**
 * HttpSyncTransport - SyncTransport over the sync server's REST API.
 *
 *   GET    {server}/health
 *   GET    {server}/api/notes
 *   PUT    {server}/api/notes/{id}
 *   DELETE {server}/api/notes/{id}?deleted_at=<ms>
 *
 * The account id travels in the X-Account-Id header. Calls block on a
 * local event loop, so they must run on a thread with a Qt event
 * dispatcher (the main thread of a QCoreApplication is enough).
 */
class HttpSyncTransport : public SyncTransport {
public:
    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{10000};

    explicit HttpSyncTransport(std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);
    ~HttpSyncTransport() override;

    HttpSyncTransport(const HttpSyncTransport&) = delete;
    HttpSyncTransport& operator=(const HttpSyncTransport&) = delete;

    [[nodiscard]] bool health_check(const std::string& server) override;

    [[nodiscard]] Result<std::vector<EncryptedEnvelope>, Error> pull(
        const std::string& server,
        const std::string& account_id) override;

    [[nodiscard]] Result<void, Error> push(
        const std::string& server,
        const std::string& account_id,
        const EncryptedEnvelope& envelope) override;

    [[nodiscard]] Result<void, Error> remove(
        const std::string& server,
        const std::string& account_id,
        const std::string& id,
        Timestamp deleted_at) override;

    /**
     * {server}{path}, with any trailing slash on the server dropped.
     */
    [[nodiscard]] static QUrl endpoint(const std::string& server, const QString& path);

private:
    struct Response {
        int status = 0;
        QByteArray body;
        bool network_error = false;
        QString error_string;
    };

    [[nodiscard]] Response perform(QNetworkRequest request,
                                   const QByteArray& verb,
                                   const QByteArray& body = {});
    [[nodiscard]] QNetworkRequest make_request(const QUrl& url,
                                               const std::string& account_id) const;
    [[nodiscard]] static Result<void, Error> check(const Response& response,
                                                   const std::string& what);

    std::unique_ptr<QNetworkAccessManager> network_;
    std::chrono::milliseconds timeout_;
};

} // namespace vellum::sync
