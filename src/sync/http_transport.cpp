#include "sync/http_transport.hpp"
#include "sync/envelope_json.hpp"
#include "core/logging.hpp"

#include <QEventLoop>
#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QUrlQuery>

namespace vellum::sync {

namespace {

const QByteArray ACCOUNT_HEADER = QByteArrayLiteral("X-Account-Id");

} // namespace

HttpSyncTransport::HttpSyncTransport(std::chrono::milliseconds timeout)
    : network_(std::make_unique<QNetworkAccessManager>())
    , timeout_(timeout) {}

HttpSyncTransport::~HttpSyncTransport() = default;

QUrl HttpSyncTransport::endpoint(const std::string& server, const QString& path) {
    QString base = QString::fromStdString(server);
    while (base.endsWith(QLatin1Char('/'))) {
        base.chop(1);
    }
    return QUrl(base + path);
}

QNetworkRequest HttpSyncTransport::make_request(const QUrl& url,
                                                const std::string& account_id) const {
    QNetworkRequest request(url);
    request.setTransferTimeout(static_cast<int>(timeout_.count()));
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    if (!account_id.empty()) {
        request.setRawHeader(ACCOUNT_HEADER, QByteArray::fromStdString(account_id));
    }
    return request;
}

HttpSyncTransport::Response HttpSyncTransport::perform(QNetworkRequest request,
                                                       const QByteArray& verb,
                                                       const QByteArray& body) {
    QNetworkReply* reply = network_->sendCustomRequest(request, verb, body);

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished()) {
        loop.exec();
    }

    Response response;
    response.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.body = reply->readAll();
    // HTTP error statuses also set an error code; only count transport failures.
    response.network_error = response.status == 0 && reply->error() != QNetworkReply::NoError;
    response.error_string = reply->errorString();
    reply->deleteLater();

    qCDebug(vellumSyncLog) << verb << request.url().toString(QUrl::RemoveQuery)
                           << "->" << response.status;
    return response;
}

Result<void, Error> HttpSyncTransport::check(const Response& response, const std::string& what) {
    if (response.network_error) {
        return Result<void, Error>::err(Error{
            ErrorKind::ServerUnreachable, what + ": " + response.error_string.toStdString()});
    }
    if (response.status >= 500) {
        return Result<void, Error>::err(Error{
            ErrorKind::ServerUnreachable,
            what + ": server error " + std::to_string(response.status),
            response.status});
    }
    if (response.status >= 400) {
        return Result<void, Error>::err(Error{
            ErrorKind::Rejected,
            what + ": rejected with " + std::to_string(response.status),
            response.status});
    }
    if (response.status < 200 || response.status >= 300) {
        return Result<void, Error>::err(Error{
            ErrorKind::Rejected,
            what + ": unexpected status " + std::to_string(response.status),
            response.status});
    }
    return Result<void, Error>::ok();
}

bool HttpSyncTransport::health_check(const std::string& server) {
    const auto url = endpoint(server, QStringLiteral("/health"));
    if (!url.isValid()) {
        return false;
    }
    const auto response = perform(make_request(url, {}), QByteArrayLiteral("GET"));
    const auto status = check(response, "Health check of " + server);
    if (status.is_err()) {
        qCWarning(vellumSyncLog) << "health check failed:"
                                 << QString::fromStdString(status.unwrap_err().message);
        return false;
    }
    return true;
}

Result<std::vector<EncryptedEnvelope>, Error> HttpSyncTransport::pull(
    const std::string& server,
    const std::string& account_id) {
    const auto url = endpoint(server, QStringLiteral("/api/notes"));
    const auto response = perform(make_request(url, account_id), QByteArrayLiteral("GET"));
    auto status = check(response, "Pull from " + server);
    if (status.is_err()) {
        return Result<std::vector<EncryptedEnvelope>, Error>::err(status.unwrap_err());
    }

    auto parsed = parse_pull_response(response.body);
    if (parsed.is_err()) {
        return Result<std::vector<EncryptedEnvelope>, Error>::err(parsed.unwrap_err());
    }
    auto pulled = std::move(parsed).unwrap();
    if (pulled.dropped > 0) {
        qCWarning(vellumSyncLog) << "dropped" << pulled.dropped << "envelopes without an id";
    }
    return Result<std::vector<EncryptedEnvelope>, Error>::ok(std::move(pulled.envelopes));
}

Result<void, Error> HttpSyncTransport::push(
    const std::string& server,
    const std::string& account_id,
    const EncryptedEnvelope& envelope) {
    const auto path = QStringLiteral("/api/notes/") +
                      QString::fromLatin1(QUrl::toPercentEncoding(QString::fromStdString(envelope.id)));
    const auto body = QJsonDocument(envelope_to_json(envelope)).toJson(QJsonDocument::Compact);
    const auto response = perform(make_request(endpoint(server, path), account_id),
                                  QByteArrayLiteral("PUT"), body);
    return check(response, "Push of " + envelope.id);
}

Result<void, Error> HttpSyncTransport::remove(
    const std::string& server,
    const std::string& account_id,
    const std::string& id,
    Timestamp deleted_at) {
    const auto path = QStringLiteral("/api/notes/") +
                      QString::fromLatin1(QUrl::toPercentEncoding(QString::fromStdString(id)));
    QUrl url = endpoint(server, path);
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("deleted_at"), QString::number(deleted_at.millis()));
    url.setQuery(query);

    const auto response = perform(make_request(url, account_id), QByteArrayLiteral("DELETE"));
    return check(response, "Delete of " + id);
}

} // namespace vellum::sync
