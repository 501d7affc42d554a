#pragma once

#include "sync/sync_transport.hpp"
#include <map>
#include <mutex>
#include <set>

namespace vellum::sync {

/**
 * MemorySyncTransport - an in-process sync server.
 *
 * Backs the CLI's --mock mode and the engine tests. Failure switches
 * simulate an unhealthy server, transient write failures and refusals.
 * Thread-safe.
 */
class MemorySyncTransport : public SyncTransport {
public:
    MemorySyncTransport() = default;

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

    // Failure injection

    void set_healthy(const std::string& server, bool healthy);
    void set_pull_failure(bool fail);
    /** The next `count` writes fail with ServerUnreachable. */
    void fail_next_writes(int count);
    /** Writes for `id` fail with Rejected. */
    void reject_writes_for(const std::string& id);

    // Inspection

    [[nodiscard]] std::vector<EncryptedEnvelope> stored(
        const std::string& server, const std::string& account_id) const;
    /** Overwrite a stored envelope, bypassing failure switches. */
    void put_raw(const std::string& server, const std::string& account_id,
                 const EncryptedEnvelope& envelope);
    [[nodiscard]] int write_attempts() const;
    [[nodiscard]] int pull_count() const;

private:
    using Bucket = std::map<std::string, EncryptedEnvelope>;

    [[nodiscard]] Result<void, Error> check_write(const std::string& id);

    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, Bucket>> data_;
    std::set<std::string> unhealthy_;
    std::set<std::string> rejected_ids_;
    bool fail_pulls_ = false;
    int pending_write_failures_ = 0;
    int write_attempts_ = 0;
    int pull_count_ = 0;
};

} // namespace vellum::sync
