#include "sync/memory_transport.hpp"

namespace vellum::sync {

bool MemorySyncTransport::health_check(const std::string& server) {
    std::lock_guard lock(mutex_);
    return unhealthy_.find(server) == unhealthy_.end();
}

Result<std::vector<EncryptedEnvelope>, Error> MemorySyncTransport::pull(
    const std::string& server,
    const std::string& account_id) {
    std::lock_guard lock(mutex_);
    ++pull_count_;
    if (fail_pulls_ || unhealthy_.count(server) > 0) {
        return Result<std::vector<EncryptedEnvelope>, Error>::err(
            Error{ErrorKind::ServerUnreachable, "Server " + server + " did not answer"});
    }

    std::vector<EncryptedEnvelope> out;
    const auto server_it = data_.find(server);
    if (server_it != data_.end()) {
        const auto account_it = server_it->second.find(account_id);
        if (account_it != server_it->second.end()) {
            for (const auto& [id, envelope] : account_it->second) {
                out.push_back(envelope);
            }
        }
    }
    return Result<std::vector<EncryptedEnvelope>, Error>::ok(std::move(out));
}

Result<void, Error> MemorySyncTransport::check_write(const std::string& id) {
    ++write_attempts_;
    if (pending_write_failures_ > 0) {
        --pending_write_failures_;
        return Result<void, Error>::err(
            Error{ErrorKind::ServerUnreachable, "Write of " + id + " timed out"});
    }
    if (rejected_ids_.count(id) > 0) {
        return Result<void, Error>::err(
            Error{ErrorKind::Rejected, "Server refused " + id, 400});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> MemorySyncTransport::push(
    const std::string& server,
    const std::string& account_id,
    const EncryptedEnvelope& envelope) {
    std::lock_guard lock(mutex_);
    auto check = check_write(envelope.id);
    if (check.is_err()) {
        return check;
    }
    data_[server][account_id][envelope.id] = envelope;
    return Result<void, Error>::ok();
}

Result<void, Error> MemorySyncTransport::remove(
    const std::string& server,
    const std::string& account_id,
    const std::string& id,
    Timestamp deleted_at) {
    std::lock_guard lock(mutex_);
    auto check = check_write(id);
    if (check.is_err()) {
        return check;
    }
    data_[server][account_id][id] = tombstone_envelope(id, deleted_at);
    return Result<void, Error>::ok();
}

void MemorySyncTransport::set_healthy(const std::string& server, bool healthy) {
    std::lock_guard lock(mutex_);
    if (healthy) {
        unhealthy_.erase(server);
    } else {
        unhealthy_.insert(server);
    }
}

void MemorySyncTransport::set_pull_failure(bool fail) {
    std::lock_guard lock(mutex_);
    fail_pulls_ = fail;
}

void MemorySyncTransport::fail_next_writes(int count) {
    std::lock_guard lock(mutex_);
    pending_write_failures_ = count;
}

void MemorySyncTransport::reject_writes_for(const std::string& id) {
    std::lock_guard lock(mutex_);
    rejected_ids_.insert(id);
}

std::vector<EncryptedEnvelope> MemorySyncTransport::stored(
    const std::string& server, const std::string& account_id) const {
    std::lock_guard lock(mutex_);
    std::vector<EncryptedEnvelope> out;
    const auto server_it = data_.find(server);
    if (server_it == data_.end()) return out;
    const auto account_it = server_it->second.find(account_id);
    if (account_it == server_it->second.end()) return out;
    for (const auto& [id, envelope] : account_it->second) {
        out.push_back(envelope);
    }
    return out;
}

void MemorySyncTransport::put_raw(const std::string& server, const std::string& account_id,
                                  const EncryptedEnvelope& envelope) {
    std::lock_guard lock(mutex_);
    data_[server][account_id][envelope.id] = envelope;
}

int MemorySyncTransport::write_attempts() const {
    std::lock_guard lock(mutex_);
    return write_attempts_;
}

int MemorySyncTransport::pull_count() const {
    std::lock_guard lock(mutex_);
    return pull_count_;
}

} // namespace vellum::sync
