#pragma once

#include "sync/reconciler.hpp"
#include "sync/retry.hpp"
#include "sync/sync_session.hpp"
#include "sync/sync_transport.hpp"
#include "storage/note_store.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vellum::sync {

/**
 * Phases of one cycle: Idle -> HealthCheck -> Pull -> Merge -> Push -> Idle.
 * Failed is reachable from any phase and lasts until the next cycle.
 */
enum class SyncPhase {
    Idle,
    HealthCheck,
    Pull,
    Merge,
    Push,
    Failed
};

[[nodiscard]] constexpr const char* to_string(SyncPhase phase) noexcept {
    switch (phase) {
        case SyncPhase::Idle: return "idle";
        case SyncPhase::HealthCheck: return "health-check";
        case SyncPhase::Pull: return "pull";
        case SyncPhase::Merge: return "merge";
        case SyncPhase::Push: return "push";
        case SyncPhase::Failed: return "failed";
    }
    return "unknown";
}

/**
 * CancellationToken - cooperative stop request, honoured at phase
 * boundaries only.
 */
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    void reset() noexcept { cancelled_.store(false, std::memory_order_release); }
    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * A pulled envelope that could not be used. The id is left out of the
 * merge so nothing overwrites or deletes it.
 */
struct DecryptionSkip {
    std::string id;
    Error error;
};

/**
 * A remote operation that still failed after retries.
 */
struct PushFailure {
    std::string id;
    RemoteAction action;
    Error error;
    int attempts = 0;
};

enum class OutcomeKind {
    Success,
    PartialSuccess,
    Failed,
    Cancelled
};

[[nodiscard]] constexpr const char* to_string(OutcomeKind kind) noexcept {
    switch (kind) {
        case OutcomeKind::Success: return "success";
        case OutcomeKind::PartialSuccess: return "partial-success";
        case OutcomeKind::Failed: return "failed";
        case OutcomeKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

/**
 * SyncOutcome - what a cycle did.
 *
 * `error` is set for Failed (the cycle-level error) and Cancelled.
 * `failed_phase` names where a Failed or Cancelled cycle stopped.
 * PartialSuccess means the merge committed but some envelopes were
 * skipped or some remote operations did not go through.
 */
struct SyncOutcome {
    OutcomeKind kind = OutcomeKind::Success;
    std::optional<Error> error;
    std::optional<SyncPhase> failed_phase;
    SyncPlan plan;
    std::vector<DecryptionSkip> skipped;
    std::vector<PushFailure> push_failures;
    size_t remote_applied = 0;
    Timestamp finished_at;

    [[nodiscard]] bool ok() const noexcept {
        return kind == OutcomeKind::Success || kind == OutcomeKind::PartialSuccess;
    }
    [[nodiscard]] bool merge_committed() const noexcept {
        return ok() || (kind == OutcomeKind::Cancelled && failed_phase == SyncPhase::Push);
    }
};

/**
 * SyncEngine - runs sync cycles against one note store and transport.
 *
 * One cycle at a time: a concurrent run_cycle() returns Failed/Busy at
 * once without touching anything. Local changes land in a single
 * store transaction at the end of Merge, so a failure or cancellation
 * before that leaves the store as it was. The commit is refused if any
 * affected note changed after the merge read it; the merge is then
 * recomputed, up to three times, before the cycle fails with Conflict.
 */
class SyncEngine {
public:
    SyncEngine(storage::NoteStore& store,
               SyncTransport& transport,
               RetryPolicy retry = {},
               Sleeper sleeper = thread_sleeper());

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    [[nodiscard]] SyncOutcome run_cycle(const SyncSession& session,
                                        const std::string& server,
                                        const CancellationToken* cancel = nullptr);

    [[nodiscard]] bool health_check(const std::string& server);

    [[nodiscard]] SyncPhase phase() const noexcept { return phase_.load(); }
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

private:
    struct Pulled {
        std::vector<Note> notes;
        std::vector<DecryptionSkip> skipped;
    };

    [[nodiscard]] Pulled open_envelopes(const SyncSession& session,
                                        const std::vector<EncryptedEnvelope>& envelopes) const;
    [[nodiscard]] Result<void, Error> send(const SyncSession& session,
                                           const std::string& server,
                                           const RemoteOperation& op);

    void enter(SyncPhase phase);
    SyncOutcome fail(SyncOutcome outcome, SyncPhase at, Error error);
    SyncOutcome cancelled(SyncOutcome outcome, SyncPhase at);

    storage::NoteStore& store_;
    SyncTransport& transport_;
    RetryPolicy retry_;
    Sleeper sleeper_;

    std::mutex cycle_mutex_;
    std::atomic<SyncPhase> phase_{SyncPhase::Idle};
    std::atomic<bool> running_{false};
};

} // namespace vellum::sync
