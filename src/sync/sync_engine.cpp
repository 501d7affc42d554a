#include "sync/sync_engine.hpp"
#include "sync/note_codec.hpp"
#include "core/logging.hpp"

#include <map>
#include <set>

namespace vellum::sync {

namespace {

constexpr int kMergeAttempts = 3;

class RunningFlag {
public:
    explicit RunningFlag(std::atomic<bool>& flag) : flag_(flag) { flag_.store(true); }
    ~RunningFlag() { flag_.store(false); }

    RunningFlag(const RunningFlag&) = delete;
    RunningFlag& operator=(const RunningFlag&) = delete;

private:
    std::atomic<bool>& flag_;
};

bool is_cancelled(const CancellationToken* cancel) {
    return cancel != nullptr && cancel->is_cancelled();
}

QString qstr(const std::string& s) {
    return QString::fromStdString(s);
}

} // namespace

SyncEngine::SyncEngine(storage::NoteStore& store,
                       SyncTransport& transport,
                       RetryPolicy retry,
                       Sleeper sleeper)
    : store_(store)
    , transport_(transport)
    , retry_(retry)
    , sleeper_(std::move(sleeper)) {}

void SyncEngine::enter(SyncPhase phase) {
    phase_.store(phase);
    qCDebug(vellumSyncLog) << "phase" << to_string(phase);
}

SyncOutcome SyncEngine::fail(SyncOutcome outcome, SyncPhase at, Error error) {
    qCWarning(vellumSyncLog) << "sync failed during" << to_string(at) << ":"
                             << qstr(error.describe());
    outcome.kind = OutcomeKind::Failed;
    outcome.failed_phase = at;
    outcome.error = std::move(error);
    outcome.finished_at = Timestamp::now();
    phase_.store(SyncPhase::Failed);
    return outcome;
}

SyncOutcome SyncEngine::cancelled(SyncOutcome outcome, SyncPhase at) {
    qCInfo(vellumSyncLog) << "sync cancelled before" << to_string(at);
    outcome.kind = OutcomeKind::Cancelled;
    outcome.failed_phase = at;
    outcome.error = Error{ErrorKind::Cancelled,
                          std::string("Cancelled before ") + to_string(at)};
    outcome.finished_at = Timestamp::now();
    phase_.store(SyncPhase::Idle);
    return outcome;
}

bool SyncEngine::health_check(const std::string& server) {
    return transport_.health_check(server);
}

SyncEngine::Pulled SyncEngine::open_envelopes(
    const SyncSession& session,
    const std::vector<EncryptedEnvelope>& envelopes) const {
    Pulled out;
    std::map<std::string, Note> latest;
    std::set<std::string> bad_ids;

    for (const auto& envelope : envelopes) {
        if (bad_ids.count(envelope.id) > 0) {
            continue;
        }

        Note note;
        if (envelope.deleted) {
            note = remote_tombstone(envelope.id, envelope.modified_at);
        } else {
            auto plaintext = session.cipher().decrypt(envelope);
            if (plaintext.is_err()) {
                out.skipped.push_back({envelope.id, plaintext.unwrap_err()});
                bad_ids.insert(envelope.id);
                continue;
            }
            auto decoded = decode_note(plaintext.unwrap().span(), envelope.id);
            if (decoded.is_err()) {
                out.skipped.push_back({envelope.id, decoded.unwrap_err()});
                bad_ids.insert(envelope.id);
                continue;
            }
            note = std::move(decoded).unwrap();
            // The authenticated envelope timestamp is the merge key.
            note.modified_at = envelope.modified_at;
        }

        auto it = latest.find(note.id);
        if (it == latest.end() || it->second.modified_at < note.modified_at) {
            latest[note.id] = std::move(note);
        }
    }

    for (auto& [id, note] : latest) {
        if (bad_ids.count(id) == 0) {
            out.notes.push_back(std::move(note));
        }
    }
    for (const auto& skip : out.skipped) {
        qCWarning(vellumSyncLog) << "skipping envelope" << qstr(skip.id) << ":"
                                 << to_string(skip.error.kind);
    }
    return out;
}

Result<void, Error> SyncEngine::send(const SyncSession& session,
                                     const std::string& server,
                                     const RemoteOperation& op) {
    if (op.action == RemoteAction::Delete) {
        return transport_.remove(server, session.account_id(), op.note.id, op.note.modified_at);
    }

    const auto plaintext = encode_note(op.note);
    auto envelope = session.cipher().encrypt(
        crypto::EnvelopeHeader{op.note.id, op.note.modified_at}, plaintext.span());
    if (envelope.is_err()) {
        return Result<void, Error>::err(envelope.unwrap_err());
    }
    return transport_.push(server, session.account_id(), envelope.unwrap());
}

SyncOutcome SyncEngine::run_cycle(const SyncSession& session,
                                  const std::string& server,
                                  const CancellationToken* cancel) {
    SyncOutcome outcome;

    std::unique_lock lock(cycle_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        qCInfo(vellumSyncLog) << "sync already running, rejecting";
        outcome.kind = OutcomeKind::Failed;
        outcome.error = Error{ErrorKind::Busy, "A sync cycle is already running"};
        outcome.finished_at = Timestamp::now();
        return outcome;
    }
    RunningFlag running(running_);

    qCInfo(vellumSyncLog) << "sync started against" << qstr(server);

    // HealthCheck
    if (is_cancelled(cancel)) return cancelled(std::move(outcome), SyncPhase::HealthCheck);
    enter(SyncPhase::HealthCheck);
    if (!transport_.health_check(server)) {
        return fail(std::move(outcome), SyncPhase::HealthCheck,
                    Error{ErrorKind::ServerUnreachable, "Server " + server + " is not reachable"});
    }

    // Pull
    if (is_cancelled(cancel)) return cancelled(std::move(outcome), SyncPhase::Pull);
    enter(SyncPhase::Pull);
    auto pulled = transport_.pull(server, session.account_id());
    if (pulled.is_err()) {
        return fail(std::move(outcome), SyncPhase::Pull, pulled.unwrap_err());
    }
    auto remote = open_envelopes(session, pulled.unwrap());
    outcome.skipped = std::move(remote.skipped);
    qCDebug(vellumSyncLog) << "pulled" << pulled.unwrap().size() << "envelopes,"
                           << outcome.skipped.size() << "skipped";

    // Merge
    if (is_cancelled(cancel)) return cancelled(std::move(outcome), SyncPhase::Merge);
    enter(SyncPhase::Merge);
    std::set<std::string> skipped_ids;
    for (const auto& skip : outcome.skipped) skipped_ids.insert(skip.id);

    // Another writer may commit between load and commit; the store refuses
    // the stale merge and it is recomputed from fresh rows.
    for (int attempt = 1;; ++attempt) {
        auto loaded = store_.load_all();
        if (loaded.is_err()) {
            return fail(std::move(outcome), SyncPhase::Merge, loaded.unwrap_err());
        }

        std::vector<Note> local;
        for (auto& note : loaded.unwrap()) {
            if (skipped_ids.count(note.id) == 0) local.push_back(std::move(note));
        }

        outcome.plan = reconcile(local, remote.notes);

        std::vector<Note> changed;
        changed.reserve(outcome.plan.local.size());
        for (const auto& m : outcome.plan.local) changed.push_back(m.note);

        auto committed = store_.commit_merge(local, changed);
        if (committed.is_ok()) {
            break;
        }
        if (!committed.unwrap_err().is(ErrorKind::Conflict) || attempt >= kMergeAttempts) {
            return fail(std::move(outcome), SyncPhase::Merge, committed.unwrap_err());
        }
        qCInfo(vellumSyncLog) << "local notes changed during merge, retrying";
    }
    for (const auto& c : outcome.plan.conflicts) {
        qCInfo(vellumSyncLog) << "conflict on" << qstr(c.id) << "resolved in favour of"
                              << (c.kept_local ? "local" : "remote") << "copy";
    }
    qCDebug(vellumSyncLog) << "merge committed" << outcome.plan.local.size() << "local,"
                           << outcome.plan.remote.size() << "remote operations";

    // Push
    if (is_cancelled(cancel)) return cancelled(std::move(outcome), SyncPhase::Push);
    enter(SyncPhase::Push);
    for (const auto& op : outcome.plan.remote) {
        int attempts = 0;
        auto sent = with_retry(retry_, sleeper_, [&] { return send(session, server, op); }, attempts);
        if (sent.is_err()) {
            qCWarning(vellumSyncLog) << to_string(op.action) << "of" << qstr(op.note.id)
                                     << "failed after" << attempts << "attempts:"
                                     << qstr(sent.unwrap_err().message);
            outcome.push_failures.push_back({op.note.id, op.action, sent.unwrap_err(), attempts});
            continue;
        }
        ++outcome.remote_applied;
    }

    outcome.kind = outcome.skipped.empty() && outcome.push_failures.empty()
                       ? OutcomeKind::Success
                       : OutcomeKind::PartialSuccess;
    outcome.finished_at = Timestamp::now();
    phase_.store(SyncPhase::Idle);

    qCInfo(vellumSyncLog) << "sync finished:" << to_string(outcome.kind)
                          << outcome.plan.local.size() << "local changes,"
                          << outcome.remote_applied << "remote changes,"
                          << outcome.skipped.size() << "skipped,"
                          << outcome.push_failures.size() << "failed";
    return outcome;
}

} // namespace vellum::sync
