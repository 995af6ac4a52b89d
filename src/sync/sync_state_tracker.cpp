#include <murmur/sync/sync_state_tracker.h>

#include <spdlog/spdlog.h>

namespace murmur::sync {

const char* syncStatusName(SyncStatus status) {
    switch (status) {
        case SyncStatus::Idle: return "idle";
        case SyncStatus::Running: return "running";
        case SyncStatus::Error: return "error";
    }
    return "unknown";
}

Result<SyncStatus> parseSyncStatus(std::string_view text) {
    if (text == "idle")
        return SyncStatus::Idle;
    if (text == "running")
        return SyncStatus::Running;
    if (text == "error")
        return SyncStatus::Error;
    return Error{ErrorCode::InvalidData, "Unknown sync status '" + std::string(text) + "'"};
}

SyncStateTracker::SyncStateTracker(metadata::MessageRepository& repository)
    : repository_(repository) {}

Result<SyncSnapshot> SyncStateTracker::load(const identity::Principal& owner,
                                            const std::string& source) {
    auto record = repository_.loadSyncState(owner, source);
    if (!record)
        return record.error();

    SyncSnapshot snapshot;
    snapshot.source = source;
    if (!record.value()) {
        return snapshot;
    }

    const auto& row = *record.value();
    auto status = parseSyncStatus(row.status);
    if (!status)
        return status.error();

    snapshot.cursor = row.cursor;
    snapshot.status = status.value();
    snapshot.lastError = row.error;
    snapshot.lastSyncedAt = row.lastSyncedAt;
    return snapshot;
}

Result<void> SyncStateTracker::store(const identity::Principal& owner,
                                     const SyncSnapshot& snapshot) {
    metadata::SyncStateRecord record;
    record.ownerId = owner.id();
    record.provider = snapshot.source;
    record.cursor = snapshot.cursor;
    record.status = syncStatusName(snapshot.status);
    record.error = snapshot.lastError;
    record.lastSyncedAt = snapshot.lastSyncedAt;
    return repository_.saveSyncState(owner, record);
}

Result<SyncSnapshot> SyncStateTracker::get(const identity::Principal& owner,
                                           const std::string& source) {
    std::lock_guard<std::mutex> lock(mutex_);
    return load(owner, source);
}

Result<SyncSnapshot> SyncStateTracker::begin(const identity::Principal& owner,
                                             const std::string& source) {
    std::lock_guard<std::mutex> lock(mutex_);

    Key key{owner.id(), source};
    if (running_.count(key)) {
        spdlog::warn("[SyncStateTracker] Sync for {}/{} already running", owner.id(), source);
        return Error{ErrorCode::SyncAlreadyRunning,
                     "Sync already running for source '" + source + "'"};
    }

    auto snapshot = load(owner, source);
    if (!snapshot)
        return snapshot.error();

    SyncSnapshot next = std::move(snapshot).value();
    if (next.status == SyncStatus::Running) {
        // Persisted as running but no run is active here: the process that
        // owned it stopped mid-sync. Resume from its last checkpoint.
        spdlog::warn("[SyncStateTracker] Recovering stale running state for {}/{}", owner.id(),
                     source);
    }
    next.status = SyncStatus::Running;
    next.lastError.clear();

    auto stored = store(owner, next);
    if (!stored)
        return stored.error();

    running_.insert(std::move(key));
    spdlog::debug("[SyncStateTracker] {}/{} running from cursor '{}'", owner.id(), source,
                  next.cursor);
    return next;
}

Result<SyncSnapshot> SyncStateTracker::requireRunning(const identity::Principal& owner,
                                                      const std::string& source,
                                                      const char* operation) {
    if (!running_.count(Key{owner.id(), source})) {
        return Error{ErrorCode::InvalidState,
                     std::string("Cannot ") + operation + " a sync that is not running"};
    }
    return load(owner, source);
}

Result<void> SyncStateTracker::checkpoint(const identity::Principal& owner,
                                          const std::string& source, const std::string& cursor) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto snapshot = requireRunning(owner, source, "checkpoint");
    if (!snapshot)
        return snapshot.error();

    SyncSnapshot next = std::move(snapshot).value();
    next.cursor = cursor;
    return store(owner, next);
}

Result<void> SyncStateTracker::complete(const identity::Principal& owner,
                                        const std::string& source, const std::string& cursor) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto snapshot = requireRunning(owner, source, "complete");
    if (!snapshot) {
        running_.erase(Key{owner.id(), source});
        return snapshot.error();
    }

    SyncSnapshot next = std::move(snapshot).value();
    next.cursor = cursor;
    next.status = SyncStatus::Idle;
    next.lastError.clear();
    next.lastSyncedAt = std::chrono::system_clock::now();

    auto stored = store(owner, next);
    if (!stored) {
        // Still running; the caller records the failure through fail().
        return stored;
    }
    running_.erase(Key{owner.id(), source});
    spdlog::info("[SyncStateTracker] {}/{} idle at cursor '{}'", owner.id(), source, cursor);
    return stored;
}

Result<void> SyncStateTracker::fail(const identity::Principal& owner, const std::string& source,
                                    const std::string& errorDetail) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto snapshot = requireRunning(owner, source, "fail");
    if (!snapshot) {
        running_.erase(Key{owner.id(), source});
        return snapshot.error();
    }

    SyncSnapshot next = std::move(snapshot).value();
    next.status = SyncStatus::Error;
    next.lastError = errorDetail;

    auto stored = store(owner, next);
    running_.erase(Key{owner.id(), source});
    spdlog::warn("[SyncStateTracker] {}/{} failed: {}", owner.id(), source, errorDetail);
    return stored;
}

bool SyncStateTracker::isRunning(const identity::Principal& owner,
                                 const std::string& source) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_.count(Key{owner.id(), source}) > 0;
}

} // namespace murmur::sync
