#pragma once

#include <murmur/core/types.h>
#include <murmur/identity/principal.h>
#include <murmur/metadata/message_repository.h>
#include <murmur/sync/sync_state.h>

#include <mutex>
#include <set>
#include <string>
#include <utility>

namespace murmur::sync {

/**
 * Resumable cursor and status per (owner, source).
 *
 *   idle  --begin-->     running
 *   error --begin-->     running
 *   running --complete--> idle   (cursor and last_synced_at move together)
 *   running --fail-->     error  (cursor kept at the last checkpoint)
 *
 * checkpoint() advances the cursor while staying in running. begin() on a
 * pair that is already running in this process is SyncAlreadyRunning and
 * changes nothing.
 */
class SyncStateTracker {
public:
    explicit SyncStateTracker(metadata::MessageRepository& repository);

    Result<SyncSnapshot> get(const identity::Principal& owner, const std::string& source);

    /// Enter running; the returned snapshot carries the cursor to resume from.
    Result<SyncSnapshot> begin(const identity::Principal& owner, const std::string& source);

    Result<void> checkpoint(const identity::Principal& owner, const std::string& source,
                            const std::string& cursor);

    /// Move to idle at `cursor`. When the row cannot be written the run stays
    /// running so fail() can still record why.
    Result<void> complete(const identity::Principal& owner, const std::string& source,
                          const std::string& cursor);

    /// Move to error with the detail; leaves running even if the write fails.
    Result<void> fail(const identity::Principal& owner, const std::string& source,
                      const std::string& errorDetail);

    bool isRunning(const identity::Principal& owner, const std::string& source) const;

private:
    using Key = std::pair<std::string, std::string>;

    Result<SyncSnapshot> load(const identity::Principal& owner, const std::string& source);
    Result<void> store(const identity::Principal& owner, const SyncSnapshot& snapshot);
    Result<SyncSnapshot> requireRunning(const identity::Principal& owner,
                                        const std::string& source, const char* operation);

    metadata::MessageRepository& repository_;
    mutable std::mutex mutex_;
    std::set<Key> running_;
};

} // namespace murmur::sync
