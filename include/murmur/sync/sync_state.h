#pragma once

#include <murmur/core/types.h>

#include <optional>
#include <string>
#include <string_view>

namespace murmur::sync {

enum class SyncStatus { Idle, Running, Error };

const char* syncStatusName(SyncStatus status);

/// Parses the persisted status column; unknown text is InvalidData.
Result<SyncStatus> parseSyncStatus(std::string_view text);

/**
 * Point-in-time view of one (owner, source) pair. An owner that never synced
 * reports Idle with an empty cursor.
 */
struct SyncSnapshot {
    std::string source;
    std::string cursor;
    SyncStatus status{SyncStatus::Idle};
    std::string lastError;
    std::optional<TimePoint> lastSyncedAt;
};

} // namespace murmur::sync
