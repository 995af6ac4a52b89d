#pragma once

#include <murmur/metadata/database.h>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace murmur::metadata {

/**
 * One schema step. Either `sql` runs as a script or, when set, `apply` runs
 * instead; both execute inside the step's transaction.
 */
struct Migration {
    int version = 0;
    std::string name;
    std::string sql;
    std::function<Result<void>(Database&)> apply;
};

struct AppliedMigration {
    int version = 0;
    std::string name;
    TimePoint appliedAt;
    std::chrono::milliseconds duration{0};
};

/**
 * Forward-only migrations tracked in `schema_migrations`.
 *
 * Each step and its history row commit together, so a failed step leaves
 * neither its changes nor a record behind and the next run retries it.
 * Versions must be 1..N without gaps.
 */
class MigrationManager {
public:
    MigrationManager(Database& db, std::vector<Migration> migrations);

    /// Create the history table if needed.
    Result<void> initialize();

    /// Highest applied version; 0 for a fresh database.
    Result<int> currentVersion();
    int latestVersion() const;
    Result<bool> needsMigration();

    /// Apply pending steps up to `target` (latest when unset). Moving below
    /// the current version is InvalidArgument.
    Result<void> migrate(std::optional<int> target = std::nullopt);

    Result<std::vector<AppliedMigration>> history();

private:
    Result<void> checkSequence() const;
    Result<void> applyStep(const Migration& step);

    Database& db_;
    std::vector<Migration> migrations_;
};

/// The message store schema: profiles, conversations, messages, chunks,
/// sync state and updated_at triggers.
std::vector<Migration> messageStoreMigrations();

/// Open `path` and bring it to the latest message store schema.
Result<void> openAndMigrate(Database& db, const std::string& path,
                            ConnectionMode mode = ConnectionMode::Create);

} // namespace murmur::metadata
