#include <murmur/metadata/migration.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace murmur::metadata {

namespace {

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// Timestamps in every table are unix epoch milliseconds.
Migration messageSchema() {
    Migration m;
    m.version = 1;
    m.name = "Message schema";
    m.sql = R"(
        CREATE TABLE IF NOT EXISTS profiles (
            id TEXT PRIMARY KEY,
            email TEXT,
            display_name TEXT,
            avatar_url TEXT,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS conversations (
            id TEXT PRIMARY KEY,
            user_id TEXT NOT NULL REFERENCES profiles(id) ON DELETE CASCADE,
            external_id TEXT NOT NULL,
            title TEXT,
            participants TEXT NOT NULL DEFAULT '[]',
            last_message_at INTEGER,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            UNIQUE (user_id, external_id)
        );

        CREATE TABLE IF NOT EXISTS messages (
            id TEXT PRIMARY KEY,
            user_id TEXT NOT NULL REFERENCES profiles(id) ON DELETE CASCADE,
            conversation_id TEXT NOT NULL REFERENCES conversations(id) ON DELETE CASCADE,
            external_id TEXT,
            sender_id TEXT,
            sent_at INTEGER NOT NULL,
            body TEXT NOT NULL,
            metadata TEXT NOT NULL DEFAULT '{}',
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            UNIQUE (user_id, external_id)
        );

        CREATE INDEX IF NOT EXISTS idx_conversations_user ON conversations(user_id);
        CREATE INDEX IF NOT EXISTS idx_messages_user ON messages(user_id);
        CREATE INDEX IF NOT EXISTS idx_messages_conversation ON messages(conversation_id);
    )";
    return m;
}

Migration chunkSchema() {
    Migration m;
    m.version = 2;
    m.name = "Message chunks";
    m.sql = R"(
        CREATE TABLE IF NOT EXISTS message_chunks (
            id TEXT PRIMARY KEY,
            user_id TEXT NOT NULL REFERENCES profiles(id) ON DELETE CASCADE,
            message_id TEXT NOT NULL REFERENCES messages(id) ON DELETE CASCADE,
            chunk_index INTEGER NOT NULL,
            content TEXT NOT NULL,
            embedding BLOB,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            UNIQUE (message_id, chunk_index)
        );

        CREATE INDEX IF NOT EXISTS idx_message_chunks_user ON message_chunks(user_id);
        CREATE INDEX IF NOT EXISTS idx_message_chunks_pending
            ON message_chunks(user_id) WHERE embedding IS NULL;
    )";
    return m;
}

Migration syncStateSchema() {
    Migration m;
    m.version = 3;
    m.name = "Sync state";
    m.sql = R"(
        CREATE TABLE IF NOT EXISTS sync_state (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            user_id TEXT NOT NULL REFERENCES profiles(id) ON DELETE CASCADE,
            provider TEXT NOT NULL DEFAULT 'linkedin',
            cursor TEXT,
            status TEXT NOT NULL DEFAULT 'idle'
                CHECK (status IN ('idle', 'running', 'error')),
            error TEXT,
            last_synced_at INTEGER,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            UNIQUE (user_id, provider)
        );
    )";
    return m;
}

Migration updatedAtTriggers() {
    Migration m;
    m.version = 4;
    m.name = "updated_at triggers";
    m.apply = [](Database& db) -> Result<void> {
        for (const char* table :
             {"profiles", "conversations", "messages", "message_chunks", "sync_state"}) {
            std::string t(table);
            auto result = db.execute(
                "CREATE TRIGGER IF NOT EXISTS trg_" + t + "_updated_at AFTER UPDATE ON " + t +
                " FOR EACH ROW WHEN NEW.updated_at = OLD.updated_at BEGIN UPDATE " + t +
                " SET updated_at = CAST((julianday('now') - 2440587.5) * 86400000 AS INTEGER)"
                " WHERE rowid = NEW.rowid; END;");
            if (!result)
                return result;
        }
        return {};
    };
    return m;
}

// A non-NULL embed_error marks a chunk the provider refused outright; pending
// recovery skips it.
Migration embeddingRejections() {
    Migration m;
    m.version = 5;
    m.name = "Embedding rejections";
    m.sql = R"(
        ALTER TABLE message_chunks ADD COLUMN embed_error TEXT;

        DROP INDEX IF EXISTS idx_message_chunks_pending;
        CREATE INDEX IF NOT EXISTS idx_message_chunks_pending
            ON message_chunks(user_id) WHERE embedding IS NULL AND embed_error IS NULL;
    )";
    return m;
}

} // namespace

MigrationManager::MigrationManager(Database& db, std::vector<Migration> migrations)
    : db_(db), migrations_(std::move(migrations)) {
    std::sort(migrations_.begin(), migrations_.end(),
              [](const Migration& a, const Migration& b) { return a.version < b.version; });
}

Result<void> MigrationManager::initialize() {
    return db_.execute("CREATE TABLE IF NOT EXISTS schema_migrations ("
                       " version INTEGER PRIMARY KEY,"
                       " name TEXT NOT NULL,"
                       " applied_at INTEGER NOT NULL,"
                       " duration_ms INTEGER NOT NULL)");
}

Result<int> MigrationManager::currentVersion() {
    auto prepared = db_.prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations");
    if (!prepared)
        return prepared.error();
    Statement stmt = std::move(prepared).value();
    auto row = stmt.step();
    if (!row)
        return row.error();
    return row.value() ? stmt.getInt(0) : 0;
}

int MigrationManager::latestVersion() const {
    return migrations_.empty() ? 0 : migrations_.back().version;
}

Result<bool> MigrationManager::needsMigration() {
    auto current = currentVersion();
    if (!current)
        return current.error();
    return current.value() < latestVersion();
}

Result<void> MigrationManager::checkSequence() const {
    for (size_t i = 0; i < migrations_.size(); ++i) {
        if (migrations_[i].version != static_cast<int>(i) + 1) {
            return Error{ErrorCode::InvalidArgument,
                         "Migration versions must run 1.." + std::to_string(migrations_.size()) +
                             " without gaps; found " + std::to_string(migrations_[i].version)};
        }
    }
    return {};
}

Result<void> MigrationManager::migrate(std::optional<int> target) {
    if (auto sequence = checkSequence(); !sequence)
        return sequence;

    const int goal = target.value_or(latestVersion());
    auto current = currentVersion();
    if (!current)
        return current.error();
    if (goal < current.value()) {
        return Error{ErrorCode::InvalidArgument,
                     "Schema is at version " + std::to_string(current.value()) +
                         "; cannot migrate down to " + std::to_string(goal)};
    }

    int applied = 0;
    for (const auto& step : migrations_) {
        if (step.version <= current.value() || step.version > goal)
            continue;
        auto result = applyStep(step);
        if (!result) {
            spdlog::error("[Migration] Step {} '{}' failed: {}", step.version, step.name,
                          result.error().message);
            return result;
        }
        applied++;
    }

    if (applied > 0) {
        spdlog::info("[Migration] Applied {} step(s), schema now at version {}", applied, goal);
    }
    return {};
}

Result<void> MigrationManager::applyStep(const Migration& step) {
    const auto started = std::chrono::steady_clock::now();
    return db_.transaction([&]() -> Result<void> {
        Result<void> changed;
        if (step.apply) {
            changed = step.apply(db_);
        } else if (!step.sql.empty()) {
            changed = db_.execute(step.sql);
        } else {
            changed = Error{ErrorCode::InvalidData, "Migration '" + step.name + "' is empty"};
        }
        if (!changed)
            return changed;

        auto prepared = db_.prepare("INSERT INTO schema_migrations "
                                    "(version, name, applied_at, duration_ms) VALUES (?, ?, ?, ?)");
        if (!prepared)
            return prepared.error();
        Statement stmt = std::move(prepared).value();
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        auto bound = stmt.bindAll(step.version, step.name, nowMillis(),
                                  static_cast<int64_t>(elapsed.count()));
        if (!bound)
            return bound;
        return stmt.execute();
    });
}

Result<std::vector<AppliedMigration>> MigrationManager::history() {
    auto prepared = db_.prepare("SELECT version, name, applied_at, duration_ms "
                                "FROM schema_migrations ORDER BY version");
    if (!prepared)
        return prepared.error();
    Statement stmt = std::move(prepared).value();

    std::vector<AppliedMigration> out;
    for (auto row = stmt.step(); ; row = stmt.step()) {
        if (!row)
            return row.error();
        if (!row.value())
            break;
        AppliedMigration entry;
        entry.version = stmt.getInt(0);
        entry.name = stmt.getString(1);
        entry.appliedAt = TimePoint(std::chrono::milliseconds(stmt.getInt64(2)));
        entry.duration = std::chrono::milliseconds(stmt.getInt64(3));
        out.push_back(std::move(entry));
    }
    return out;
}

std::vector<Migration> messageStoreMigrations() {
    return {messageSchema(),     chunkSchema(),          syncStateSchema(),
            updatedAtTriggers(), embeddingRejections()};
}

Result<void> openAndMigrate(Database& db, const std::string& path, ConnectionMode mode) {
    auto opened = db.open(path, mode);
    if (!opened)
        return opened;

    MigrationManager manager(db, messageStoreMigrations());
    if (auto init = manager.initialize(); !init)
        return init;
    return manager.migrate();
}

} // namespace murmur::metadata
