#include <murmur/metadata/database.h>

#include <spdlog/spdlog.h>

#include <cstring>
#include <thread>

namespace murmur::metadata {

namespace {

constexpr int kStepAttempts = 5;
constexpr auto kFirstStepBackoff = std::chrono::milliseconds(10);
constexpr int kBusyTimeoutMs = 5000;

int openFlags(ConnectionMode mode) {
    switch (mode) {
        case ConnectionMode::ReadOnly:
            return SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX;
        case ConnectionMode::Memory:
            return SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY |
                   SQLITE_OPEN_FULLMUTEX;
        case ConnectionMode::Create:
            break;
    }
    return SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
}

Error notOpen() {
    return Error{ErrorCode::NotInitialized, "Database not open"};
}

} // namespace

// -- Statement --

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        db_ = std::exchange(other.db_, nullptr);
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

std::string Statement::describe(int rc) const {
    std::string text = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    if (rc == SQLITE_CONSTRAINT && stmt_) {
        if (const char* sql = sqlite3_sql(stmt_)) {
            std::string_view view(sql);
            text += " [SQL: " + std::string(view.substr(0, 100)) +
                    (view.size() > 100 ? "..." : "") + "]";
        }
    }
    return text;
}

Result<void> Statement::checkBind(int rc, int index) const {
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError,
                     "Bind of parameter " + std::to_string(index) + " failed: " + describe(rc)};
    }
    return {};
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    return checkBind(sqlite3_bind_null(stmt_, index), index);
}

Result<void> Statement::bind(int index, int value) {
    return checkBind(sqlite3_bind_int(stmt_, index, value), index);
}

Result<void> Statement::bind(int index, int64_t value) {
    return checkBind(sqlite3_bind_int64(stmt_, index, value), index);
}

Result<void> Statement::bind(int index, const std::string& value) {
    return bind(index, std::string_view(value));
}

Result<void> Statement::bind(int index, std::string_view value) {
    return checkBind(sqlite3_bind_text(stmt_, index, value.data(),
                                       static_cast<int>(value.size()), SQLITE_TRANSIENT),
                     index);
}

Result<void> Statement::bind(int index, std::span<const std::byte> blob) {
    return checkBind(sqlite3_bind_blob(stmt_, index, blob.data(), static_cast<int>(blob.size()),
                                       SQLITE_TRANSIENT),
                     index);
}

int Statement::stepWithRetry() {
    auto backoff = kFirstStepBackoff;
    int rc = SQLITE_MISUSE;
    for (int attempt = 1; attempt <= kStepAttempts; ++attempt) {
        rc = sqlite3_step(stmt_);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) {
            return rc;
        }
        if (attempt < kStepAttempts) {
            sqlite3_reset(stmt_);
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }
    return rc;
}

Result<void> Statement::execute() {
    if (!stmt_) {
        return Error{ErrorCode::InvalidState, "Statement not prepared"};
    }
    int rc = stepWithRetry();
    if (rc == SQLITE_DONE || rc == SQLITE_ROW) {
        return {};
    }
    return Error{ErrorCode::DatabaseError, "Statement failed: " + describe(rc)};
}

Result<bool> Statement::step() {
    if (!stmt_) {
        return Error{ErrorCode::InvalidState, "Statement not prepared"};
    }
    int rc = stepWithRetry();
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    return Error{ErrorCode::DatabaseError, "Step failed: " + describe(rc)};
}

int Statement::getInt(int column) const {
    return sqlite3_column_int(stmt_, column);
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

std::string Statement::getString(int column) const {
    const auto* text = sqlite3_column_text(stmt_, column);
    if (!text) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::vector<std::byte> Statement::getBlob(int column) const {
    const void* data = sqlite3_column_blob(stmt_, column);
    const int size = sqlite3_column_bytes(stmt_, column);
    std::vector<std::byte> out;
    if (data && size > 0) {
        out.resize(static_cast<size_t>(size));
        std::memcpy(out.data(), data, out.size());
    }
    return out;
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Result<void> Statement::reset() {
    if (!stmt_) {
        return Error{ErrorCode::InvalidState, "Statement not prepared"};
    }
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
    return {};
}

// -- Database --

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), path_(std::move(other.path_)),
      inTransaction_(std::exchange(other.inTransaction_, false)) {}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
        inTransaction_ = std::exchange(other.inTransaction_, false);
    }
    return *this;
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    if (db_) {
        return Error{ErrorCode::InvalidState, "Database already open: " + path_};
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, openFlags(mode), nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        return Error{ErrorCode::DatabaseError, "Cannot open " + path + ": " + reason};
    }

    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    path_ = path;

    // Owner cascades rely on this; SQLite leaves it off per connection.
    if (auto fk = execute("PRAGMA foreign_keys = ON"); !fk) {
        close();
        return fk;
    }
    spdlog::debug("[Database] Opened {}", path);
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
    path_.clear();
    inTransaction_ = false;
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return notOpen();
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return Error{ErrorCode::DatabaseError,
                     std::string("Prepare failed: ") + sqlite3_errmsg(db_)};
    }
    return Statement(db_, stmt);
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return notOpen();
    }
    char* message = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &message) != SQLITE_OK) {
        std::string reason = message ? message : sqlite3_errmsg(db_);
        sqlite3_free(message);
        spdlog::error("[Database] exec failed ({}): {}", reason, sql);
        return Error{ErrorCode::DatabaseError, "SQL failed: " + reason};
    }
    return {};
}

Result<void> Database::beginTransaction() {
    if (inTransaction_) {
        return Error{ErrorCode::InvalidState, "Transaction already open"};
    }
    auto began = execute("BEGIN IMMEDIATE");
    inTransaction_ = static_cast<bool>(began);
    return began;
}

Result<void> Database::endTransaction(const char* sql) {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "No open transaction"};
    }
    auto ended = execute(sql);
    // A failed ROLLBACK still leaves SQLite out of the transaction.
    if (ended || std::strcmp(sql, "ROLLBACK") == 0) {
        inTransaction_ = false;
    }
    return ended;
}

Database::RollbackGuard::~RollbackGuard() {
    if (done_) {
        return;
    }
    if (auto rb = db_.endTransaction("ROLLBACK"); !rb) {
        spdlog::error("[Database] Rollback during unwind failed: {}", rb.error().message);
    }
}

Result<void> Database::RollbackGuard::commit() {
    auto committed = db_.endTransaction("COMMIT");
    // On failure the destructor still rolls back.
    done_ = static_cast<bool>(committed);
    return committed;
}

Result<void> Database::RollbackGuard::rollback(Error cause) {
    done_ = true;
    auto rb = db_.endTransaction("ROLLBACK");
    if (!rb) {
        return Error{ErrorCode::TransactionFailed,
                     cause.message + " (rollback failed: " + rb.error().message + ")"};
    }
    return cause;
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Result<bool> Database::tableExists(const std::string& table) {
    auto prepared = prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
    if (!prepared)
        return prepared.error();
    Statement stmt = std::move(prepared).value();
    if (auto bound = stmt.bind(1, table); !bound)
        return bound.error();
    return stmt.step();
}

Result<void> Database::enableWAL() {
    return execute("PRAGMA journal_mode = WAL");
}

std::string Database::version() {
    return sqlite3_libversion();
}

} // namespace murmur::metadata
