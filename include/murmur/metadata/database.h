#pragma once

#include <murmur/core/types.h>

#include <sqlite3.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace murmur::metadata {

enum class ConnectionMode {
    Create,   // read-write, file created when missing
    ReadOnly, // existing file, no writes
    Memory    // private in-memory database
};

class Database;

/**
 * Prepared statement, finalized on destruction. Obtained from
 * Database::prepare(); parameter indexes are 1-based, columns 0-based.
 */
class Statement {
public:
    Statement() = default;
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }
    Result<void> bind(int index, std::span<const std::byte> blob);
    Result<void> bind(int index, const std::vector<std::byte>& blob) {
        return bind(index, std::span<const std::byte>(blob));
    }

    /// An empty optional binds NULL.
    template <typename T> Result<void> bind(int index, const std::optional<T>& value) {
        if (!value) {
            return bind(index, nullptr);
        }
        return bind(index, *value);
    }

    /// Bind every argument in order starting at parameter 1.
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        int index = 0;
        Result<void> result;
        // Stops at the first failed bind.
        ((result = bind(++index, std::forward<Args>(args)), static_cast<bool>(result)) && ...);
        return result;
    }

    /// Run to completion; for statements that return no rows.
    Result<void> execute();

    /// Advance one row; false once the result set is exhausted.
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    std::string getString(int column) const;
    std::vector<std::byte> getBlob(int column) const;
    bool isNull(int column) const;

    /// Rewind and clear bindings so the statement can be reused.
    Result<void> reset();

private:
    friend class Database;
    Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}

    // sqlite3_step with bounded backoff on SQLITE_BUSY / SQLITE_LOCKED.
    int stepWithRetry();
    Result<void> checkBind(int rc, int index) const;
    std::string describe(int rc) const;

    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * One SQLite connection with foreign keys enforced.
 *
 * Not safe for concurrent transactions; owners of a Database serialize access
 * (MessageRepository holds a mutex around every operation).
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::Create);
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }
    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] bool inTransaction() const { return inTransaction_; }

    Result<Statement> prepare(const std::string& sql);

    /// prepare() followed by Statement::bindAll(args...).
    template <typename... Args>
    Result<Statement> prepareBound(const std::string& sql, Args&&... args) {
        auto prepared = prepare(sql);
        if (!prepared)
            return prepared;
        Statement stmt = std::move(prepared).value();
        auto bound = stmt.bindAll(std::forward<Args>(args)...);
        if (!bound)
            return bound.error();
        return Result<Statement>(std::move(stmt));
    }

    /// Run one or more statements that return no rows.
    Result<void> execute(const std::string& sql);

    /**
     * Run `func` inside BEGIN IMMEDIATE ... COMMIT.
     *
     * An error result from `func` rolls back and is returned as is. An
     * exception rolls back and propagates.
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        auto began = beginTransaction();
        if (!began)
            return began;

        RollbackGuard guard(*this);
        Result<void> result = func();
        if (!result) {
            return guard.rollback(std::move(result).error());
        }
        return guard.commit();
    }

    /// Rows changed by the most recent INSERT, UPDATE or DELETE.
    int changes() const;

    Result<bool> tableExists(const std::string& table);

    Result<void> enableWAL();

    static std::string version();

private:
    // Rolls back on scope exit unless commit() or rollback() ran first.
    class RollbackGuard {
    public:
        explicit RollbackGuard(Database& db) : db_(db) {}
        ~RollbackGuard();
        RollbackGuard(const RollbackGuard&) = delete;
        RollbackGuard& operator=(const RollbackGuard&) = delete;

        Result<void> commit();
        Result<void> rollback(Error cause);

    private:
        Database& db_;
        bool done_ = false;
    };

    Result<void> beginTransaction();
    Result<void> endTransaction(const char* sql);

    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
};

} // namespace murmur::metadata
