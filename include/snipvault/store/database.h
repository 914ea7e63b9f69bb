#pragma once

#include <snipvault/core/types.h>
#include <sqlite3.h>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace snipvault::store {

/**
 * @brief Database connection mode
 */
enum class ConnectionMode {
    ReadWrite, ///< Read-write mode (default)
    ReadOnly,  ///< Read-only mode
    Memory,    ///< In-memory database
    Create     ///< Create if not exists
};

/**
 * @brief SQLite statement wrapper with RAII
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    // Move-only
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Bind parameters to statement (1-based index)
     */
    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, bool value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    /**
     * @brief Bind an optional value, NULL when empty
     */
    template <typename T> Result<void> bind(int index, const std::optional<T>& value) {
        if (!value) {
            return bind(index, nullptr);
        }
        return bind(index, *value);
    }

    /**
     * @brief Bind multiple parameters using variadic templates
     */
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        return bindHelper(1, std::forward<Args>(args)...);
    }

    /**
     * @brief Execute statement (for non-SELECT queries)
     */
    Result<void> execute();

    /**
     * @brief Step through results (for SELECT queries)
     * @return true if row available, false if done
     */
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;
    std::optional<int64_t> getOptionalInt64(int column) const;
    std::optional<std::string> getOptionalString(int column) const;
    bool isNull(int column) const;

    Result<void> reset();
    Result<void> clearBindings();

private:
    sqlite3_stmt* stmt_ = nullptr;

    template <typename T, typename... Rest>
    Result<void> bindHelper(int index, T&& value, Rest&&... rest) {
        auto result = bind(index, std::forward<T>(value));
        if (!result)
            return result;
        if constexpr (sizeof...(rest) > 0) {
            return bindHelper(index + 1, std::forward<Rest>(rest)...);
        }
        return {};
    }

    Result<void> bindHelper(int) { return {}; }
};

/**
 * @brief Database connection wrapper
 *
 * Transactions nest: the outermost call issues BEGIN IMMEDIATE, inner calls
 * open savepoints. A failed inner scope rolls back to its savepoint and the
 * error propagates, so the outer scope rolls back as well.
 */
class Database {
public:
    Database() = default;
    ~Database();

    // Move-only
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Open database connection
     */
    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadWrite);

    /**
     * @brief Close database connection
     */
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    /**
     * @brief Prepare SQL statement
     */
    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Execute SQL directly (for non-SELECT queries)
     */
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();

    [[nodiscard]] bool inTransaction() const { return depth_ > 0; }
    [[nodiscard]] int transactionDepth() const { return depth_; }

    /**
     * @brief Execute within transaction; func returns a Result<T>
     */
    template <typename Func> auto transaction(Func&& func) -> std::invoke_result_t<Func> {
        auto beginResult = beginTransaction();
        if (!beginResult)
            return beginResult.error();

        try {
            auto result = func();
            if (!result) {
                rollback();
                return result;
            }
            auto commitResult = commit();
            if (!commitResult)
                return commitResult.error();
            return result;
        } catch (...) {
            rollback();
            throw;
        }
    }

    int64_t lastInsertRowId() const;

    /**
     * @brief Number of rows affected by last statement
     */
    int changes() const;

    Result<bool> tableExists(const std::string& table);

    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);
    Result<void> enableWAL();
    Result<void> enableForeignKeys();

    static std::string version();

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    int depth_ = 0;
};

/**
 * @brief Map an SQLite result code onto the store's error taxonomy
 */
ErrorCode translateSqliteError(int sqliteError);

/**
 * @brief Query builder for constructing SQL queries
 */
class QueryBuilder {
public:
    QueryBuilder() = default;

    // SELECT
    QueryBuilder& select(const std::vector<std::string>& columns = {});
    QueryBuilder& from(const std::string& table);
    QueryBuilder& where(const std::string& condition);
    QueryBuilder& andWhere(const std::string& condition);
    QueryBuilder& orderBy(const std::string& column, bool ascending = true);
    QueryBuilder& thenBy(const std::string& column, bool ascending = true);
    QueryBuilder& limit(int limit);

    // UPDATE
    QueryBuilder& update(const std::string& table);
    QueryBuilder& set(const std::string& column, const std::string& placeholder = "?");

    // DELETE
    QueryBuilder& deleteFrom(const std::string& table);

    [[nodiscard]] std::string build() const;
    [[nodiscard]] bool hasSetClauses() const { return !setClauses_.empty(); }

    void reset();

private:
    enum class QueryType { None, Select, Update, Delete };

    QueryType type_ = QueryType::None;
    std::string table_;
    std::vector<std::string> selectColumns_;
    std::vector<std::pair<std::string, std::string>> setClauses_;
    std::vector<std::string> whereClauses_;
    std::vector<std::string> orderByClauses_;
    int limit_ = -1;
};

} // namespace snipvault::store
