#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <sstream>
#include <thread>
#include <snipvault/store/database.h>

namespace snipvault::store {

namespace {

constexpr int kMaxRetries = 5;
constexpr auto kInitialBackoff = std::chrono::milliseconds(10);

std::string savepointName(int depth) {
    return "sv_" + std::to_string(depth);
}

} // namespace

// Statement implementation
Statement::Statement(sqlite3* db, const std::string& sql) {
    const char* tail;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, &tail);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    int rc = sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind null"};
    }
    return {};
}

Result<void> Statement::bind(int index, int value) {
    int rc = sqlite3_bind_int(stmt_, index, value);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind int"};
    }
    return {};
}

Result<void> Statement::bind(int index, bool value) {
    return bind(index, value ? 1 : 0);
}

Result<void> Statement::bind(int index, int64_t value) {
    int rc = sqlite3_bind_int64(stmt_, index, value);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind int64"};
    }
    return {};
}

Result<void> Statement::bind(int index, double value) {
    int rc = sqlite3_bind_double(stmt_, index, value);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind double"};
    }
    return {};
}

Result<void> Statement::bind(int index, const std::string& value) {
    int rc = sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind string"};
    }
    return {};
}

Result<void> Statement::bind(int index, std::string_view value) {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind string_view"};
    }
    return {};
}

Result<void> Statement::execute() {
    auto backoff = kInitialBackoff;

    for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_DONE) {
            return {};
        }
        if (((rc & 0xff) == SQLITE_BUSY || (rc & 0xff) == SQLITE_LOCKED) && attempt + 1 < kMaxRetries) {
            sqlite3_reset(stmt_);
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
            continue;
        }
        // Constraint failures carry a snippet of the statement for context
        std::string errMsg = "Failed to execute statement: " + std::string(sqlite3_errstr(rc));
        if ((rc & 0xff) == SQLITE_CONSTRAINT && stmt_) {
            const char* sql = sqlite3_sql(stmt_);
            if (sql) {
                std::string sqlSnippet(sql, std::min(strlen(sql), size_t{100}));
                errMsg += " [SQL: " + sqlSnippet + (strlen(sql) > 100 ? "..." : "") + "]";
            }
        }
        sqlite3_reset(stmt_);
        return Error{translateSqliteError(rc), errMsg};
    }
    return Error{ErrorCode::StorageFailure, "Failed to execute statement: max retries exceeded"};
}

Result<bool> Statement::step() {
    auto backoff = kInitialBackoff;

    for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        } else if (rc == SQLITE_DONE) {
            return false;
        }
        if (((rc & 0xff) == SQLITE_BUSY || (rc & 0xff) == SQLITE_LOCKED) && attempt + 1 < kMaxRetries) {
            sqlite3_reset(stmt_);
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
            continue;
        }
        sqlite3_reset(stmt_);
        return Error{translateSqliteError(rc),
                     "Failed to step statement: " + std::string(sqlite3_errstr(rc))};
    }
    return Error{ErrorCode::StorageFailure, "Failed to step statement: max retries exceeded"};
}

int Statement::getInt(int column) const {
    return sqlite3_column_int(stmt_, column);
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::getDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::getString(int column) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    if (!text)
        return "";
    int size = sqlite3_column_bytes(stmt_, column);
    return std::string(text, static_cast<size_t>(size));
}

std::optional<int64_t> Statement::getOptionalInt64(int column) const {
    if (isNull(column))
        return std::nullopt;
    return getInt64(column);
}

std::optional<std::string> Statement::getOptionalString(int column) const {
    if (isNull(column))
        return std::nullopt;
    return getString(column);
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Result<void> Statement::reset() {
    if (!stmt_) {
        return Error{ErrorCode::DatabaseError, "Statement is null"};
    }
    int rc = sqlite3_reset(stmt_);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to reset statement"};
    }
    return {};
}

Result<void> Statement::clearBindings() {
    if (!stmt_) {
        return Error{ErrorCode::DatabaseError, "Statement is null"};
    }
    int rc = sqlite3_clear_bindings(stmt_);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to clear bindings"};
    }
    return {};
}

// Database implementation
Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), depth_(other.depth_) {
    other.db_ = nullptr;
    other.depth_ = 0;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        path_ = std::move(other.path_);
        depth_ = other.depth_;
        other.db_ = nullptr;
        other.depth_ = 0;
    }
    return *this;
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    if (db_) {
        return Error{ErrorCode::InvalidState, "Database already open"};
    }

    int flags = 0;
    switch (mode) {
        case ConnectionMode::ReadOnly:
            flags = SQLITE_OPEN_READONLY;
            break;
        case ConnectionMode::ReadWrite:
            flags = SQLITE_OPEN_READWRITE;
            break;
        case ConnectionMode::Create:
            flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
            break;
        case ConnectionMode::Memory:
            flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY;
            break;
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "Unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return Error{ErrorCode::StorageFailure, "Failed to open database: " + error};
    }

    // Report constraint failures with their extended codes
    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, 5000);

    path_ = path;
    depth_ = 0;
    spdlog::debug("Opened database {} (sqlite {})", path_, version());
    return {};
}

void Database::close() {
    if (db_) {
        if (depth_ > 0) {
            spdlog::warn("Closing database {} with {} open transaction scope(s)", path_, depth_);
        }
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
    path_.clear();
    depth_ = 0;
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::NotInitialized, "Database not open"};
    }

    try {
        return Statement(db_, sql);
    } catch (const std::exception& e) {
        return Error{ErrorCode::DatabaseError, e.what()};
    }
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::NotInitialized, "Database not open"};
    }

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        spdlog::error("SQL exec failed ({}): {}", error, sql);
        return Error{translateSqliteError(rc), "Failed to execute SQL: " + error};
    }
    return {};
}

Result<void> Database::beginTransaction() {
    if (!db_) {
        return Error{ErrorCode::NotInitialized, "Database not open"};
    }

    auto result = depth_ == 0 ? execute("BEGIN IMMEDIATE")
                              : execute("SAVEPOINT " + savepointName(depth_));
    if (!result) {
        return Error{ErrorCode::StorageFailure,
                     "Failed to begin transaction: " + result.error().message};
    }
    ++depth_;
    return {};
}

Result<void> Database::commit() {
    if (depth_ == 0) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }

    if (depth_ > 1) {
        auto result = execute("RELEASE SAVEPOINT " + savepointName(depth_ - 1));
        if (!result) {
            rollback();
            return Error{ErrorCode::StorageFailure,
                         "Failed to release savepoint: " + result.error().message};
        }
        --depth_;
        return {};
    }

    auto result = execute("COMMIT");
    if (!result) {
        rollback();
        return Error{ErrorCode::StorageFailure, "Failed to commit: " + result.error().message};
    }
    depth_ = 0;
    return {};
}

Result<void> Database::rollback() {
    if (depth_ == 0) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }

    Result<void> result;
    if (depth_ > 1) {
        const auto name = savepointName(depth_ - 1);
        result = execute("ROLLBACK TO SAVEPOINT " + name);
        if (result) {
            result = execute("RELEASE SAVEPOINT " + name);
        }
    } else {
        // A failed COMMIT may already have ended the transaction
        if (db_ && sqlite3_get_autocommit(db_) == 0) {
            result = execute("ROLLBACK");
        }
    }
    --depth_; // Always unwind, even on error
    return result;
}

int64_t Database::lastInsertRowId() const {
    return db_ ? sqlite3_last_insert_rowid(db_) : 0;
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Result<bool> Database::tableExists(const std::string& table) {
    auto stmtResult = prepare("SELECT COUNT(*) FROM sqlite_master "
                              "WHERE type='table' AND name=?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, table);
    if (!bindResult)
        return bindResult.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();

    return stmt.getInt(0) > 0;
}

Result<void> Database::setBusyTimeout(std::chrono::milliseconds timeout) {
    if (!db_) {
        return Error{ErrorCode::NotInitialized, "Database not open"};
    }

    int rc = sqlite3_busy_timeout(db_, static_cast<int>(timeout.count()));
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to set busy timeout"};
    }
    return {};
}

Result<void> Database::enableWAL() {
    return execute("PRAGMA journal_mode=WAL");
}

Result<void> Database::enableForeignKeys() {
    return execute("PRAGMA foreign_keys=ON");
}

std::string Database::version() {
    return sqlite3_libversion();
}

ErrorCode translateSqliteError(int sqliteError) {
    switch (sqliteError & 0xff) {
        case SQLITE_CONSTRAINT:
            return ErrorCode::Conflict;
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
        case SQLITE_READONLY:
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return ErrorCode::StorageFailure;
        case SQLITE_NOTFOUND:
            return ErrorCode::NotFound;
        default:
            return ErrorCode::DatabaseError;
    }
}

// QueryBuilder implementation
QueryBuilder& QueryBuilder::select(const std::vector<std::string>& columns) {
    type_ = QueryType::Select;
    selectColumns_ = columns;
    return *this;
}

QueryBuilder& QueryBuilder::from(const std::string& table) {
    table_ = table;
    return *this;
}

QueryBuilder& QueryBuilder::where(const std::string& condition) {
    whereClauses_.clear();
    whereClauses_.push_back(condition);
    return *this;
}

QueryBuilder& QueryBuilder::andWhere(const std::string& condition) {
    if (whereClauses_.empty()) {
        whereClauses_.push_back(condition);
    } else {
        whereClauses_.push_back("AND " + condition);
    }
    return *this;
}

QueryBuilder& QueryBuilder::orderBy(const std::string& column, bool ascending) {
    orderByClauses_.clear();
    orderByClauses_.push_back(column + (ascending ? " ASC" : " DESC"));
    return *this;
}

QueryBuilder& QueryBuilder::thenBy(const std::string& column, bool ascending) {
    orderByClauses_.push_back(column + (ascending ? " ASC" : " DESC"));
    return *this;
}

QueryBuilder& QueryBuilder::limit(int limit) {
    limit_ = limit;
    return *this;
}

QueryBuilder& QueryBuilder::update(const std::string& table) {
    type_ = QueryType::Update;
    table_ = table;
    return *this;
}

QueryBuilder& QueryBuilder::set(const std::string& column, const std::string& placeholder) {
    setClauses_.push_back({column, placeholder});
    return *this;
}

QueryBuilder& QueryBuilder::deleteFrom(const std::string& table) {
    type_ = QueryType::Delete;
    table_ = table;
    return *this;
}

std::string QueryBuilder::build() const {
    std::stringstream sql;

    auto appendWhere = [&]() {
        if (!whereClauses_.empty()) {
            sql << " WHERE ";
            for (size_t i = 0; i < whereClauses_.size(); ++i) {
                if (i > 0)
                    sql << " ";
                sql << whereClauses_[i];
            }
        }
    };

    switch (type_) {
        case QueryType::Select: {
            sql << "SELECT ";
            if (selectColumns_.empty()) {
                sql << "*";
            } else {
                for (size_t i = 0; i < selectColumns_.size(); ++i) {
                    if (i > 0)
                        sql << ", ";
                    sql << selectColumns_[i];
                }
            }
            sql << " FROM " << table_;
            appendWhere();

            if (!orderByClauses_.empty()) {
                sql << " ORDER BY ";
                for (size_t i = 0; i < orderByClauses_.size(); ++i) {
                    if (i > 0)
                        sql << ", ";
                    sql << orderByClauses_[i];
                }
            }

            if (limit_ > 0) {
                sql << " LIMIT " << limit_;
            }
            break;
        }

        case QueryType::Update: {
            sql << "UPDATE " << table_ << " SET ";
            for (size_t i = 0; i < setClauses_.size(); ++i) {
                if (i > 0)
                    sql << ", ";
                sql << setClauses_[i].first << " = " << setClauses_[i].second;
            }
            appendWhere();
            break;
        }

        case QueryType::Delete: {
            sql << "DELETE FROM " << table_;
            appendWhere();
            break;
        }

        default:
            break;
    }

    return sql.str();
}

void QueryBuilder::reset() {
    type_ = QueryType::None;
    table_.clear();
    selectColumns_.clear();
    setClauses_.clear();
    whereClauses_.clear();
    orderByClauses_.clear();
    limit_ = -1;
}

} // namespace snipvault::store
