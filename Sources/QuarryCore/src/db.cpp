#include "quarry/db.hpp"
#include "quarry/log.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace quarry {

// ============================================================================
// prepared_statement
// ============================================================================

prepared_statement::prepared_statement(database& db, const std::string& sql) : db_(&db), sql_(sql) {
    int rc = sqlite3_prepare_v2(db.handle(), sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db.handle());
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        LOG_ERROR("db", "Failed to prepare statement: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error("Failed to prepare statement: " + error + " (SQL: " + sql + ")");
    }
}

prepared_statement::~prepared_statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

prepared_statement::prepared_statement(prepared_statement&& other) noexcept
    : db_(other.db_), stmt_(other.stmt_), sql_(std::move(other.sql_)) {
    other.stmt_ = nullptr;
}

prepared_statement& prepared_statement::operator=(prepared_statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        db_ = other.db_;
        stmt_ = other.stmt_;
        sql_ = std::move(other.sql_);
        other.stmt_ = nullptr;
    }
    return *this;
}

void prepared_statement::bind(int index, const column_value_t& value) {
    database::bind_value(stmt_, index, value);
}

void prepared_statement::bind_all(const std::vector<column_value_t>& values) {
    int index = 1;
    for (const auto& value : values) {
        bind(index++, value);
    }
}

bool prepared_statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    std::string error = sqlite3_errmsg(db_->handle());
    LOG_ERROR("db", "Execution failed: %s (SQL: %s)", error.c_str(), sql_.c_str());
    throw db_error("Execution failed: " + error + " (SQL: " + sql_ + ")");
}

row_t prepared_statement::row() const {
    row_t row;
    int count = sqlite3_column_count(stmt_);
    for (int i = 0; i < count; ++i) {
        row[sqlite3_column_name(stmt_, i)] = database::extract_column(stmt_, i);
    }
    return row;
}

int prepared_statement::column_count() const {
    return sqlite3_column_count(stmt_);
}

int prepared_statement::parameter_count() const {
    return sqlite3_bind_parameter_count(stmt_);
}

void prepared_statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

// ============================================================================
// database
// ============================================================================

database::database(const std::string& path, open_mode mode) : path_(path), mode_(mode) {
    int flags = SQLITE_OPEN_FULLMUTEX;  // Always use serialized threading mode
    int rc;

    if (mode == open_mode::read_only_immutable) {
        // immutable=1 skips WAL/journal checks for files that are never written
        flags |= SQLITE_OPEN_READONLY | SQLITE_OPEN_URI;
        std::string uri = "file:" + path + "?immutable=1";
        rc = sqlite3_open_v2(uri.c_str(), &db_, flags, nullptr);
    } else if (mode == open_mode::read_only) {
        flags |= SQLITE_OPEN_READONLY;
        rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
        rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    }
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database: %s", error.c_str());
        throw db_error("Failed to open database: " + error);
    }

    execute("PRAGMA foreign_keys = ON");

    // WAL only matters for file-backed read-write connections
    if (mode == open_mode::read_write && path != ":memory:") {
        execute("PRAGMA journal_mode = WAL");
    }
    execute("PRAGMA cache_size = 50000");
    execute("PRAGMA temp_store = MEMORY");

    // Must be set before any query that might contend with other connections.
    set_busy_timeout(default_busy_timeout_ms);

    LOG_DEBUG("db", "Opened %s", path_.c_str());
}

database::~database() {
    if (db_) {
        if (mode_ == open_mode::read_write && path_ != ":memory:") {
            sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
        }
        sqlite3_close(db_);
    }
}

database::database(database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), mode_(other.mode_),
      busy_timeout_ms_(other.busy_timeout_ms_) {
    other.db_ = nullptr;
}

database& database::operator=(database&& other) noexcept {
    if (this != &other) {
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = other.db_;
        path_ = std::move(other.path_);
        mode_ = other.mode_;
        busy_timeout_ms_ = other.busy_timeout_ms_;
        other.db_ = nullptr;
    }
    return *this;
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (params.empty()) {
        // Fast path for parameterless statements
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            LOG_ERROR("db", "SQL execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw db_error("SQL execution failed: " + error + " (SQL: " + sql + ")");
        }
        return;
    }

    prepared_statement stmt(*this, sql);
    stmt.bind_all(params);
    while (stmt.step()) {
    }
}

std::vector<row_t> database::query(const std::string& sql, const std::vector<column_value_t>& params) {
    prepared_statement stmt(*this, sql);
    stmt.bind_all(params);

    std::vector<row_t> results;
    while (stmt.step()) {
        results.push_back(stmt.row());
    }
    return results;
}

void database::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), -1, SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, blob_t>) {
            if (v.empty()) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }
    }, value);
}

column_value_t database::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            return std::string(text ? text : "");
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return blob_t(bytes, bytes + size);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

void database::begin_transaction(bool exclusive) {
    // IMMEDIATE takes the write lock up front; EXCLUSIVE also blocks readers.
    const char* sql = exclusive ? "BEGIN EXCLUSIVE" : "BEGIN IMMEDIATE";
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);

    // Retry with exponential backoff while another connection holds the write lock.
    int backoff_ms = 1;
    const int max_backoff_ms = 1000;
    const int max_total_wait_ms = 30000;
    int total_waited_ms = 0;

    while ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && total_waited_ms < max_total_wait_ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        total_waited_ms += backoff_ms;
        backoff_ms = std::min(backoff_ms * 2, max_backoff_ms);
        rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
    }

    if (rc != SQLITE_OK) {
        auto error = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Failed to begin transaction: %s", error.c_str());
        throw db_error("Failed to begin transaction: " + error);
    }
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 if a transaction is active, non-zero otherwise
    return sqlite3_get_autocommit(db_) == 0;
}

int64_t database::changes() const {
    return sqlite3_changes(db_);
}

void database::set_busy_timeout(int milliseconds) {
    sqlite3_busy_timeout(db_, milliseconds);
    busy_timeout_ms_ = milliseconds;
}

} // namespace quarry
