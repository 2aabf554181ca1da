#pragma once

#ifdef __cplusplus

#include "errors.hpp"
#include "types.hpp"
#include <sqlite3.h>
#include <string>
#include <vector>

namespace quarry {

class database;

/// RAII wrapper over one sqlite3_stmt. Finalized on destruction.
class prepared_statement {
public:
    prepared_statement(database& db, const std::string& sql);
    ~prepared_statement();

    prepared_statement(const prepared_statement&) = delete;
    prepared_statement& operator=(const prepared_statement&) = delete;

    prepared_statement(prepared_statement&& other) noexcept;
    prepared_statement& operator=(prepared_statement&& other) noexcept;

    void bind(int index, const column_value_t& value);
    void bind_all(const std::vector<column_value_t>& values);

    /// True when a row is available, false when done. Throws db_error otherwise.
    bool step();

    /// Current row keyed by column name.
    row_t row() const;

    int column_count() const;
    int parameter_count() const;
    void reset();

    const std::string& sql() const { return sql_; }
    sqlite3_stmt* handle() const { return stmt_; }

private:
    database* db_;
    sqlite3_stmt* stmt_ = nullptr;
    std::string sql_;
};

class database {
public:
    /// Open mode for database connections
    enum class open_mode {
        read_write,          ///< Full read/write access (default)
        read_only,           ///< Read-only access (for concurrent readers)
        read_only_immutable  ///< Read-only, no WAL/journal checks (bundled files)
    };

    static constexpr int default_busy_timeout_ms = 5000;

    explicit database(const std::string& path, open_mode mode = open_mode::read_write);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    // Moveable
    database(database&& other) noexcept;
    database& operator=(database&& other) noexcept;

    // Query - returns rows as vector of column maps
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    // Execute SQL with optional params (for INSERT/UPDATE/DELETE without return)
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    prepared_statement prepare(const std::string& sql) { return prepared_statement(*this, sql); }

    // Transaction support
    void begin_transaction(bool exclusive = false);
    void commit();
    void rollback();
    bool is_in_transaction() const;

    /// Rows changed by the most recent INSERT, UPDATE or DELETE.
    int64_t changes() const;

    void set_busy_timeout(int milliseconds);
    int busy_timeout() const { return busy_timeout_ms_; }

    const std::string& path() const { return path_; }

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }

    static void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    static column_value_t extract_column(sqlite3_stmt* stmt, int index);

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    open_mode mode_;
    int busy_timeout_ms_ = default_busy_timeout_ms;
};

} // namespace quarry

#endif // __cplusplus
