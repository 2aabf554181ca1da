#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include "metadata_registry.hpp"
#include "sqlite_transaction.hpp"
#include "statement.hpp"
#include "statement_runner.hpp"
#include <memory>
#include <optional>

namespace quarry {

/// Lazy stream over a prepared statement. Must not outlive the connection it
/// was opened on.
class sqlite_cursor : public cursor {
public:
    sqlite_cursor(prepared_statement stmt, row_mapper mapper, row_bounds bounds);

    bool is_open() const override { return !closed_ && !consumed_; }
    bool is_consumed() const override { return consumed_; }
    int64_t current_index() const override { return index_; }
    bool next(std::any& row) override;
    void close() override;

private:
    void finish();

    std::unique_ptr<prepared_statement> stmt_;
    row_mapper mapper_;
    row_bounds bounds_;
    int64_t index_ = -1;
    bool offset_applied_ = false;
    bool consumed_ = false;
    bool closed_ = false;
};

/// Runs statements on the connection of a sqlite_transaction.
///
/// IN and INOUT mappings bind to the `?` placeholders in order; OUT mappings
/// take no placeholder. SQLite has no stored procedures, so callable statements
/// fill their OUT/INOUT properties from the same-named columns of the first
/// result row.
class sqlite_statement_runner : public statement_runner {
public:
    sqlite_statement_runner(sqlite_transaction& tx, metadata_registry& registry,
                            std::optional<int> default_timeout = std::nullopt);

    result_list run_query(const mapped_statement& statement, std::any& parameter,
                          const row_bounds& bounds, const result_handler& handler,
                          const bound_sql& sql) override;

    int64_t run_update(const mapped_statement& statement, std::any& parameter) override;

    std::unique_ptr<cursor> run_cursor(const mapped_statement& statement, std::any& parameter,
                                       const row_bounds& bounds, const bound_sql& sql) override;

    /// Statements are never buffered.
    std::vector<batch_result> flush_statements(bool is_rollback) override;

private:
    prepared_statement prepare(const mapped_statement& statement, const bound_sql& sql, std::any& parameter);
    void apply_timeout(const mapped_statement& statement, database& db) const;
    std::any map_row(const mapped_statement& statement, const row_t& row) const;
    void fill_output_parameters(const bound_sql& sql, std::any& parameter, const row_t& row);

    sqlite_transaction& tx_;
    metadata_registry& registry_;
    std::optional<int> default_timeout_;
};

} // namespace quarry

#endif // __cplusplus
