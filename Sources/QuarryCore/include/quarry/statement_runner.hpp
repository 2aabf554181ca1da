#pragma once

#ifdef __cplusplus

#include "statement.hpp"
#include <any>
#include <memory>
#include <vector>

namespace quarry {

/// Executes statements against the store. Owned by one executor; runs inside
/// that executor's transaction.
class statement_runner {
public:
    virtual ~statement_runner() = default;

    /// Rows in store order. With a non-empty `handler` rows are streamed to it
    /// and the returned list is empty.
    virtual result_list run_query(const mapped_statement& statement, std::any& parameter,
                                  const row_bounds& bounds, const result_handler& handler,
                                  const bound_sql& sql) = 0;

    /// Number of rows changed.
    virtual int64_t run_update(const mapped_statement& statement, std::any& parameter) = 0;

    virtual std::unique_ptr<cursor> run_cursor(const mapped_statement& statement, std::any& parameter,
                                               const row_bounds& bounds, const bound_sql& sql) = 0;

    /// Sends buffered statements, if any.
    virtual std::vector<batch_result> flush_statements(bool is_rollback) = 0;
};

} // namespace quarry

#endif // __cplusplus
