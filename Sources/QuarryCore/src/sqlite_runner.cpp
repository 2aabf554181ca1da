#include "quarry/sqlite_runner.hpp"
#include "quarry/log.hpp"
#include "quarry/meta_object.hpp"

namespace quarry {

// ============================================================================
// sqlite_cursor
// ============================================================================

sqlite_cursor::sqlite_cursor(prepared_statement stmt, row_mapper mapper, row_bounds bounds)
    : stmt_(std::make_unique<prepared_statement>(std::move(stmt))), mapper_(std::move(mapper)), bounds_(bounds) {}

bool sqlite_cursor::next(std::any& row) {
    if (closed_ || consumed_) {
        return false;
    }
    if (!offset_applied_) {
        offset_applied_ = true;
        for (int64_t skipped = 0; skipped < bounds_.offset; ++skipped) {
            if (!stmt_->step()) {
                finish();
                return false;
            }
        }
    }
    if (index_ + 1 >= bounds_.limit || !stmt_->step()) {
        finish();
        return false;
    }
    row_t raw = stmt_->row();
    row = mapper_ ? mapper_(raw) : std::any(std::move(raw));
    ++index_;
    return true;
}

void sqlite_cursor::finish() {
    consumed_ = true;
    stmt_.reset();
}

void sqlite_cursor::close() {
    closed_ = true;
    stmt_.reset();
}

// ============================================================================
// sqlite_statement_runner
// ============================================================================

sqlite_statement_runner::sqlite_statement_runner(sqlite_transaction& tx, metadata_registry& registry,
                                                 std::optional<int> default_timeout)
    : tx_(tx), registry_(registry), default_timeout_(default_timeout) {}

void sqlite_statement_runner::apply_timeout(const mapped_statement& statement, database& db) const {
    std::optional<int> timeout = statement.timeout ? statement.timeout : default_timeout_;
    std::optional<int> tx_timeout = tx_.timeout();
    if (tx_timeout && (!timeout || *tx_timeout < *timeout)) {
        timeout = tx_timeout;
    }
    int millis = timeout ? *timeout * 1000 : database::default_busy_timeout_ms;
    if (db.busy_timeout() != millis) {
        db.set_busy_timeout(millis);
    }
}

prepared_statement sqlite_statement_runner::prepare(const mapped_statement& statement, const bound_sql& sql,
                                                    std::any& parameter) {
    database& db = tx_.connection();
    apply_timeout(statement, db);
    LOG_DEBUG("runner", "==>  Preparing: %s", sql.sql().c_str());

    prepared_statement stmt = db.prepare(sql.sql());
    const type_registry& types = registry_.types();
    int index = 1;
    for (const auto& mapping : sql.parameter_mappings()) {
        if (mapping.mode == parameter_mode::out) {
            continue;
        }
        std::any value = resolve_parameter_value(sql, mapping.property, parameter, registry_);
        stmt.bind(index++, types.to_column_value(value));
    }
    return stmt;
}

std::any sqlite_statement_runner::map_row(const mapped_statement& statement, const row_t& row) const {
    if (statement.mapper) {
        return statement.mapper(row);
    }
    return std::any(row);
}

void sqlite_statement_runner::fill_output_parameters(const bound_sql& sql, std::any& parameter, const row_t& row) {
    if (registry_.types().is_null(parameter)) {
        return;
    }
    meta_object meta(parameter, registry_);
    for (const auto& mapping : sql.parameter_mappings()) {
        if (mapping.mode == parameter_mode::in) {
            continue;
        }
        auto column = row.find(mapping.property);
        if (column == row.end()) {
            continue;
        }
        const meta_type& target = meta.setter_type(mapping.property);
        meta.set_value(mapping.property, registry_.types().from_column_value(column->second, target));
    }
}

result_list sqlite_statement_runner::run_query(const mapped_statement& statement, std::any& parameter,
                                               const row_bounds& bounds, const result_handler& handler,
                                               const bound_sql& sql) {
    prepared_statement stmt = prepare(statement, sql, parameter);

    result_list rows;
    result_context context;
    std::optional<row_t> first_row;
    int64_t position = 0;
    int64_t returned = 0;

    while (returned < bounds.limit && stmt.step()) {
        row_t raw = stmt.row();
        if (!first_row) {
            first_row = raw;
        }
        if (position++ < bounds.offset) {
            continue;
        }
        std::any mapped = map_row(statement, raw);
        ++returned;
        if (handler) {
            context.next(std::move(mapped));
            handler(context);
            if (context.is_stopped()) {
                break;
            }
        } else {
            rows.push_back(std::move(mapped));
        }
    }

    if (statement.type == statement_type::callable && first_row) {
        fill_output_parameters(sql, parameter, *first_row);
    }
    LOG_DEBUG("runner", "<==      Total: %lld", static_cast<long long>(returned));
    return rows;
}

int64_t sqlite_statement_runner::run_update(const mapped_statement& statement, std::any& parameter) {
    bound_sql sql = statement.get_bound_sql(parameter);
    prepared_statement stmt = prepare(statement, sql, parameter);

    std::optional<row_t> first_row;
    while (stmt.step()) {
        if (!first_row) {
            first_row = stmt.row();
        }
    }
    int64_t changed = tx_.connection().changes();
    if (statement.type == statement_type::callable && first_row) {
        fill_output_parameters(sql, parameter, *first_row);
    }
    LOG_DEBUG("runner", "<==    Updates: %lld", static_cast<long long>(changed));
    return changed;
}

std::unique_ptr<cursor> sqlite_statement_runner::run_cursor(const mapped_statement& statement, std::any& parameter,
                                                            const row_bounds& bounds, const bound_sql& sql) {
    prepared_statement stmt = prepare(statement, sql, parameter);
    return std::make_unique<sqlite_cursor>(std::move(stmt), statement.mapper, bounds);
}

std::vector<batch_result> sqlite_statement_runner::flush_statements(bool) {
    return {};
}

} // namespace quarry
