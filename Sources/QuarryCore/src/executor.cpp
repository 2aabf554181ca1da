#include "quarry/executor.hpp"
#include "quarry/log.hpp"
#include "quarry/meta_object.hpp"

#include <exception>

namespace quarry {

namespace {
    struct depth_guard {
        int& depth;
        explicit depth_guard(int& d) : depth(d) { ++depth; }
        ~depth_guard() { --depth; }
    };
}

executor::executor(std::unique_ptr<transaction> tx, std::unique_ptr<statement_runner> runner,
                   metadata_registry& registry, local_cache_scope scope,
                   std::optional<std::string> environment_id)
    : transaction_(std::move(tx)), runner_(std::move(runner)), registry_(registry), scope_(scope),
      environment_id_(std::move(environment_id)), local_cache_("LocalCache") {
    if (!transaction_ || !runner_) {
        throw std::invalid_argument("executor requires a transaction and a statement runner");
    }
}

executor::~executor() {
    if (closed_) {
        return;
    }
    try {
        close(false);
    } catch (const std::exception& e) {
        LOG_ERROR("executor", "Failed to close executor: %s", e.what());
    }
}

void executor::ensure_open() const {
    if (closed_) {
        throw executor_closed_error();
    }
}

// ============================================================================
// Queries
// ============================================================================

result_list executor::query(const mapped_statement& statement, std::any& parameter,
                            const row_bounds& bounds, const result_handler& handler) {
    bound_sql sql = statement.get_bound_sql(parameter);
    cache_key key = create_cache_key(statement, parameter, bounds, sql);
    return query(statement, parameter, bounds, handler, key, sql);
}

result_list executor::query(const mapped_statement& statement, std::any& parameter, const row_bounds& bounds,
                            const result_handler& handler, const cache_key& key, const bound_sql& sql) {
    ensure_open();
    if (query_depth_ == 0 && statement.flush_cache_required) {
        clear_local_cache();
    }

    result_list rows;
    try {
        depth_guard depth(query_depth_);
        if (handler) {
            rows = runner_->run_query(statement, parameter, bounds, handler, sql);
        } else {
            cached_result cached = local_cache_.get(key);
            if (cached.is_materialized()) {
                LOG_DEBUG("executor", "Cache hit for %s", statement.id.c_str());
                handle_cached_output_parameters(statement, key, parameter, sql);
                rows = cached.rows();
            } else if (cached.is_pending()) {
                LOG_DEBUG("executor", "Query %s is already in flight at depth %d, returning no rows",
                          statement.id.c_str(), query_depth_);
            } else {
                LOG_DEBUG("executor", "Cache miss for %s", statement.id.c_str());
                rows = query_from_database(statement, parameter, bounds, key, sql);
            }
        }
    } catch (...) {
        if (query_depth_ == 0) {
            discard_after_failure();
        }
        throw;
    }

    if (query_depth_ == 0) {
        deferred_loads_.drain_all();
        if (scope_ == local_cache_scope::statement) {
            clear_local_cache();
        }
    }
    return rows;
}

result_list executor::query_from_database(const mapped_statement& statement, std::any& parameter,
                                          const row_bounds& bounds, const cache_key& key, const bound_sql& sql) {
    local_cache_.put(key, cached_result::placeholder());
    result_list rows;
    try {
        rows = runner_->run_query(statement, parameter, bounds, result_handler{}, sql);
    } catch (...) {
        local_cache_.remove(key);
        throw;
    }
    local_cache_.put(key, cached_result::of(rows));
    if (statement.type == statement_type::callable) {
        local_cache_.put_output_parameters(key, parameter);
    }
    return rows;
}

void executor::handle_cached_output_parameters(const mapped_statement& statement, const cache_key& key,
                                               std::any& parameter, const bound_sql& sql) {
    if (statement.type != statement_type::callable) {
        return;
    }
    const std::any* captured = local_cache_.output_parameters(key);
    if (captured == nullptr || !captured->has_value() || !parameter.has_value()) {
        return;
    }
    std::any cached_parameter = *captured;
    meta_object cached_meta(cached_parameter, registry_);
    meta_object meta(parameter, registry_);
    for (const auto& mapping : sql.parameter_mappings()) {
        if (mapping.mode != parameter_mode::in) {
            meta.set_value(mapping.property, cached_meta.get_value(mapping.property));
        }
    }
}

std::unique_ptr<cursor> executor::query_cursor(const mapped_statement& statement, std::any& parameter,
                                               const row_bounds& bounds) {
    ensure_open();
    bound_sql sql = statement.get_bound_sql(parameter);
    return runner_->run_cursor(statement, parameter, bounds, sql);
}

int64_t executor::update(const mapped_statement& statement, std::any& parameter) {
    ensure_open();
    clear_local_cache();
    return runner_->run_update(statement, parameter);
}

// ============================================================================
// Cache keys and deferred loads
// ============================================================================

cache_key executor::create_cache_key(const mapped_statement& statement, std::any& parameter,
                                     const row_bounds& bounds, const bound_sql& sql) {
    ensure_open();
    const type_registry& types = registry_.types();

    cache_key key;
    key.update(statement.id);
    key.update(bounds.offset);
    key.update(bounds.limit);
    key.update(sql.sql());
    for (const auto& mapping : sql.parameter_mappings()) {
        if (mapping.mode == parameter_mode::out) {
            continue;
        }
        std::any value = resolve_parameter_value(sql, mapping.property, parameter, registry_);
        key.update(types.to_column_value(value));
    }
    if (environment_id_) {
        key.update(*environment_id_);
    }
    return key;
}

bool executor::is_cached(const mapped_statement&, const cache_key& key) const {
    ensure_open();
    return !local_cache_.get(key).is_absent();
}

// Loads queued under a failed outermost query point at keys that were never
// materialized; none of them can complete.
void executor::discard_after_failure() {
    if (!deferred_loads_.empty()) {
        LOG_WARN("executor", "Discarding %zu deferred loads after a failed query", deferred_loads_.size());
        deferred_loads_.clear();
    }
    if (scope_ == local_cache_scope::statement) {
        clear_local_cache();
    }
}

void executor::defer_load(const mapped_statement&, std::any result_object, const std::string& property,
                          const cache_key& key, const meta_type& target_type) {
    ensure_open();
    const meta_type* handle = registry_.types().type_of(result_object);
    if (handle == nullptr || handle->pointee() == nullptr) {
        throw executor_error("Cannot defer load of property '" + property + "' into " +
                             (handle ? handle->name() : std::string(result_object.type().name())) +
                             ": the target must be a shared_ptr handle");
    }
    deferred_load load(std::move(result_object), property, key, local_cache_, registry_, target_type);
    if (load.can_load()) {
        load.load();
    } else {
        LOG_DEBUG("executor", "Deferring load of '%s' until depth 0", property.c_str());
        deferred_loads_.enqueue(std::move(load));
    }
}

void executor::clear_local_cache() {
    if (!closed_) {
        local_cache_.clear();
    }
}

// ============================================================================
// Transaction control
// ============================================================================

std::vector<batch_result> executor::flush_statements(bool is_rollback) {
    ensure_open();
    return runner_->flush_statements(is_rollback);
}

void executor::commit(bool required) {
    if (closed_) {
        throw executor_closed_error("Cannot commit, transaction is already closed");
    }
    clear_local_cache();
    flush_statements();
    if (required) {
        transaction_->commit();
    }
}

void executor::rollback(bool required) {
    if (closed_) {
        return;
    }
    std::exception_ptr flush_failure;
    try {
        clear_local_cache();
        flush_statements(true);
    } catch (...) {
        flush_failure = std::current_exception();
    }
    if (required) {
        transaction_->rollback();
    }
    if (flush_failure) {
        std::rethrow_exception(flush_failure);
    }
}

void executor::close(bool force_rollback) {
    if (closed_) {
        return;
    }
    struct release_on_exit {
        executor& self;
        ~release_on_exit() { self.release(); }
    } release_guard{*this};

    std::exception_ptr rollback_failure;
    try {
        rollback(force_rollback);
    } catch (const db_error& e) {
        LOG_WARN("executor", "Unexpected exception on closing transaction.  Cause: %s", e.what());
    } catch (...) {
        rollback_failure = std::current_exception();
    }

    try {
        transaction_->close();
    } catch (const db_error& e) {
        LOG_WARN("executor", "Unexpected exception on closing transaction.  Cause: %s", e.what());
    }

    if (rollback_failure) {
        std::rethrow_exception(rollback_failure);
    }
}

void executor::release() {
    runner_.reset();
    transaction_.reset();
    deferred_loads_.clear();
    local_cache_.clear();
    closed_ = true;
}

transaction& executor::get_transaction() {
    ensure_open();
    return *transaction_;
}

} // namespace quarry
