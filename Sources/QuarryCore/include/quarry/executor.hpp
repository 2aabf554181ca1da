#pragma once

#ifdef __cplusplus

#include "cache_key.hpp"
#include "deferred_load.hpp"
#include "local_cache.hpp"
#include "metadata_registry.hpp"
#include "statement.hpp"
#include "statement_runner.hpp"
#include "transaction.hpp"
#include <any>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quarry {

enum class local_cache_scope {
    session,    // results live until commit, rollback, update or close
    statement   // results are dropped when the outermost query returns
};

// ============================================================================
// executor - query execution with a session-local result cache
//
// Nested queries issued while mapping results run on the same executor. A
// fingerprint that is already being fetched further up the stack is marked
// pending in the local cache; consumers check is_cached() and register a
// defer_load() instead of querying again. Deferred loads are resolved when
// the outermost query returns.
// ============================================================================

class executor {
public:
    executor(std::unique_ptr<transaction> tx, std::unique_ptr<statement_runner> runner,
             metadata_registry& registry, local_cache_scope scope = local_cache_scope::session,
             std::optional<std::string> environment_id = std::nullopt);

    /// Closes without forcing a rollback if still open.
    ~executor();

    executor(const executor&) = delete;
    executor& operator=(const executor&) = delete;

    result_list query(const mapped_statement& statement, std::any& parameter,
                      const row_bounds& bounds = {}, const result_handler& handler = {});

    result_list query(const mapped_statement& statement, std::any& parameter, const row_bounds& bounds,
                      const result_handler& handler, const cache_key& key, const bound_sql& sql);

    /// Streams rows without touching the local cache.
    std::unique_ptr<cursor> query_cursor(const mapped_statement& statement, std::any& parameter,
                                         const row_bounds& bounds = {});

    /// Clears the local cache, then runs the statement. Returns the changed-row count.
    int64_t update(const mapped_statement& statement, std::any& parameter);

    std::vector<batch_result> flush_statements(bool is_rollback = false);

    void commit(bool required);

    /// No-op once closed.
    void rollback(bool required);

    /// Rolls back and closes the transaction. Store failures are logged, not
    /// thrown; the executor is closed afterwards in every case.
    void close(bool force_rollback);

    bool is_closed() const { return closed_; }
    bool is_open() const { return !closed_; }

    cache_key create_cache_key(const mapped_statement& statement, std::any& parameter,
                               const row_bounds& bounds, const bound_sql& sql);

    /// True while the key is pending or materialized.
    bool is_cached(const mapped_statement& statement, const cache_key& key) const;

    /// Assigns the rows cached under `key` to `property` of `result_object`,
    /// now if they are materialized, otherwise when the outermost query returns.
    /// `result_object` must be a shared_ptr handle; throws executor_error otherwise.
    void defer_load(const mapped_statement& statement, std::any result_object, const std::string& property,
                    const cache_key& key, const meta_type& target_type);

    void clear_local_cache();

    transaction& get_transaction();

    local_cache_scope cache_scope() const { return scope_; }
    int query_depth() const { return query_depth_; }
    const local_cache& local_result_cache() const { return local_cache_; }
    size_t pending_deferred_loads() const { return deferred_loads_.size(); }

private:
    result_list query_from_database(const mapped_statement& statement, std::any& parameter,
                                    const row_bounds& bounds, const cache_key& key, const bound_sql& sql);
    void handle_cached_output_parameters(const mapped_statement& statement, const cache_key& key,
                                         std::any& parameter, const bound_sql& sql);
    void discard_after_failure();
    void ensure_open() const;
    void release();

    std::unique_ptr<transaction> transaction_;
    std::unique_ptr<statement_runner> runner_;
    metadata_registry& registry_;
    local_cache_scope scope_;
    std::optional<std::string> environment_id_;
    local_cache local_cache_;
    deferred_load_queue deferred_loads_;
    int query_depth_ = 0;
    bool closed_ = false;
};

} // namespace quarry

#endif // __cplusplus
