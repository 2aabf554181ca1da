#pragma once

#ifdef __cplusplus

#include "executor.hpp"
#include "log.hpp"
#include "statement.hpp"
#include "transaction.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace quarry {

/// Where sessions get their connections: an id (part of every cache key), a
/// transaction factory and the database file.
class environment {
public:
    environment(std::string id, std::shared_ptr<transaction_factory> factory, std::string database_path);

    const std::string& id() const { return id_; }
    transaction_factory& get_transaction_factory() const { return *factory_; }
    const std::string& database_path() const { return database_path_; }

private:
    std::string id_;
    std::shared_ptr<transaction_factory> factory_;
    std::string database_path_;
};

// ============================================================================
// Configuration (settings, environment and mapped statements)
// ============================================================================

struct configuration {
    /// Lifetime of locally cached results. SESSION keeps them until the next
    /// update, commit, rollback or close; STATEMENT drops them after each call.
    local_cache_scope cache_scope = local_cache_scope::session;

    /// Required to open sessions.
    std::optional<environment> env;

    /// Seconds; applied when a statement does not set its own timeout.
    std::optional<int> default_statement_timeout;

    /// Memoize property metadata per type (see metadata_registry).
    bool reflection_cache_enabled = true;

    /// Applied process-wide when a session factory is created. Unset leaves the current level.
    std::optional<log_level> logging_level;

    configuration() = default;

    explicit configuration(environment e) : env(std::move(e)) {}

    configuration(environment e, local_cache_scope scope)
        : cache_scope(scope), env(std::move(e)) {}

    /// Applies `{ "settings": {...}, "environment": {"id": ..., "database": ...} }`.
    /// Throws config_error for malformed JSON, unknown settings and invalid values.
    void load_settings(const std::string& json_text);

    static configuration from_json(const std::string& json_text);
    static configuration from_file(const std::string& path);

    /// Throws config_error when the id is already registered.
    void add_mapped_statement(mapped_statement statement);

    /// Throws config_error for unknown ids.
    const mapped_statement& get_mapped_statement(const std::string& id) const;

    bool has_statement(const std::string& id) const { return mapped_statements_.count(id) > 0; }

    std::vector<std::string> statement_ids() const;

private:
    std::unordered_map<std::string, mapped_statement> mapped_statements_;
};

} // namespace quarry

#endif // __cplusplus
