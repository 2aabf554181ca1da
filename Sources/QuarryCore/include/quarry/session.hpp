#pragma once

#ifdef __cplusplus

#include "configuration.hpp"
#include "executor.hpp"
#include "metadata_registry.hpp"
#include <any>
#include <memory>
#include <string>
#include <vector>

namespace quarry {

/// Unit of work over one executor. Statements are looked up by id in the
/// configuration. Parameter objects that receive OUT values must be held by
/// std::shared_ptr so the caller sees the writes. The session shares the
/// configuration with its factory and may outlive it; the metadata_registry
/// given to the factory must outlive both.
class session {
public:
    session(std::shared_ptr<const configuration> config, std::unique_ptr<executor> exec, bool auto_commit);

    /// Closes the session if still open.
    ~session();

    session(const session&) = delete;
    session& operator=(const session&) = delete;

    /// Null when there are no rows. Throws quarry_error for more than one.
    std::any select_one(const std::string& statement, std::any parameter = {});

    result_list select_list(const std::string& statement, std::any parameter = {},
                            const row_bounds& bounds = {});

    /// Streams rows to `handler`.
    void select(const std::string& statement, std::any parameter, const row_bounds& bounds,
                const result_handler& handler);

    std::unique_ptr<cursor> select_cursor(const std::string& statement, std::any parameter = {},
                                          const row_bounds& bounds = {});

    int64_t insert(const std::string& statement, std::any parameter = {});
    int64_t update(const std::string& statement, std::any parameter = {});
    int64_t remove(const std::string& statement, std::any parameter = {});

    /// Commits when there are uncommitted writes outside auto-commit mode, or when forced.
    void commit(bool force = false);
    void rollback(bool force = false);

    std::vector<batch_result> flush_statements();
    void clear_cache();

    /// Rolls back uncommitted writes and releases the connection.
    void close();

    bool is_dirty() const { return dirty_; }
    bool is_auto_commit() const { return auto_commit_; }

    executor& get_executor() { return *executor_; }
    const configuration& get_configuration() const { return *config_; }

private:
    bool is_commit_or_rollback_required(bool force) const {
        return (!auto_commit_ && dirty_) || force;
    }

    std::shared_ptr<const configuration> config_;
    std::unique_ptr<executor> executor_;
    bool auto_commit_;
    bool dirty_ = false;
};

/// Opens sessions against the configured environment.
class session_factory {
public:
    /// Applies the configuration's log level and reflection cache switch.
    session_factory(configuration config, metadata_registry& registry);

    /// Throws quarry_error ("Error opening session. Cause: ...") when the
    /// transaction or executor cannot be created.
    std::unique_ptr<session> open_session(bool auto_commit = false);

    const configuration& get_configuration() const { return *config_; }

private:
    std::shared_ptr<const configuration> config_;
    metadata_registry& registry_;
};

} // namespace quarry

#endif // __cplusplus
