#include "quarry/session.hpp"
#include "quarry/log.hpp"
#include "quarry/sqlite_runner.hpp"
#include "quarry/sqlite_transaction.hpp"

namespace quarry {

// ============================================================================
// session
// ============================================================================

session::session(std::shared_ptr<const configuration> config, std::unique_ptr<executor> exec, bool auto_commit)
    : config_(std::move(config)), executor_(std::move(exec)), auto_commit_(auto_commit) {}

session::~session() {
    if (executor_->is_closed()) {
        return;
    }
    try {
        close();
    } catch (const std::exception& e) {
        LOG_ERROR("session", "Failed to close session: %s", e.what());
    }
}

std::any session::select_one(const std::string& statement, std::any parameter) {
    result_list rows = select_list(statement, std::move(parameter));
    if (rows.size() == 1) {
        return rows.front();
    }
    if (rows.size() > 1) {
        throw quarry_error("Expected one result (or null) to be returned by selectOne(), but found: " +
                           std::to_string(rows.size()));
    }
    return {};
}

result_list session::select_list(const std::string& statement, std::any parameter, const row_bounds& bounds) {
    const mapped_statement& ms = config_->get_mapped_statement(statement);
    return executor_->query(ms, parameter, bounds);
}

void session::select(const std::string& statement, std::any parameter, const row_bounds& bounds,
                     const result_handler& handler) {
    const mapped_statement& ms = config_->get_mapped_statement(statement);
    executor_->query(ms, parameter, bounds, handler);
}

std::unique_ptr<cursor> session::select_cursor(const std::string& statement, std::any parameter,
                                               const row_bounds& bounds) {
    const mapped_statement& ms = config_->get_mapped_statement(statement);
    return executor_->query_cursor(ms, parameter, bounds);
}

int64_t session::insert(const std::string& statement, std::any parameter) {
    return update(statement, std::move(parameter));
}

int64_t session::update(const std::string& statement, std::any parameter) {
    const mapped_statement& ms = config_->get_mapped_statement(statement);
    dirty_ = true;
    return executor_->update(ms, parameter);
}

int64_t session::remove(const std::string& statement, std::any parameter) {
    return update(statement, std::move(parameter));
}

void session::commit(bool force) {
    executor_->commit(is_commit_or_rollback_required(force));
    dirty_ = false;
}

void session::rollback(bool force) {
    executor_->rollback(is_commit_or_rollback_required(force));
    dirty_ = false;
}

std::vector<batch_result> session::flush_statements() {
    return executor_->flush_statements();
}

void session::clear_cache() {
    executor_->clear_local_cache();
}

void session::close() {
    executor_->close(is_commit_or_rollback_required(false));
    dirty_ = false;
    LOG_DEBUG("session", "Session closed");
}

// ============================================================================
// session_factory
// ============================================================================

session_factory::session_factory(configuration config, metadata_registry& registry)
    : config_(std::make_shared<const configuration>(std::move(config))), registry_(registry) {
    if (config_->logging_level) {
        set_log_level(*config_->logging_level);
    }
    registry_.set_cache_enabled(config_->reflection_cache_enabled);
}

std::unique_ptr<session> session_factory::open_session(bool auto_commit) {
    if (!config_->env) {
        throw config_error("Cannot open a session without a configured environment");
    }
    const environment& env = *config_->env;

    std::unique_ptr<transaction> tx;
    try {
        tx = env.get_transaction_factory().new_transaction(env.database_path(), auto_commit);
        auto* sqlite_tx = dynamic_cast<sqlite_transaction*>(tx.get());
        if (sqlite_tx == nullptr) {
            throw config_error("The transaction factory of environment '" + env.id() +
                               "' does not produce SQLite transactions");
        }
        auto runner = std::make_unique<sqlite_statement_runner>(*sqlite_tx, registry_,
                                                                config_->default_statement_timeout);
        auto exec = std::make_unique<executor>(std::move(tx), std::move(runner), registry_,
                                               config_->cache_scope, env.id());
        LOG_DEBUG("session", "Opened session on %s (auto_commit=%d)", env.id().c_str(), auto_commit ? 1 : 0);
        return std::make_unique<session>(config_, std::move(exec), auto_commit);
    } catch (const std::exception& e) {
        if (tx) {
            try {
                tx->close();
            } catch (const db_error& close_error) {
                LOG_WARN("session", "Failed to close transaction after open failure: %s", close_error.what());
            }
        }
        throw quarry_error(std::string("Error opening session. Cause: ") + e.what());
    }
}

} // namespace quarry
