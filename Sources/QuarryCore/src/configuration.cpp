#include "quarry/configuration.hpp"
#include "quarry/sqlite_transaction.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace quarry {

environment::environment(std::string id, std::shared_ptr<transaction_factory> factory, std::string database_path)
    : id_(std::move(id)), factory_(std::move(factory)), database_path_(std::move(database_path)) {
    if (id_.empty()) {
        throw std::invalid_argument("Environment requires an id.");
    }
    if (!factory_) {
        throw std::invalid_argument("Environment requires a TransactionFactory.");
    }
    if (database_path_.empty()) {
        throw std::invalid_argument("Environment requires a database path.");
    }
}

namespace {
    local_cache_scope parse_cache_scope(const std::string& value) {
        if (value == "SESSION") return local_cache_scope::session;
        if (value == "STATEMENT") return local_cache_scope::statement;
        throw config_error("Invalid value '" + value + "' for localCacheScope, expected SESSION or STATEMENT");
    }

    void apply_setting(configuration& config, const std::string& name, const json& value) {
        if (name == "localCacheScope") {
            config.cache_scope = parse_cache_scope(value.get<std::string>());
        } else if (name == "defaultStatementTimeout") {
            if (value.is_null()) {
                config.default_statement_timeout.reset();
            } else {
                config.default_statement_timeout = value.get<int>();
            }
        } else if (name == "reflectionCacheEnabled") {
            config.reflection_cache_enabled = value.get<bool>();
        } else if (name == "logLevel") {
            config.logging_level = parse_log_level(value.get<std::string>());
        } else {
            throw config_error("The setting " + name +
                               " is not known. Make sure you spelled it correctly (case sensitive).");
        }
    }
}

void configuration::load_settings(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw config_error(std::string("Error parsing configuration. Cause: ") + e.what());
    }
    if (!root.is_object()) {
        throw config_error("Configuration must be a JSON object");
    }

    try {
        if (root.contains("settings")) {
            const json& settings = root["settings"];
            if (!settings.is_object()) {
                throw config_error("\"settings\" must be a JSON object");
            }
            for (auto& [name, value] : settings.items()) {
                apply_setting(*this, name, value);
            }
        }
        if (root.contains("environment")) {
            const json& e = root["environment"];
            if (!e.is_object() || !e.contains("id") || !e.contains("database")) {
                throw config_error("\"environment\" needs an \"id\" and a \"database\"");
            }
            env.emplace(e["id"].get<std::string>(),
                        std::make_shared<sqlite_transaction_factory>(),
                        e["database"].get<std::string>());
        }
    } catch (const json::type_error& e) {
        throw config_error(std::string("Error parsing configuration. Cause: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw config_error(std::string("Error parsing configuration. Cause: ") + e.what());
    }
}

configuration configuration::from_json(const std::string& json_text) {
    configuration config;
    config.load_settings(json_text);
    return config;
}

configuration configuration::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw config_error("Could not read configuration file " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return from_json(buffer.str());
}

void configuration::add_mapped_statement(mapped_statement statement) {
    if (has_statement(statement.id)) {
        throw config_error("Mapped Statements collection already contains value for " + statement.id);
    }
    std::string id = statement.id;
    mapped_statements_.emplace(std::move(id), std::move(statement));
}

const mapped_statement& configuration::get_mapped_statement(const std::string& id) const {
    auto it = mapped_statements_.find(id);
    if (it == mapped_statements_.end()) {
        throw config_error("Mapped Statements collection does not contain value for " + id);
    }
    return it->second;
}

std::vector<std::string> configuration::statement_ids() const {
    std::vector<std::string> ids;
    ids.reserve(mapped_statements_.size());
    for (const auto& [id, _] : mapped_statements_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace quarry
