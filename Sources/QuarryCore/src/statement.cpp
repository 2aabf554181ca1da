#include "quarry/statement.hpp"

namespace quarry {

namespace {
    std::string root_name(const std::string& name) {
        auto dot = name.find('.');
        return dot == std::string::npos ? name : name.substr(0, dot);
    }
}

bool bound_sql::has_additional_parameter(const std::string& name) const {
    return additional_parameters_.count(root_name(name)) > 0;
}

void bound_sql::set_additional_parameter(const std::string& name, std::any value) {
    additional_parameters_[name] = std::move(value);
}

std::any bound_sql::additional_parameter(const std::string& name) const {
    auto it = additional_parameters_.find(name);
    return it == additional_parameters_.end() ? std::any() : it->second;
}

bound_sql mapped_statement::get_bound_sql(const std::any& parameter) const {
    if (source) {
        return source(parameter);
    }
    return bound_sql(sql, parameter_mappings, parameter);
}

mapped_statement mapped_statement::select(std::string id, std::string sql,
                                          std::vector<parameter_mapping> mappings, row_mapper mapper) {
    mapped_statement ms;
    ms.id = std::move(id);
    ms.command = sql_command_type::select;
    ms.sql = std::move(sql);
    ms.parameter_mappings = std::move(mappings);
    ms.mapper = std::move(mapper);
    return ms;
}

namespace {
    mapped_statement make_write(std::string id, sql_command_type command, std::string sql,
                                std::vector<parameter_mapping> mappings) {
        mapped_statement ms;
        ms.id = std::move(id);
        ms.command = command;
        ms.flush_cache_required = true;
        ms.sql = std::move(sql);
        ms.parameter_mappings = std::move(mappings);
        return ms;
    }
}

mapped_statement mapped_statement::insert(std::string id, std::string sql, std::vector<parameter_mapping> mappings) {
    return make_write(std::move(id), sql_command_type::insert, std::move(sql), std::move(mappings));
}

mapped_statement mapped_statement::update(std::string id, std::string sql, std::vector<parameter_mapping> mappings) {
    return make_write(std::move(id), sql_command_type::update, std::move(sql), std::move(mappings));
}

mapped_statement mapped_statement::remove(std::string id, std::string sql, std::vector<parameter_mapping> mappings) {
    return make_write(std::move(id), sql_command_type::remove, std::move(sql), std::move(mappings));
}

mapped_statement mapped_statement::callable(std::string id, std::string sql,
                                            std::vector<parameter_mapping> mappings, row_mapper mapper) {
    mapped_statement ms = select(std::move(id), std::move(sql), std::move(mappings), std::move(mapper));
    ms.type = statement_type::callable;
    return ms;
}

} // namespace quarry
