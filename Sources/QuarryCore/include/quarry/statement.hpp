#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <any>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace quarry {

enum class statement_type {
    statement,
    prepared,
    callable
};

enum class sql_command_type {
    unknown,
    select,
    insert,
    update,
    remove
};

enum class parameter_mode {
    in,
    out,
    inout
};

/// One `?` placeholder of a statement: which property feeds it and in which direction.
struct parameter_mapping {
    std::string property;
    parameter_mode mode = parameter_mode::in;
    std::optional<column_type> column;

    parameter_mapping() = default;
    parameter_mapping(std::string property, parameter_mode mode = parameter_mode::in,
                      std::optional<column_type> column = std::nullopt)
        : property(std::move(property)), mode(mode), column(column) {}
};

struct row_bounds {
    static constexpr int64_t no_row_offset = 0;
    static constexpr int64_t no_row_limit = std::numeric_limits<int32_t>::max();

    int64_t offset = no_row_offset;
    int64_t limit = no_row_limit;

    row_bounds() = default;
    row_bounds(int64_t offset, int64_t limit) : offset(offset), limit(limit) {}
};

/// SQL text resolved for one parameter object, ready to bind.
class bound_sql {
public:
    bound_sql(std::string sql, std::vector<parameter_mapping> mappings, std::any parameter_object = {})
        : sql_(std::move(sql)), mappings_(std::move(mappings)), parameter_object_(std::move(parameter_object)) {}

    const std::string& sql() const { return sql_; }
    const std::vector<parameter_mapping>& parameter_mappings() const { return mappings_; }
    const std::any& parameter_object() const { return parameter_object_; }

    /// Ad-hoc values (loop variables of dynamic SQL and the like) that shadow
    /// the parameter object's properties. Matched on the first path segment.
    bool has_additional_parameter(const std::string& name) const;
    void set_additional_parameter(const std::string& name, std::any value);
    std::any additional_parameter(const std::string& name) const;

private:
    std::string sql_;
    std::vector<parameter_mapping> mappings_;
    std::any parameter_object_;
    std::unordered_map<std::string, std::any> additional_parameters_;
};

using sql_source = std::function<bound_sql(const std::any& parameter)>;

/// Maps one raw row into a result object. Without one, rows are returned as row_t.
using row_mapper = std::function<std::any(const row_t& row)>;

struct mapped_statement {
    std::string id;
    std::string resource;
    statement_type type = statement_type::prepared;
    sql_command_type command = sql_command_type::unknown;
    bool flush_cache_required = false;
    std::optional<int> timeout;  // seconds
    std::string sql;
    std::vector<parameter_mapping> parameter_mappings;
    sql_source source;
    row_mapper mapper;

    /// The dynamic source when set, otherwise the static sql and mappings.
    bound_sql get_bound_sql(const std::any& parameter) const;

    static mapped_statement select(std::string id, std::string sql,
                                   std::vector<parameter_mapping> mappings = {}, row_mapper mapper = {});
    static mapped_statement insert(std::string id, std::string sql, std::vector<parameter_mapping> mappings = {});
    static mapped_statement update(std::string id, std::string sql, std::vector<parameter_mapping> mappings = {});
    static mapped_statement remove(std::string id, std::string sql, std::vector<parameter_mapping> mappings = {});
    static mapped_statement callable(std::string id, std::string sql,
                                     std::vector<parameter_mapping> mappings, row_mapper mapper = {});
};

// ============================================================================
// Result handling
// ============================================================================

class result_context {
public:
    const std::any& result_object() const { return result_object_; }
    int64_t result_count() const { return result_count_; }
    bool is_stopped() const { return stopped_; }
    void stop() { stopped_ = true; }

    /// Runner side: advance to the next mapped row.
    void next(std::any row) {
        result_object_ = std::move(row);
        ++result_count_;
    }

private:
    std::any result_object_;
    int64_t result_count_ = 0;
    bool stopped_ = false;
};

/// Receives each mapped row instead of the returned list. May call stop().
using result_handler = std::function<void(result_context&)>;

/// Forward-only, single-pass stream of mapped rows.
class cursor {
public:
    virtual ~cursor() = default;

    virtual bool is_open() const = 0;
    virtual bool is_consumed() const = 0;

    /// Index of the last row returned by next(), -1 before the first.
    virtual int64_t current_index() const = 0;

    /// Fetches the next row into `row`. False once the stream is exhausted or closed.
    virtual bool next(std::any& row) = 0;

    virtual void close() = 0;
};

struct batch_result {
    std::string statement_id;
    std::string sql;
    std::vector<int64_t> update_counts;
};

} // namespace quarry

#endif // __cplusplus
