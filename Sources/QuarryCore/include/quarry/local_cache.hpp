#pragma once

#ifdef __cplusplus

#include "cache_key.hpp"
#include "types.hpp"
#include <any>
#include <memory>
#include <string>
#include <unordered_map>

namespace quarry {

/// State of one local cache slot. `pending` marks a fingerprint whose query is
/// still in flight further up the call stack.
class cached_result {
public:
    enum class state {
        absent,
        pending,
        materialized
    };

    cached_result() = default;

    static cached_result placeholder();
    static cached_result of(result_list rows);

    state status() const { return state_; }
    bool is_absent() const { return state_ == state::absent; }
    bool is_pending() const { return state_ == state::pending; }
    bool is_materialized() const { return state_ == state::materialized; }

    /// Throws executor_error unless materialized.
    const result_list& rows() const;

private:
    state state_ = state::absent;
    std::shared_ptr<const result_list> rows_;
};

/// Session-local result cache plus the captured parameter objects of callable
/// statements. Not thread-safe: owned by one executor.
class local_cache {
public:
    explicit local_cache(std::string id) : id_(std::move(id)) {}

    const std::string& id() const { return id_; }

    /// Absent when the key is unknown. No side effects.
    cached_result get(const cache_key& key) const;

    /// Storing an absent result removes the entry.
    void put(const cache_key& key, cached_result value);
    void remove(const cache_key& key);

    /// Drops every entry and every captured output parameter.
    void clear();

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    void put_output_parameters(const cache_key& key, std::any parameter);
    const std::any* output_parameters(const cache_key& key) const;

private:
    std::string id_;
    std::unordered_map<cache_key, cached_result> entries_;
    std::unordered_map<cache_key, std::any> output_parameters_;
};

} // namespace quarry

#endif // __cplusplus
