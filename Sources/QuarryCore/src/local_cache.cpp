#include "quarry/local_cache.hpp"
#include "quarry/errors.hpp"

namespace quarry {

cached_result cached_result::placeholder() {
    cached_result result;
    result.state_ = state::pending;
    return result;
}

cached_result cached_result::of(result_list rows) {
    cached_result result;
    result.state_ = state::materialized;
    result.rows_ = std::make_shared<const result_list>(std::move(rows));
    return result;
}

const result_list& cached_result::rows() const {
    if (state_ != state::materialized) {
        throw executor_error(state_ == state::pending
                                 ? "Cached result is still pending"
                                 : "No cached result");
    }
    return *rows_;
}

cached_result local_cache::get(const cache_key& key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? cached_result() : it->second;
}

void local_cache::put(const cache_key& key, cached_result value) {
    if (value.is_absent()) {
        entries_.erase(key);
        return;
    }
    entries_.insert_or_assign(key, std::move(value));
}

void local_cache::remove(const cache_key& key) {
    entries_.erase(key);
}

void local_cache::clear() {
    entries_.clear();
    output_parameters_.clear();
}

void local_cache::put_output_parameters(const cache_key& key, std::any parameter) {
    output_parameters_.insert_or_assign(key, std::move(parameter));
}

const std::any* local_cache::output_parameters(const cache_key& key) const {
    auto it = output_parameters_.find(key);
    return it == output_parameters_.end() ? nullptr : &it->second;
}

} // namespace quarry
