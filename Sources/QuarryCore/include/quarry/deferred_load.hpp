#pragma once

#ifdef __cplusplus

#include "cache_key.hpp"
#include "local_cache.hpp"
#include "metadata_registry.hpp"
#include <any>
#include <deque>
#include <string>

namespace quarry {

/// Turns a cached row list into the value assigned to a property: the whole
/// list for collection types, otherwise the first row (null when empty).
class result_extractor {
public:
    explicit result_extractor(const type_registry& types) : types_(types) {}

    std::any extract_object_from_list(const result_list& rows, const meta_type& target_type) const;

private:
    const type_registry& types_;
};

/// A nested property assignment waiting for its query's rows to be materialized.
class deferred_load {
public:
    deferred_load(std::any result_object, std::string property, cache_key key,
                  const local_cache& cache, metadata_registry& registry, const meta_type& target_type);

    /// True when the key's rows are materialized (not absent, not pending).
    bool can_load() const;

    /// Assigns the extracted rows to the target property. Throws executor_error
    /// when the rows are absent or still pending.
    void load();

    const std::any& result_object() const { return result_object_; }
    const std::string& property() const { return property_; }
    const cache_key& key() const { return key_; }
    const meta_type& target_type() const { return *target_type_; }

private:
    std::any result_object_;
    std::string property_;
    cache_key key_;
    const local_cache* cache_;
    metadata_registry* registry_;
    const meta_type* target_type_;
};

/// FIFO of deferred loads, drained when the outermost query returns.
class deferred_load_queue {
public:
    void enqueue(deferred_load load) { loads_.push_back(std::move(load)); }

    /// Resolves every queued load in insertion order, then leaves the queue empty.
    void drain_all();

    bool empty() const { return loads_.empty(); }
    size_t size() const { return loads_.size(); }
    void clear() { loads_.clear(); }

private:
    std::deque<deferred_load> loads_;
};

} // namespace quarry

#endif // __cplusplus
