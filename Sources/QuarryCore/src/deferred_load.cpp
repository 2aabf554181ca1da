#include "quarry/deferred_load.hpp"
#include "quarry/log.hpp"
#include "quarry/meta_object.hpp"

namespace quarry {

std::any result_extractor::extract_object_from_list(const result_list& rows, const meta_type& target_type) const {
    if (target_type.is_collection()) {
        return target_type.make_collection(rows, types_);
    }
    if (rows.empty()) {
        return {};
    }
    return rows.front();
}

deferred_load::deferred_load(std::any result_object, std::string property, cache_key key,
                             const local_cache& cache, metadata_registry& registry, const meta_type& target_type)
    : result_object_(std::move(result_object)), property_(std::move(property)), key_(std::move(key)),
      cache_(&cache), registry_(&registry), target_type_(&target_type) {}

bool deferred_load::can_load() const {
    return cache_->get(key_).is_materialized();
}

void deferred_load::load() {
    cached_result cached = cache_->get(key_);
    if (!cached.is_materialized()) {
        throw executor_error("Cannot load property '" + property_ + "': the result for key " +
                             key_.to_string() + (cached.is_pending() ? " is still pending" : " is not cached"));
    }
    result_extractor extractor(registry_->types());
    std::any value = extractor.extract_object_from_list(cached.rows(), *target_type_);
    meta_object(result_object_, *registry_).set_value(property_, value);
}

void deferred_load_queue::drain_all() {
    if (!loads_.empty()) {
        LOG_DEBUG("executor", "Draining %zu deferred loads", loads_.size());
    }
    while (!loads_.empty()) {
        deferred_load load = std::move(loads_.front());
        loads_.pop_front();
        load.load();
    }
}

} // namespace quarry
