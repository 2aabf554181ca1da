#include "quarry/metadata_registry.hpp"

#include <mutex>

namespace quarry {

metadata_registry::metadata_registry(type_registry& types, bool allow_private_access)
    : types_(types), allow_private_access_(allow_private_access) {}

std::shared_ptr<const property_metadata> metadata_registry::find_for_type(const meta_type& type) {
    if (!cache_enabled_.load()) {
        return std::make_shared<const property_metadata>(type, allow_private_access_);
    }

    {
        std::shared_lock lock(mutex_);
        auto it = cache_.find(&type);
        if (it != cache_.end()) {
            return it->second;
        }
    }

    // Built outside the lock; a concurrent build of the same type is harmless.
    auto metadata = std::make_shared<const property_metadata>(type, allow_private_access_);
    std::unique_lock lock(mutex_);
    cache_[&type] = metadata;
    return metadata;
}

void metadata_registry::clear() {
    std::unique_lock lock(mutex_);
    cache_.clear();
}

size_t metadata_registry::size() const {
    std::shared_lock lock(mutex_);
    return cache_.size();
}

} // namespace quarry
