#pragma once

#ifdef __cplusplus

#include "property_metadata.hpp"
#include "type_registry.hpp"
#include <atomic>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace quarry {

/// Per-type cache of property_metadata. Shared by every session of a process;
/// lookups and lazy population are safe from any thread.
class metadata_registry {
public:
    explicit metadata_registry(type_registry& types, bool allow_private_access = true);

    metadata_registry(const metadata_registry&) = delete;
    metadata_registry& operator=(const metadata_registry&) = delete;

    /// Memoized while caching is enabled; built fresh on every call otherwise.
    std::shared_ptr<const property_metadata> find_for_type(const meta_type& type);

    template<typename T>
    std::shared_ptr<const property_metadata> find_for_type() {
        return find_for_type(types_.ensure<T>());
    }

    bool is_cache_enabled() const { return cache_enabled_.load(); }
    void set_cache_enabled(bool enabled) { cache_enabled_.store(enabled); }

    bool allow_private_access() const { return allow_private_access_; }

    void clear();
    size_t size() const;

    type_registry& types() { return types_; }
    const type_registry& types() const { return types_; }

private:
    type_registry& types_;
    const bool allow_private_access_;
    std::atomic<bool> cache_enabled_{true};
    mutable std::shared_mutex mutex_;
    std::unordered_map<const meta_type*, std::shared_ptr<const property_metadata>> cache_;
};

} // namespace quarry

#endif // __cplusplus
