#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace quarry {

// ============================================================================
// cache_key - ordered composite fingerprint of a query request
// ============================================================================

/// Keys built by appending equal values in the same order are equal and hash
/// alike. The hash is maintained incrementally: each appended value sets
/// hash = hash * 37 + component_hash (null hashes to 1).
class cache_key {
public:
    static constexpr uint64_t default_multiplier = 37;
    static constexpr uint64_t default_hashcode = 17;

    cache_key() = default;
    explicit cache_key(const std::vector<column_value_t>& values);

    /// Appends one component. Throws executor_error on the shared null key.
    void update(const column_value_t& value);
    void update_all(const std::vector<column_value_t>& values);

    size_t count() const { return values_.size(); }
    uint64_t hash_code() const { return hashcode_; }
    const std::vector<column_value_t>& values() const { return values_; }

    /// "hash:checksum:v1:v2..." for log lines.
    std::string to_string() const;

    bool operator==(const cache_key& other) const;
    bool operator!=(const cache_key& other) const { return !(*this == other); }

    /// Immutable empty key for statements whose results must never be cached.
    static const cache_key& null_key();

private:
    static uint64_t component_hash(const column_value_t& value);

    uint64_t multiplier_ = default_multiplier;
    uint64_t hashcode_ = default_hashcode;
    uint64_t checksum_ = 0;
    std::vector<column_value_t> values_;
    bool immutable_ = false;
};

} // namespace quarry

namespace std {
template<>
struct hash<quarry::cache_key> {
    size_t operator()(const quarry::cache_key& key) const noexcept {
        return static_cast<size_t>(key.hash_code());
    }
};
} // namespace std

#endif // __cplusplus
