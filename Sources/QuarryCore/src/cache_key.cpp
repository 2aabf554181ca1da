#include "quarry/cache_key.hpp"
#include "quarry/errors.hpp"

namespace quarry {

cache_key::cache_key(const std::vector<column_value_t>& values) {
    update_all(values);
}

uint64_t cache_key::component_hash(const column_value_t& value) {
    return std::visit([](const auto& v) -> uint64_t {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, std::nullptr_t>) {
            return 1;
        } else if constexpr (std::is_same_v<V, blob_t>) {
            uint64_t h = 1;
            for (uint8_t b : v) {
                h = 31 * h + b;
            }
            return h;
        } else {
            return static_cast<uint64_t>(std::hash<V>{}(v));
        }
    }, value);
}

void cache_key::update(const column_value_t& value) {
    if (immutable_) {
        throw executor_error("Not allowed to update a null cache key instance.");
    }
    uint64_t base = component_hash(value);
    values_.push_back(value);
    checksum_ += base;
    hashcode_ = multiplier_ * hashcode_ + base;
}

void cache_key::update_all(const std::vector<column_value_t>& values) {
    for (const auto& value : values) {
        update(value);
    }
}

bool cache_key::operator==(const cache_key& other) const {
    if (this == &other) {
        return true;
    }
    if (hashcode_ != other.hashcode_ || checksum_ != other.checksum_ || values_.size() != other.values_.size()) {
        return false;
    }
    for (size_t i = 0; i < values_.size(); ++i) {
        if (values_[i] != other.values_[i]) {
            return false;
        }
    }
    return true;
}

std::string cache_key::to_string() const {
    std::string out = std::to_string(hashcode_) + ":" + std::to_string(checksum_);
    for (const auto& value : values_) {
        out += ":";
        out += detail::column_value_to_string(value);
    }
    return out;
}

const cache_key& cache_key::null_key() {
    static const cache_key key = [] {
        cache_key k;
        k.immutable_ = true;
        return k;
    }();
    return key;
}

} // namespace quarry
