#pragma once

#ifdef __cplusplus

#include "errors.hpp"
#include <any>
#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace quarry {

/// Timestamp scalar, bound as REAL seconds since the Unix epoch.
using timestamp_t = std::chrono::system_clock::time_point;

/// BLOB payload.
using blob_t = std::vector<uint8_t>;

/// UUID scalar, bound as lowercase hyphenated TEXT.
struct uuid_t {
    std::array<uint8_t, 16> bytes{};

    uuid_t() = default;
    explicit uuid_t(const std::array<uint8_t, 16>& b) : bytes(b) {}

    std::string to_string() const {
        static const char* digits = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
            out += digits[bytes[i] >> 4];
            out += digits[bytes[i] & 0x0F];
        }
        return out;
    }

    /// Hyphens are optional. Returns std::nullopt unless there are exactly 32 hex digits.
    static std::optional<uuid_t> parse(const std::string& text) {
        uuid_t result;
        size_t nibble = 0;
        for (char c : text) {
            if (c == '-') continue;
            int value;
            if (c >= '0' && c <= '9') value = c - '0';
            else if (c >= 'a' && c <= 'f') value = c - 'a' + 10;
            else if (c >= 'A' && c <= 'F') value = c - 'A' + 10;
            else return std::nullopt;
            if (nibble >= 32) return std::nullopt;
            result.bytes[nibble / 2] |= static_cast<uint8_t>(nibble % 2 == 0 ? value << 4 : value);
            ++nibble;
        }
        if (nibble != 32) return std::nullopt;
        return result;
    }

    bool operator==(const uuid_t& other) const { return bytes == other.bytes; }
    bool operator!=(const uuid_t& other) const { return bytes != other.bytes; }
};

// Scalar values as the store sees them. Booleans and narrow integers widen to int64_t.
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    blob_t
>;

enum class column_type {
    integer,
    real,
    text,
    blob
};

/// Materialized query result: one entry per mapped row.
using result_list = std::vector<std::any>;

/// Map-backed parameter object: property name -> value.
using param_map = std::unordered_map<std::string, std::any>;

/// Raw result row keyed by column name.
using row_t = std::unordered_map<std::string, column_value_t>;

// ============================================================================
// Helper functions for scalar conversion
// ============================================================================

namespace detail {
    template<typename T> struct is_vector : std::false_type {};
    template<typename T, typename A> struct is_vector<std::vector<T, A>> : std::true_type {};

    template<typename T> struct is_shared_ptr : std::false_type {};
    template<typename T> struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

    // Convert C++ types to column_value_t
    inline column_value_t to_column_value(int64_t v) { return v; }
    inline column_value_t to_column_value(int v) { return static_cast<int64_t>(v); }
    inline column_value_t to_column_value(bool v) { return static_cast<int64_t>(v ? 1 : 0); }
    inline column_value_t to_column_value(double v) { return v; }
    inline column_value_t to_column_value(float v) { return static_cast<double>(v); }
    inline column_value_t to_column_value(const std::string& v) { return v; }
    inline column_value_t to_column_value(const blob_t& v) { return v; }
    inline column_value_t to_column_value(timestamp_t v) {
        auto duration = v.time_since_epoch();
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
        return static_cast<double>(millis) / 1000.0;
    }
    inline column_value_t to_column_value(const uuid_t& v) {
        return v.to_string();
    }

    // Convert column_value_t back to C++ types. Integers and reals convert into each other.
    template<typename T>
    T from_column_value(const column_value_t& v);

    inline int64_t column_as_int64(const column_value_t& v) {
        if (std::holds_alternative<double>(v)) return static_cast<int64_t>(std::get<double>(v));
        return std::get<int64_t>(v);
    }
    inline double column_as_double(const column_value_t& v) {
        if (std::holds_alternative<int64_t>(v)) return static_cast<double>(std::get<int64_t>(v));
        return std::get<double>(v);
    }

    template<> inline int64_t from_column_value<int64_t>(const column_value_t& v) {
        return column_as_int64(v);
    }
    template<> inline int from_column_value<int>(const column_value_t& v) {
        return static_cast<int>(column_as_int64(v));
    }
    template<> inline bool from_column_value<bool>(const column_value_t& v) {
        return column_as_int64(v) != 0;
    }
    template<> inline double from_column_value<double>(const column_value_t& v) {
        return column_as_double(v);
    }
    template<> inline float from_column_value<float>(const column_value_t& v) {
        return static_cast<float>(column_as_double(v));
    }
    template<> inline std::string from_column_value<std::string>(const column_value_t& v) {
        return std::get<std::string>(v);
    }
    template<> inline blob_t from_column_value<blob_t>(const column_value_t& v) {
        return std::get<blob_t>(v);
    }
    template<> inline timestamp_t from_column_value<timestamp_t>(const column_value_t& v) {
        double seconds = column_as_double(v);
        auto millis = static_cast<int64_t>(seconds * 1000.0);
        return timestamp_t(std::chrono::milliseconds(millis));
    }
    template<> inline uuid_t from_column_value<uuid_t>(const column_value_t& v) {
        auto parsed = uuid_t::parse(std::get<std::string>(v));
        if (!parsed) throw reflection_error("Invalid UUID text '" + std::get<std::string>(v) + "'");
        return *parsed;
    }

    /// Printable form of a column value, for log lines and cache key strings.
    std::string column_value_to_string(const column_value_t& v);
} // namespace detail

} // namespace quarry

#endif // __cplusplus
