#pragma once

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <ctime>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace urlform {

// Fixed-size char buffers, e.g. `char code[4]` or a string literal
template <typename T>
concept CharArray = std::is_bounded_array_v<T> &&
                    std::is_same_v<std::remove_cv_t<std::remove_extent_t<T>>, char>;

template <typename T>
concept StringLike = std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view> ||
                     std::is_same_v<T, const char*> || std::is_same_v<T, char*> || CharArray<T>;

template <typename T>
concept ScalarLike = std::is_arithmetic_v<T> || std::is_enum_v<T>;

// RFC 3339 in UTC with second precision, e.g. 2006-01-02T15:04:05Z
template <typename Duration>
std::string format_rfc3339(std::chrono::time_point<std::chrono::system_clock, Duration> tp) {
    auto seconds = std::chrono::floor<std::chrono::seconds>(tp);
    std::time_t t = std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::system_clock::duration>(seconds));

    std::tm tm{};
    if (gmtime_r(&t, &tm) == nullptr) {
        throw std::runtime_error("Time value out of range");
    }

    char buf[64];
    std::size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    if (len == 0) {
        throw std::runtime_error("Time value out of range");
    }
    return std::string(buf, len);
}

// Shortest fixed-notation text that round-trips, with NaN/+Inf/-Inf spelled out
template <typename F>
std::string format_float(F value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "+Inf" : "-Inf";

    // Room for the widest integer part or the longest fraction of a subnormal
    constexpr std::size_t size =
        std::max(std::numeric_limits<F>::max_exponent10,
                 std::numeric_limits<F>::max_digits10 - std::numeric_limits<F>::min_exponent10) +
        std::numeric_limits<F>::max_digits10 + 8;

    std::string buf(size, '\0');
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value, std::chars_format::fixed);
    if (ec != std::errc{}) {
        throw std::runtime_error("Floating point value could not be formatted");
    }
    buf.resize(static_cast<std::size_t>(ptr - buf.data()));
    return buf;
}

// Text of a char buffer up to its first NUL, never reading past the buffer
inline std::string char_array_string(const char* data, std::size_t size) {
    return std::string(data, std::find(data, data + size, '\0'));
}

inline std::string to_form_string(const std::string& value) { return value; }
inline std::string to_form_string(std::string_view value) { return std::string(value); }
inline std::string to_form_string(const char* value) { return value ? std::string(value) : std::string(); }
inline std::string to_form_string(char* value) { return to_form_string(static_cast<const char*>(value)); }

template <typename T>
    requires ScalarLike<T>
std::string to_form_string(T value) {
    if constexpr (std::is_same_v<T, bool>) {
        return value ? "true" : "false";
    } else if constexpr (std::is_same_v<T, char>) {
        return std::string(1, value);
    } else if constexpr (std::is_enum_v<T>) {
        return std::to_string(static_cast<std::underlying_type_t<T>>(value));
    } else if constexpr (std::is_floating_point_v<T>) {
        return format_float(value);
    } else {
        return std::to_string(value);
    }
}

template <typename Duration>
std::string to_form_string(std::chrono::time_point<std::chrono::system_clock, Duration> value) {
    return format_rfc3339(value);
}

inline bool is_zero_value(const std::string& value) { return value.empty(); }
inline bool is_zero_value(std::string_view value) { return value.empty(); }
inline bool is_zero_value(const char* value) { return value == nullptr || *value == '\0'; }
inline bool is_zero_value(char* value) { return is_zero_value(static_cast<const char*>(value)); }

template <typename T>
    requires ScalarLike<T>
bool is_zero_value(T value) {
    return value == T{};
}

template <typename Duration>
bool is_zero_value(std::chrono::time_point<std::chrono::system_clock, Duration> value) {
    return value.time_since_epoch().count() == 0;
}

}  // namespace urlform
