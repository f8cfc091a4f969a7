#pragma once

#include <cstdint>
#include <limits>

namespace toolrpc {

/**
 * @brief Overflow-checked int64 arithmetic
 *
 * Each function stores the result and returns true, or returns false and
 * leaves @p result untouched when the exact value does not fit.
 */
namespace checked {

inline bool add(std::int64_t x, std::int64_t y, std::int64_t& result) {
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    constexpr auto min = std::numeric_limits<std::int64_t>::min();
    if ((y > 0 && x > max - y) || (y < 0 && x < min - y)) {
        return false;
    }
    result = x + y;
    return true;
}

inline bool subtract(std::int64_t x, std::int64_t y, std::int64_t& result) {
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    constexpr auto min = std::numeric_limits<std::int64_t>::min();
    if ((y < 0 && x > max + y) || (y > 0 && x < min + y)) {
        return false;
    }
    result = x - y;
    return true;
}

inline bool multiply(std::int64_t x, std::int64_t y, std::int64_t& result) {
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    constexpr auto min = std::numeric_limits<std::int64_t>::min();
    if (x > 0) {
        if ((y > 0 && x > max / y) || (y < 0 && y < min / x)) {
            return false;
        }
    } else if (x < 0) {
        if ((y > 0 && x < min / y) || (y < 0 && x < max / y)) {
            return false;
        }
    }
    result = x * y;
    return true;
}

// Truncates toward zero; y must not be zero
inline bool divide(std::int64_t x, std::int64_t y, std::int64_t& result) {
    if (x == std::numeric_limits<std::int64_t>::min() && y == -1) {
        return false;
    }
    result = x / y;
    return true;
}

} // namespace checked

} // namespace toolrpc
