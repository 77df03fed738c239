#pragma once

/**
@file
@brief User-defined literals for binary sizes and byte count formatting.
*/

#include <romcat/core/types.hpp>

#include <fmt/format.h>

#include <string>

/// @brief Expands the value to kibibytes.
/// @param[in] sz the value to convert
/// @return sz * 1024
inline constexpr unsigned long long operator""_KiB(unsigned long long sz) {
    return sz * 1024;
}

/// @brief Expands the value to mebibytes.
/// @param[in] sz the value to convert
/// @return sz * 1024 * 1024
inline constexpr unsigned long long operator""_MiB(unsigned long long sz) {
    return sz * 1024 * 1024;
}

namespace util {

/// @brief Determines if the value is a nonzero power of two.
/// @param[in] value the value to check
/// @return `true` if `value` is 1, 2, 4, 8, ...
inline constexpr bool IsPowerOfTwo(uint64 value) {
    return value != 0 && (value & (value - 1)) == 0;
}

/// @brief Returns the smallest power of two that is greater than or equal to `value`.
///
/// Returns 1 for 0.
///
/// @param[in] value the value to round up
/// @return the next power of two
inline constexpr uint64 NextPowerOfTwo(uint64 value) {
    uint64 result = 1;
    while (result < value) {
        result <<= 1;
    }
    return result;
}

/// @brief Formats a byte count using the largest binary unit that divides it exactly.
///
/// Produces `"N MB"` for exact multiples of 1 MiB, `"N KB"` for exact multiples of 1 KiB and `"N bytes"` otherwise.
///
/// @param[in] bytes the byte count
/// @return the formatted byte count
inline std::string FormatByteCount(uint64 bytes) {
    if (bytes >= 1_MiB && bytes % 1_MiB == 0) {
        return fmt::format("{} MB", bytes / 1_MiB);
    }
    if (bytes >= 1_KiB && bytes % 1_KiB == 0) {
        return fmt::format("{} KB", bytes / 1_KiB);
    }
    return fmt::format("{} bytes", bytes);
}

} // namespace util
