#pragma once

/**
@file
@brief ASCII string helpers used by the name parser, hash index and catalog.
*/

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace util {

inline constexpr bool IsAsciiSpace(char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

inline constexpr bool IsAsciiDigit(char ch) {
    return ch >= '0' && ch <= '9';
}

inline constexpr bool IsAsciiUpper(char ch) {
    return ch >= 'A' && ch <= 'Z';
}

inline constexpr bool IsAsciiLower(char ch) {
    return ch >= 'a' && ch <= 'z';
}

inline constexpr bool IsAsciiAlpha(char ch) {
    return IsAsciiUpper(ch) || IsAsciiLower(ch);
}

inline constexpr bool IsAsciiAlnum(char ch) {
    return IsAsciiAlpha(ch) || IsAsciiDigit(ch);
}

inline constexpr char ToLowerAscii(char ch) {
    return IsAsciiUpper(ch) ? static_cast<char>(ch - 'A' + 'a') : ch;
}

inline constexpr char ToUpperAscii(char ch) {
    return IsAsciiLower(ch) ? static_cast<char>(ch - 'a' + 'A') : ch;
}

/// @brief Returns a copy of the string with ASCII letters lowercased. Other bytes are left intact.
inline std::string ToLower(std::string_view str) {
    std::string out{str};
    std::transform(out.begin(), out.end(), out.begin(), [](char ch) { return ToLowerAscii(ch); });
    return out;
}

/// @brief Returns a copy of the string with ASCII letters uppercased. Other bytes are left intact.
inline std::string ToUpper(std::string_view str) {
    std::string out{str};
    std::transform(out.begin(), out.end(), out.begin(), [](char ch) { return ToUpperAscii(ch); });
    return out;
}

/// @brief Removes leading and trailing ASCII whitespace.
inline std::string_view Trim(std::string_view str) {
    while (!str.empty() && IsAsciiSpace(str.front())) {
        str.remove_prefix(1);
    }
    while (!str.empty() && IsAsciiSpace(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

/// @brief Compares two strings, ignoring the case of ASCII letters.
inline bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return ToLowerAscii(a) == ToLowerAscii(b);
           });
}

/// @brief Splits the string at every occurrence of `separator`. Parts are trimmed; empty parts are kept.
inline std::vector<std::string_view> SplitTrimmed(std::string_view str, char separator) {
    std::vector<std::string_view> parts{};
    size_t start = 0;
    while (true) {
        const size_t pos = str.find(separator, start);
        if (pos == std::string_view::npos) {
            parts.push_back(Trim(str.substr(start)));
            break;
        }
        parts.push_back(Trim(str.substr(start, pos - start)));
        start = pos + 1;
    }
    return parts;
}

} // namespace util
