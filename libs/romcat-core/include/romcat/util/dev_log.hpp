#pragma once

/**
@file
@brief Compile-time gated development logging.

Log statements compile to nothing unless the library is built with `Romcat_ENABLE_DEVLOG`, and each log group can be
silenced or filtered by level at compile time.

Declare groups as structs with three static members:

```cpp
namespace grp {
    struct base {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Import";
    };

    struct media : public base {
        static constexpr std::string_view name = "Import-Media";
    };
}
```

Then log with the group as the template argument:

```cpp
devlog::info<grp::base>("Imported {} records from {}", count, source);
```

Expensive message arguments should be computed inside an `if constexpr (devlog::debug_enabled<grp::base>)` block so
they are erased from builds without dev logs.

Messages are written to `stderr` as `level | group | message`.
*/

/**
@namespace devlog
@brief Development logging utilities.
*/

#include <romcat/core/types.hpp>

#include <fmt/format.h>

#include <concepts>
#include <cstdio>
#include <string_view>
#include <type_traits>

namespace devlog {

/// @brief Globally enable or disable dev logging.
inline constexpr bool globalEnable = Romcat_ENABLE_DEVLOG;

/// @brief Log level type.
using Level = uint32;

/// @brief Dev log levels.
namespace level {
    /// @brief Per-record details, such as every parsed name or hashed chunk.
    inline constexpr Level trace = 1;
    /// @brief Per-file or per-entity details.
    inline constexpr Level debug = 2;
    /// @brief Batch-level events: imports, scans, reconciliation runs.
    inline constexpr Level info = 3;
    /// @brief Recoverable problems, such as skipped records or unreadable files.
    inline constexpr Level warn = 4;
    /// @brief Failed operations.
    inline constexpr Level error = 5;
    /// @brief Disables a group entirely. Not a valid message level.
    inline constexpr Level off = 6;

    /// @brief Returns the printable name of a log level.
    /// @param[in] lv the log level
    /// @return the name of the level
    constexpr std::string_view Name(Level lv) {
        switch (lv) {
        case trace: return "trace";
        case debug: return "debug";
        case info: return "info";
        case warn: return "warn";
        case error: return "error";
        default: return "unk";
        }
    }
} // namespace level

namespace detail {

    /// @brief A log group with a static enable flag, minimum level and name.
    template <typename T>
    concept Group = requires() {
        requires std::same_as<std::decay_t<decltype(T::enabled)>, bool>;
        requires std::same_as<std::decay_t<decltype(T::level)>, Level>;
        requires std::same_as<std::decay_t<decltype(T::name)>, std::string_view>;
    };

    template <Level lv, Group TGroup>
    inline constexpr bool enabled = globalEnable && TGroup::enabled && lv >= TGroup::level;

    template <Level lv, Group TGroup, typename... TArgs>
    void log(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
        static_assert(lv < level::off);
        if constexpr (enabled<lv, TGroup>) {
            fmt::print(stderr, "{:5s} | {:16s} | ", level::Name(lv), TGroup::name);
            fmt::println(stderr, fmt, static_cast<TArgs &&>(args)...);
        }
    }

} // namespace detail

template <detail::Group TGroup>
inline constexpr bool trace_enabled = detail::enabled<level::trace, TGroup>;

template <detail::Group TGroup>
inline constexpr bool debug_enabled = detail::enabled<level::debug, TGroup>;

template <detail::Group TGroup>
inline constexpr bool info_enabled = detail::enabled<level::info, TGroup>;

template <detail::Group TGroup>
inline constexpr bool warn_enabled = detail::enabled<level::warn, TGroup>;

template <detail::Group TGroup>
inline constexpr bool error_enabled = detail::enabled<level::error, TGroup>;

/// @brief Logs a message at the trace level.
template <detail::Group TGroup, typename... TArgs>
void trace(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::trace, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

/// @brief Logs a message at the debug level.
template <detail::Group TGroup, typename... TArgs>
void debug(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::debug, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

/// @brief Logs a message at the info level.
template <detail::Group TGroup, typename... TArgs>
void info(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::info, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

/// @brief Logs a message at the warn level.
template <detail::Group TGroup, typename... TArgs>
void warn(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::warn, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

/// @brief Logs a message at the error level.
template <detail::Group TGroup, typename... TArgs>
void error(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::error, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

} // namespace devlog
