#pragma once

/**
@file
@brief A simple logging mechanism to aid development.

Uses compile-time enable/disable flags so that register accessors compile down to bare loads and stores when these logs
are disabled.

Not meant to be used for user logs.

@section Usage

First, define groups:

```cpp
namespace grp {
    // Simple group
    struct base {
        static constexpr bool enabled = true;                        // whether the log group is enabled
        static constexpr devlog::Level level = devlog::level::debug; // the minimum logging level to be printed
        static constexpr std::string_view name = "Video";            // the group's name printed before the message
    };

    // Inherit rules from another group
    struct regs : public base {
        static constexpr std::string_view name = "Video-Regs"; // override what you need
    };
}
```

Use groups to log messages:

```cpp
devlog::debug<grp::base>("Powering on");
devlog::trace<grp::regs>("Uses {{fmt}} formatting: {} {:08X}", 123, 0x04000304);
```

If the log messages need complex calculations, use an `if constexpr` block to ensure they are completely erased from
non-devlog builds:

```cpp
if constexpr (devlog::trace_enabled<grp::regs>) {
    auto decoded = ...; // do complex calculation
    devlog::trace<grp::regs>("Decoded: {}", decoded);
}
```
*/

/**
@namespace devlog
@brief Development logging utilities.
*/

#include <nitro/core/types.hpp>

#include <fmt/format.h>

#include <concepts>
#include <string_view>
#include <type_traits>

namespace devlog {

/// @brief Globally enable or disable dev logging.
inline constexpr bool globalEnable = Nitro_ENABLE_DEVLOG;

// -----------------------------------------------------------------------------
// Log levels

/// @brief Log level type - a simple integer type.
using Level = uint32;

/// @brief Dev log levels definitions.
namespace level {
    /// @brief The lowest log level for fine-grained details.
    ///
    /// Use cases include logging every register load and store.
    inline constexpr Level trace = 1;

    /// @brief A detailed log level for decoded register contents and adjusted parameters.
    inline constexpr Level debug = 2;

    /// @brief General log level, for informational messages.
    inline constexpr Level info = 3;

    /// @brief A log level for potential issues, such as parameters outside of the hardware's valid range.
    inline constexpr Level warn = 4;

    /// @brief A log level for serious issues.
    inline constexpr Level error = 5;

    /// @brief Not a valid log level.
    ///
    /// This is used to completely disable logging for a particular group.
    inline constexpr Level off = 6;

    /// @brief The name for a given log level.
    /// @tparam level the log level
    template <Level level>
    inline constexpr const char *name = "unk";

    template <>
    inline constexpr const char *name<trace> = "trace";
    template <>
    inline constexpr const char *name<debug> = "debug";
    template <>
    inline constexpr const char *name<info> = "info";
    template <>
    inline constexpr const char *name<warn> = "warn";
    template <>
    inline constexpr const char *name<error> = "error";
} // namespace level

namespace detail {

    /// @brief Describes a log group.
    ///
    /// Log groups must contain three `static` fields:
    /// - `static bool enabled`: determines if the log group is enabled or not
    /// - `static devlog::Level level`: determines the minimum log level to be printed
    /// - `static std::string_view name`: the name printed before the log message
    template <typename T>
    concept Group = requires() {
        requires std::same_as<std::decay_t<decltype(T::enabled)>, bool>;
        requires std::same_as<std::decay_t<decltype(T::level)>, Level>;
        requires std::same_as<std::decay_t<decltype(T::name)>, std::string_view>;
    };

    /// @brief Determines if logging is enabled for the level `level` in the group `TGroup`.
    template <Level level, Group TGroup>
    inline constexpr bool enabled = globalEnable && TGroup::enabled && level >= TGroup::level;

    /// @brief Logs a message to the dev log of the specified group.
    /// @tparam level the log level
    /// @tparam TGroup the log group
    /// @param[in] fmt the format string to pass to `fmt::print`
    /// @param[in] ...args the log message's arguments
    template <Level level, Group TGroup, typename... TArgs>
    constexpr void log(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
        static_assert(level < level::off);
        if constexpr (enabled<level, TGroup>) {
            fmt::print("{:5s} | {:16s} | {}\n", level::name<level>, TGroup::name,
                       fmt::format(fmt, static_cast<TArgs &&>(args)...));
        }
    }

} // namespace detail

/// @brief Determines if trace logging is enabled for the group.
template <detail::Group TGroup>
inline constexpr bool trace_enabled = detail::enabled<level::trace, TGroup>;

/// @brief Determines if debug logging is enabled for the group.
template <detail::Group TGroup>
inline constexpr bool debug_enabled = detail::enabled<level::debug, TGroup>;

/// @brief Determines if warn logging is enabled for the group.
template <detail::Group TGroup>
inline constexpr bool warn_enabled = detail::enabled<level::warn, TGroup>;

/// @brief Logs a message in the trace level with the specified group.
/// @param fmt the log message format to be passed to `fmt::print`
/// @param ...args the log message's arguments
template <detail::Group TGroup, typename... TArgs>
constexpr void trace(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::trace, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

/// @brief Logs a message in the debug level with the specified group.
/// @param fmt the log message format to be passed to `fmt::print`
/// @param ...args the log message's arguments
template <detail::Group TGroup, typename... TArgs>
constexpr void debug(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::debug, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

/// @brief Logs a message in the warn level with the specified group.
/// @param fmt the log message format to be passed to `fmt::print`
/// @param ...args the log message's arguments
template <detail::Group TGroup, typename... TArgs>
constexpr void warn(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::log<level::warn, TGroup, TArgs...>(fmt, static_cast<TArgs &&>(args)...);
}

} // namespace devlog
