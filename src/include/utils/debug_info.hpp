/**
 * @file debug_info.hpp
 * @brief Fatal error reporting, debug messages and stack traces.
 *
 * `LGS_PANIC` is reserved for broken invariants and lifecycle misuse: it prints the
 * message with its source location and a stack trace to `stderr`, then aborts.
 * `LGS_DEBUG` compiles to nothing unless `LOGSPRAY_ENABLE_DEBUG_MESSAGES` is defined.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <fmt/format.h>
#include <source_location>
#include <string>

#include "logspray_utils_export.h"
#include "utils/format_tools.hpp"

/**
 * @brief Formats a source location as "file:line:function".
 */
inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", logspray::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

namespace logspray::debug
{

/**
 * @brief Prints the current call stack to `stderr`.
 *
 * POSIX builds resolve symbols with `backtrace`, `dladdr` and `__cxa_demangle`;
 * Windows builds print the raw frame addresses.
 *
 * @warning Not async-signal-safe.
 */
LOGSPRAY_UTILS_EXPORT void print_stack_trace() noexcept;

template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, "[PANIC] {} -- {}\n", SRCLOC_TO_STR(loc),
                   fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    catch (const std::exception &e)
    {
        std::fputs("[PANIC] could not format the panic message: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputc('\n', stderr);
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, "[DBG]  {}\n", fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    catch (const std::exception &e)
    {
        std::fputs("[DBG]  could not format the debug message: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputc('\n', stderr);
    }
}

} // namespace logspray::debug

#ifndef LGS_PANIC
#define LGS_PANIC(fmt, ...)                                                                        \
    ::logspray::debug::panic(std::source_location::current(),                                      \
                             FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

#ifndef LGS_DEBUG
#if defined(LOGSPRAY_ENABLE_DEBUG_MESSAGES)
#define LGS_DEBUG(fmt, ...) ::logspray::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define LGS_DEBUG(fmt, ...)                                                                        \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
