/**
 * @file debug_info.hpp
 * @brief Stack trace printing, panic handling for programmer errors, and debug messaging.
 *
 * Format strings are checked at compile time through `fmt::format_string`, and
 * `std::source_location` supplies the call site automatically.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "scenefix_utils_export.h"
#include "utils/format_tools.hpp"

namespace scenefix::debug
{

/**
 * @brief Prints the current call stack to `stderr`.
 *
 * POSIX builds use `backtrace` and `dladdr` with C++ demangling; other platforms print a
 * notice only. Failures while capturing the trace are reported to `stderr`.
 */
SCENEFIX_UTILS_EXPORT void print_stack_trace() noexcept;

/** @brief "file:line:function" for a source location. */
inline std::string srcloc_to_str(std::source_location loc)
{
    return fmt::format("{}:{}:{}", scenefix::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

/**
 * @brief Halts program execution with a fatal error message and prints a stack trace.
 *
 * Reserved for violated invariants that indicate a bug in the caller (an enum value
 * outside its declared range, a component used after being moved from). Runtime
 * failures such as I/O errors are reported through Result or std::error_code instead.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", srcloc_to_str(loc), body);
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr,
                   "[PANIC] {} -- FATAL FORMAT ERROR WHEN PANIC fmt_str['{}']\n"
                   "[PANIC]  Exception: '{}'\n",
                   srcloc_to_str(loc), fmt::string_view(fmt_str), e.what());
    }
    catch (...)
    {
        fmt::print(stderr, "[PANIC] {} -- FATAL UNKNOWN EXCEPTION DURING PANIC: fmt_str['{}']\n",
                   srcloc_to_str(loc), fmt::string_view(fmt_str));
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 * Compiled in only when SCENEFIX_ENABLE_DEBUG_MESSAGES is defined (see SFX_DEBUG).
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr,
                   "[DBG]  FATAL FORMAT ERROR DURING DEBUG_MSG: fmt_str['{}']\n"
                   "[DBG]  Exception: '{}'\n",
                   fmt::string_view(fmt_str), e.what());
        std::fflush(stderr);
    }
    catch (...)
    {
        fmt::print(stderr, "[DBG]  FATAL EXCEPTION DURING DEBUG_MSG: fmt_str['{}']\n",
                   fmt::string_view(fmt_str));
        std::fflush(stderr);
    }
}

} // namespace scenefix::debug

#ifndef SFX_PANIC
#define SFX_PANIC(fmt, ...)                                                                        \
    ::scenefix::debug::panic(std::source_location::current(),                                      \
                             FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

#ifndef SFX_DEBUG
#if defined(SCENEFIX_ENABLE_DEBUG_MESSAGES)
#define SFX_DEBUG(fmt, ...) ::scenefix::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define SFX_DEBUG(fmt, ...)                                                                        \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
