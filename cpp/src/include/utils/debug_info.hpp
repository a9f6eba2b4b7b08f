/**
 * @file debug_info.hpp
 * @brief Debugging utilities: stack trace printing and panic handling for
 *        fatal internal errors.
 *
 * Functions live in the `treespec::debug` namespace. They use `fmt` for
 * compile-time format string checks and `std::source_location` for automatic
 * source location reporting.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "treespec_export.h"
#include "utils/format_tools.hpp"

namespace treespec::debug
{

/**
 * @brief Prints the current call stack to `stderr`.
 *
 * On POSIX systems uses `backtrace` and `dladdr` with C++ symbol demangling.
 * Errors during capture are reported to `stderr`; the function never throws.
 */
TREESPEC_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Formats `file:line:function` for a source location.
 */
inline std::string srcloc_to_str(const std::source_location &loc)
{
    return fmt::format("{}:{}:{}", format_tools::filename_only(loc.file_name()), loc.line(),
                       loc.function_name());
}

/**
 * @brief Halts program execution with a fatal error message and a stack trace.
 *
 * Reserved for broken internal invariants that cannot be reported through an
 * exception. Engine contract violations are exceptions, never panics.
 *
 * @param loc The source location where `panic` was called (see `TSP_PANIC`).
 * @param fmt_str The `fmt`-style format string for the error message.
 * @param args The arguments to be formatted into `fmt_str`.
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
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[PANIC] FATAL ERROR WHILE FORMATTING PANIC MESSAGE: %s\n", e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

} // namespace treespec::debug

/**
 * @brief Calls `treespec::debug::panic` with the current source location.
 * @param fmt The `fmt`-style format string literal.
 */
#ifndef TSP_PANIC
#define TSP_PANIC(fmt, ...)                                                                        \
    ::treespec::debug::panic(std::source_location::current(),                                      \
                             FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif
