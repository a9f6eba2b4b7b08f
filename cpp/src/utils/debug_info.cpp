/**
 * @file debug_info.cpp
 * @brief Stack trace printing for treespec::debug::print_stack_trace().
 *
 * POSIX builds resolve frames with `backtrace`, `dladdr` and
 * `abi::__cxa_demangle`. Other platforms print a single notice line.
 */
#include "tsp_base.hpp"

#if defined(TREESPEC_IS_POSIX)
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace, backtrace_symbols
#endif

namespace treespec::debug
{

namespace
{
// Writes to stderr without letting a formatting failure escape.
template <typename... Args>
void safe_format_to_stderr(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, fmt_str, std::forward<Args>(args)...);
    }
    catch (const std::exception &)
    {
        std::fputs("[stack trace: format error]\n", stderr);
    }
}
} // namespace

void print_stack_trace() noexcept
{
#if defined(TREESPEC_IS_POSIX)
    constexpr int kMaxFrames = 128;
    void *callstack[kMaxFrames];
    int nframes = backtrace(callstack, kMaxFrames);
    if (nframes <= 0)
    {
        safe_format_to_stderr("  [No stack frames available]\n");
        return;
    }

    char **symbols = backtrace_symbols(callstack, nframes);
    safe_format_to_stderr("Stack Trace (most recent call first):\n");
    for (int i = 0; i < nframes; ++i)
    {
        const auto addr = reinterpret_cast<uintptr_t>(callstack[i]);
        safe_format_to_stderr("  #{:02}  {:#018x}  ", i, static_cast<unsigned long long>(addr));

        Dl_info dlinfo;
        if (dladdr(callstack[i], &dlinfo) && dlinfo.dli_sname)
        {
            int status = 0;
            char *dem = abi::__cxa_demangle(dlinfo.dli_sname, nullptr, nullptr, &status);
            const char *name = (status == 0 && dem) ? dem : dlinfo.dli_sname;
            const auto saddr = reinterpret_cast<uintptr_t>(dlinfo.dli_saddr);
            safe_format_to_stderr("{} + {:#x}", name, static_cast<unsigned long long>(addr - saddr));
            std::free(dem);
        }
        else if (symbols && symbols[i])
        {
            safe_format_to_stderr("{}", symbols[i]);
        }
        else
        {
            safe_format_to_stderr("[unknown]");
        }
        safe_format_to_stderr("\n");
    }
    std::free(symbols);
#else
    safe_format_to_stderr("  [Stack trace not supported on this platform]\n");
#endif
    std::fflush(stderr);
}

} // namespace treespec::debug
