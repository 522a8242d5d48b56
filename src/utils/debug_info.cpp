/**
 * @file debug_info.cpp
 * @brief Stack trace printing for SFX_PANIC.
 */
#include "sfx_base.hpp"

#include <cstdint>
#include <new>

#if defined(SCENEFIX_IS_POSIX)
#include <cxxabi.h>   // abi::__cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace, backtrace_symbols
#endif

namespace scenefix::debug
{

namespace
{
template <typename... Args>
void safe_format_to_stderr(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, fmt_str, std::forward<Args>(args)...);
    }
    catch (...)
    {
        std::fputs("  [stack trace formatting failed]\n", stderr);
    }
}

#if defined(SCENEFIX_IS_POSIX)
std::string demangle_symbol(const char *mangled)
{
    int status = 0;
    char *dem = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
    if (status == 0 && dem != nullptr)
    {
        std::string out(dem);
        std::free(dem);
        return out;
    }
    return mangled;
}
#endif
} // namespace

void print_stack_trace() noexcept
{
    try
    {
        safe_format_to_stderr("Stack Trace (most recent call first):\n");
#if defined(SCENEFIX_IS_POSIX)
        constexpr int kMaxFrames = 64;
        void *callstack[kMaxFrames];
        const int nframes = backtrace(callstack, kMaxFrames);
        if (nframes <= 0)
        {
            safe_format_to_stderr("  [No stack frames available]\n");
            return;
        }

        // Frame 0 is print_stack_trace itself.
        for (int i = 1; i < nframes; ++i)
        {
            Dl_info dlinfo{};
            const auto addr = reinterpret_cast<uintptr_t>(callstack[i]);
            if (dladdr(callstack[i], &dlinfo) != 0 && dlinfo.dli_sname != nullptr)
            {
                const auto base = reinterpret_cast<uintptr_t>(dlinfo.dli_saddr);
                safe_format_to_stderr("  #{:02} {} + 0x{:x} [{}]\n", i,
                                      demangle_symbol(dlinfo.dli_sname), addr - base,
                                      dlinfo.dli_fname != nullptr ? dlinfo.dli_fname : "?");
            }
            else
            {
                safe_format_to_stderr("  #{:02} 0x{:x} [{}]\n", i, addr,
                                      (dlinfo.dli_fname != nullptr) ? dlinfo.dli_fname : "?");
            }
        }
#else
        safe_format_to_stderr("  [Stack trace not available on this platform]\n");
#endif
        std::fflush(stderr);
    }
    catch (const std::bad_alloc &)
    {
        std::fputs("Error: Stack trace generation failed with std::bad_alloc.\n", stderr);
        std::fflush(stderr);
    }
    catch (...)
    {
        std::fputs("Error: Stack trace generation failed with unknown error.\n", stderr);
        std::fflush(stderr);
    }
}

} // namespace scenefix::debug
