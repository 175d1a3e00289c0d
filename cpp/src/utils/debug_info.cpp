/**
 * @file debug_info.cpp
 * @brief Stack trace printing and symbol demangling.
 *
 * Frames are captured with `backtrace` and resolved in-process with `dladdr` and
 * `abi::__cxa_demangle`; no external tools are invoked.
 */
#include "zw_base.hpp"

#include <cstdint>
#include <cstdlib>
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace, backtrace_symbols

namespace zworkers::debug
{

namespace // anonymous namespace
{
// Format into a fixed stack buffer so that a low-memory crash can still print frames.
// Output longer than the buffer is truncated. Returns false on formatting error.
template <typename... Args>
inline bool safe_format_to_stderr(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        constexpr std::size_t STACK_BUF_SZ = 2048;
        char stack_buf[STACK_BUF_SZ];
        auto result =
            fmt::format_to_n(stack_buf, STACK_BUF_SZ, fmt_str, std::forward<Args>(args)...);
        const std::size_t needed = static_cast<std::size_t>(result.size);
        const std::size_t have = needed < STACK_BUF_SZ ? needed : STACK_BUF_SZ;
        if (have > 0)
        {
            std::fwrite(stack_buf, 1, have, stderr);
        }
        return true;
    }
    catch (const std::exception &)
    {
        return false;
    }
}

} // namespace

std::string demangle(const char *mangled)
{
    if (mangled == nullptr)
    {
        return {};
    }
    int status = 0;
    char *dem = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
    if (status == 0 && dem != nullptr)
    {
        std::string out(dem);
        std::free(dem);
        return out;
    }
    std::free(dem);
    return std::string(mangled);
}

void print_stack_trace() noexcept
{
    try
    {
        constexpr int kMaxFrames = 200;
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
            if (dladdr(callstack[i], &dlinfo) != 0 && dlinfo.dli_sname != nullptr)
            {
                const auto saddr = reinterpret_cast<uintptr_t>(dlinfo.dli_saddr);
                safe_format_to_stderr("{} + {:#x}", demangle(dlinfo.dli_sname),
                                      static_cast<unsigned long long>(addr - saddr));
            }
            else if (symbols != nullptr && symbols[i] != nullptr)
            {
                safe_format_to_stderr("{}", symbols[i]);
            }
            else if (dladdr(callstack[i], &dlinfo) != 0 && dlinfo.dli_fname != nullptr)
            {
                const auto base = reinterpret_cast<uintptr_t>(dlinfo.dli_fbase);
                safe_format_to_stderr("({}) + {:#x}", dlinfo.dli_fname,
                                      static_cast<unsigned long long>(addr - base));
            }
            else
            {
                safe_format_to_stderr("[unknown]");
            }
            safe_format_to_stderr("\n");
        }
        std::free(symbols);
        std::fflush(stderr);
    }
    catch (const std::bad_alloc &)
    {
        std::fputs("Error: Stack trace generation failed with std::bad_alloc.\n", stderr);
        std::fflush(stderr);
    }
    catch (const std::exception &e)
    {
        std::fputs("Error: Stack trace generation failed: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputs("\n", stderr);
        std::fflush(stderr);
    }
}

} // namespace zworkers::debug
