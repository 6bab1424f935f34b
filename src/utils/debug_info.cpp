/**
 * @file debug_info.cpp
 * @brief Cross-platform stack trace printing for logspray::debug::print_stack_trace()
 *
 * Macro assumptions:
 * - LOGSPRAY_PLATFORM_WIN64 : defined when building for Windows x64
 * - LOGSPRAY_IS_POSIX       : defined for POSIX-like platforms (Linux, macOS, FreeBSD)
 */
#include "lgs_base.hpp"

#if defined(LOGSPRAY_PLATFORM_WIN64)
#include <windows.h>
#elif defined(LOGSPRAY_IS_POSIX)
#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace
#endif

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

namespace logspray::debug
{

#if defined(LOGSPRAY_IS_POSIX)
namespace
{
// Returns the demangled form of `mangled`, or `mangled` itself if it is not a C++ symbol.
std::string demangle(const char *mangled)
{
    if (mangled == nullptr)
        return "??";
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), &std::free);
    if (status == 0 && demangled)
        return demangled.get();
    return mangled;
}
} // namespace
#endif

void print_stack_trace() noexcept
{
    constexpr int kMaxFrames = 64;
    try
    {
        fmt::print(stderr, "Stack Trace (most recent call first):\n");
#if defined(LOGSPRAY_PLATFORM_WIN64)
        void *frames[kMaxFrames] = {nullptr};
        USHORT captured = CaptureStackBackTrace(0, kMaxFrames, frames, nullptr);
        for (USHORT i = 0; i < captured; ++i)
        {
            fmt::print(stderr, "  #{:<2} {}\n", i, frames[i]);
        }
#elif defined(LOGSPRAY_IS_POSIX)
        void *frames[kMaxFrames] = {nullptr};
        const int captured = ::backtrace(frames, kMaxFrames);
        // Frame 0 is this function.
        for (int i = 1; i < captured; ++i)
        {
            Dl_info info{};
            if (::dladdr(frames[i], &info) != 0 && info.dli_sname != nullptr)
            {
                const auto offset = reinterpret_cast<uintptr_t>(frames[i]) -
                                    reinterpret_cast<uintptr_t>(info.dli_saddr);
                fmt::print(stderr, "  #{:<2} {} + 0x{:x} [{}]\n", i - 1, demangle(info.dli_sname),
                           offset,
                           format_tools::filename_only(info.dli_fname ? info.dli_fname : "??"));
            }
            else
            {
                fmt::print(stderr, "  #{:<2} {} [{}]\n", i - 1, frames[i],
                           info.dli_fname ? format_tools::filename_only(info.dli_fname)
                                          : std::string_view("??"));
            }
        }
#else
        fmt::print(stderr, "  (stack traces are not supported on this platform)\n");
#endif
    }
    catch (const std::exception &e)
    {
        std::fputs("[print_stack_trace] failed while formatting the stack trace: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputc('\n', stderr);
    }
    std::fflush(stderr);
}

} // namespace logspray::debug
