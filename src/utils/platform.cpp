/**
 * @file platform.cpp
 * @brief Process identity queries for each supported operating system.
 */
#include "lgs_platform.hpp"
#include "logspray_version.h"

#include <cerrno>
#include <string>
#include <system_error>
#include <vector>

#if defined(LOGSPRAY_IS_POSIX)
#include <climits> // PATH_MAX
#include <cstdlib> // realpath
#include <unistd.h>
#endif

#if defined(LOGSPRAY_PLATFORM_APPLE)
#include <mach-o/dyld.h>
#elif defined(LOGSPRAY_PLATFORM_FREEBSD)
#include <sys/sysctl.h>
#include <sys/types.h>
#endif

namespace logspray::platform
{

namespace
{
[[noreturn]] void throw_path_error(int code, const char *source)
{
    throw std::system_error(code, std::system_category(),
                            std::string("cannot resolve the running executable via ") + source);
}
} // namespace

uint64_t get_pid() noexcept
{
#if defined(LOGSPRAY_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentProcessId());
#else
    return static_cast<uint64_t>(::getpid());
#endif
}

std::string executable_path()
{
#if defined(LOGSPRAY_PLATFORM_WIN64)
    std::vector<char> buf(MAX_PATH);
    for (;;)
    {
        const DWORD len =
            ::GetModuleFileNameA(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
        if (len == 0)
        {
            throw_path_error(static_cast<int>(::GetLastError()), "GetModuleFileNameA");
        }
        // A full buffer means the name was truncated.
        if (len < buf.size())
        {
            return std::string(buf.data(), len);
        }
        buf.resize(buf.size() * 2);
    }
#elif defined(LOGSPRAY_PLATFORM_LINUX)
    std::vector<char> buf(PATH_MAX);
    for (;;)
    {
        const ssize_t len = ::readlink("/proc/self/exe", buf.data(), buf.size());
        if (len < 0)
        {
            throw_path_error(errno, "readlink(/proc/self/exe)");
        }
        if (static_cast<size_t>(len) < buf.size())
        {
            return std::string(buf.data(), static_cast<size_t>(len));
        }
        buf.resize(buf.size() * 2);
    }
#elif defined(LOGSPRAY_PLATFORM_APPLE)
    uint32_t size = 0;
    (void)::_NSGetExecutablePath(nullptr, &size); // reports the required size
    std::vector<char> buf(size + 1);
    if (::_NSGetExecutablePath(buf.data(), &size) != 0)
    {
        throw_path_error(ENAMETOOLONG, "_NSGetExecutablePath");
    }
    char resolved[PATH_MAX];
    if (::realpath(buf.data(), resolved) == nullptr)
    {
        throw_path_error(errno, "realpath");
    }
    return resolved;
#elif defined(LOGSPRAY_PLATFORM_FREEBSD)
    int mib[4] = {CTL_KERN, KERN_PROC, KERN_PROC_PATHNAME, -1};
    size_t size = 0;
    if (::sysctl(mib, 4, nullptr, &size, nullptr, 0) != 0)
    {
        throw_path_error(errno, "sysctl(KERN_PROC_PATHNAME)");
    }
    std::vector<char> buf(size);
    if (::sysctl(mib, 4, buf.data(), &size, nullptr, 0) != 0)
    {
        throw_path_error(errno, "sysctl(KERN_PROC_PATHNAME)");
    }
    return std::string(buf.data());
#else
    throw_path_error(ENOSYS, "an unsupported platform");
#endif
}

const char *version_string() noexcept
{
    return LOGSPRAY_VERSION_STRING;
}

} // namespace logspray::platform
