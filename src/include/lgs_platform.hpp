#pragma once
/**
 * @file lgs_platform.hpp
 * @brief Layer 0: platform detection and process identity.
 *
 * Defines one `LOGSPRAY_PLATFORM_*` macro for the target OS, plus
 * `LOGSPRAY_IS_POSIX` for every non-Windows target. Windows headers are pulled
 * in here so that no other file has to repeat the lean-and-mean dance.
 */
#include <cstdint>
#include <string>

#if defined(_WIN32)
#define LOGSPRAY_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#define LOGSPRAY_IS_POSIX 1
#if defined(__APPLE__) && defined(__MACH__)
#define LOGSPRAY_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define LOGSPRAY_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define LOGSPRAY_PLATFORM_LINUX 1
#endif
#endif

#include "logspray_utils_export.h"

namespace logspray::platform
{

/// Process id of the calling process.
LOGSPRAY_UTILS_EXPORT uint64_t get_pid() noexcept;

/**
 * @brief Absolute path of the running executable.
 *
 * The fan-out runner re-executes this path to start its workers, so a path that
 * cannot be determined is an error rather than a placeholder name.
 *
 * @throws std::system_error if the operating system cannot report the path.
 */
LOGSPRAY_UTILS_EXPORT std::string executable_path();

/// Version of this build, "major.minor.patch".
LOGSPRAY_UTILS_EXPORT const char *version_string() noexcept;

} // namespace logspray::platform
