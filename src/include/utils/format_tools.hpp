// Timestamp and path helpers shared by the logger and the diagnostics.
#pragma once
#include <chrono>
#include <string>
#include <string_view>

#include "logspray_utils_export.h"

namespace logspray::format_tools
{

/**
 * @brief Formats a system_clock time_point the way log records are stamped.
 * @param timestamp The time_point to format.
 * @return "YYYY-MM-DD,HH:MM:SS" in local time. Sub-second parts are truncated.
 */
LOGSPRAY_UTILS_EXPORT std::string
formatted_log_time(std::chrono::system_clock::time_point timestamp);

/// Last component of a '/' or '\\' separated path.
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto pos = file_path.find_last_of("/\\");
    return pos == std::string_view::npos ? file_path : file_path.substr(pos + 1);
}

} // namespace logspray::format_tools
