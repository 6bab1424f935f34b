// format_tools.cpp
#include "lgs_base.hpp"

#include <ctime>

namespace logspray::format_tools
{

// fmt::localtime goes through localtime_r / localtime_s and throws on failure.
std::string formatted_log_time(std::chrono::system_clock::time_point timestamp)
{
    return fmt::format("{:%Y-%m-%d,%H:%M:%S}",
                       fmt::localtime(std::chrono::system_clock::to_time_t(timestamp)));
}

} // namespace logspray::format_tools
