#include "lgs_base.hpp"

#include "utils/logger_sinks/console_sink.hpp"

#include <cerrno>
#include <system_error>

namespace logspray::utils
{

const char *ConsoleSink::level_name(int level) noexcept
{
    switch (level)
    {
    case 0:
        return "TRACE";
    case 1:
        return "DEBUG";
    case 2:
        return "INFO";
    case 3:
        return "WARNING";
    case 4:
        return "ERROR";
    default:
        return "UNK";
    }
}

std::string ConsoleSink::format_record(const LogRecord &record)
{
    return fmt::format("{} {} ({}): {}\n", format_tools::formatted_log_time(record.timestamp),
                       level_name(record.level),
                       record.function != nullptr ? record.function : "?", record.body);
}

void ConsoleSink::write(const LogRecord &record)
{
    const std::string line = format_record(record);
    if (std::fwrite(line.data(), 1, line.size(), m_stream) != line.size())
    {
        throw std::system_error(errno, std::generic_category(), "ConsoleSink: short write");
    }
}

void ConsoleSink::flush() noexcept
{
    std::fflush(m_stream);
}

} // namespace logspray::utils
