#pragma once

#include <chrono>
#include <cstdio>
#include <string>

#include "logspray_utils_export.h"

namespace logspray::utils
{

/// One record as it travels from a producer thread to the writer thread.
struct LogRecord
{
    std::chrono::system_clock::time_point timestamp;
    int level = 0;
    const char *function = nullptr;
    std::string body;
};

/**
 * @brief Writes formatted records to a stdio stream, stderr by default.
 *
 * Each record goes out with a single `fwrite`, so records from concurrent
 * processes sharing the stream interleave only at line boundaries.
 */
class LOGSPRAY_UTILS_EXPORT ConsoleSink
{
  public:
    explicit ConsoleSink(std::FILE *stream = stderr) noexcept : m_stream(stream) {}

    /// "YYYY-MM-DD,HH:MM:SS LEVEL (function): body\n"
    static std::string format_record(const LogRecord &record);
    static const char *level_name(int level) noexcept;

    /// @throws std::system_error if the stream rejects the write.
    void write(const LogRecord &record);
    void flush() noexcept;

  private:
    std::FILE *m_stream;
};

} // namespace logspray::utils
