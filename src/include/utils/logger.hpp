/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe, process-wide logger.
 *
 * Application threads format a record and push it onto a bounded queue. A
 * single writer thread is the sole consumer: it formats the record line and
 * hands it to the `ConsoleSink`, so API threads never touch the stream.
 *
 * The queue holds at most `max_queue_size()` records. A producer that finds it
 * full waits for room, so no record is ever lost.
 *
 * Every record carries the name of the function that emitted it:
 *
 * ```
 * 2024-05-01,12:00:03 INFO (run): 4711: Q0Z...
 * ```
 *
 * **Lifecycle**
 *
 * The logger is a lifecycle module. Pass `Logger::GetLifecycleModule()` to a
 * `LifecycleGuard` before logging. Configuration calls made before the module
 * is started abort the process; log calls made before start or after shutdown
 * are ignored.
 *
 * ```cpp
 * logspray::utils::LifecycleGuard guard({logspray::utils::Logger::GetLifecycleModule()});
 * LOGGER_INFO("spawned {} workers", count);
 * ```
 ******************************************************************************/
#pragma once

#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "logspray_utils_export.h"
#include "utils/lifecycle.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace logspray::utils
{

class LOGSPRAY_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
    };

    static constexpr size_t kDefaultMaxQueueSize = 10000;

    static Logger &instance();

    /// Starts the writer thread on startup; drains the queue and joins it on shutdown.
    static ModuleDef GetLifecycleModule();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    /// Blocks until every record queued before the call has been written and the stream flushed.
    void flush();

    void set_level(Level lvl);
    Level level() const;

    /// Values below 1 are raised to 1.
    void set_max_queue_size(size_t max_size);
    size_t max_queue_size() const;

    template <Level lvl, typename... Args>
    void log_fmt(const char *function, fmt::format_string<Args...> fmt_str,
                 Args &&...args) noexcept;

  private:
    Logger();

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    friend void logger_startup();
    friend void logger_shutdown();

    bool should_log(Level lvl) const noexcept;
    void enqueue(Level lvl, const char *function, std::string &&body) noexcept;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(const char *function, fmt::format_string<Args...> fmt_str,
                     Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        std::string body;
        try
        {
            body = fmt::format(fmt_str, std::forward<Args>(args)...);
        }
        catch (const std::exception &ex)
        {
            body = std::string("[FORMAT ERROR] ") + ex.what();
        }
        enqueue(lvl, function, std::move(body));
    }
}

} // namespace logspray::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

#define LGS_LOGGER_LOG_(lvl, fmt, ...)                                                             \
    ::logspray::utils::Logger::instance().log_fmt<::logspray::utils::Logger::Level::lvl>(          \
        __func__, FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_TRACE(fmt, ...) LGS_LOGGER_LOG_(L_TRACE, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...) LGS_LOGGER_LOG_(L_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...) LGS_LOGGER_LOG_(L_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...) LGS_LOGGER_LOG_(L_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...) LGS_LOGGER_LOG_(L_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
