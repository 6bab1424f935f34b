/*******************************************************************************
 * @file logger.cpp
 * @brief Bounded producer queue and the single writer thread behind Logger.
 ******************************************************************************/
#include "lgs_base.hpp"

#include "utils/logger.hpp"
#include "utils/logger_sinks/console_sink.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace logspray::utils
{

enum class LoggerState
{
    Uninitialized,
    Initialized,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

// Configuration calls before the lifecycle module started are a programming error.
static bool logger_is_usable(const char *function_name)
{
    const auto state = g_logger_state.load(std::memory_order_acquire);
    if (state == LoggerState::Uninitialized)
    {
        LGS_PANIC("Logger method '{}' was called before the Logger module was "
                  "initialized via LifecycleGuard. Aborting.",
                  function_name);
    }
    return state == LoggerState::Initialized;
}

struct Logger::Impl
{
    ConsoleSink sink;
    std::thread writer;

    std::mutex mtx;
    std::condition_variable has_work;
    std::condition_variable has_room;
    std::condition_variable written;
    std::deque<LogRecord> queue;
    // Sequence numbers of records accepted and records handed to the sink.
    uint64_t queued_count = 0;
    uint64_t written_count = 0;
    bool stopping = false;

    std::atomic<size_t> max_queue_size{kDefaultMaxQueueSize};
    std::atomic<Level> level{Level::L_INFO};

    void start()
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            stopping = false;
        }
        writer = std::thread([this] { run(); });
    }

    // Drains everything already queued, then joins the writer.
    void stop()
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            stopping = true;
        }
        has_work.notify_all();
        has_room.notify_all();
        if (writer.joinable())
        {
            writer.join();
        }
    }

    bool push(LogRecord &&record)
    {
        std::unique_lock<std::mutex> lock(mtx);
        has_room.wait(lock, [this] {
            return stopping || queue.size() < max_queue_size.load(std::memory_order_relaxed);
        });
        if (stopping)
        {
            return false;
        }
        queue.push_back(std::move(record));
        ++queued_count;
        lock.unlock();
        has_work.notify_one();
        return true;
    }

    void wait_written()
    {
        std::unique_lock<std::mutex> lock(mtx);
        const uint64_t target = queued_count;
        written.wait(lock, [this, target] { return written_count >= target; });
    }

    void run()
    {
        std::deque<LogRecord> batch;
        for (;;)
        {
            {
                std::unique_lock<std::mutex> lock(mtx);
                has_work.wait(lock, [this] { return stopping || !queue.empty(); });
                if (queue.empty())
                {
                    return; // stopping and drained
                }
                batch.swap(queue);
            }
            has_room.notify_all();

            for (const auto &record : batch)
            {
                try
                {
                    sink.write(record);
                }
                catch (const std::exception &e)
                {
                    std::fputs("[Logger] failed to write a record: ", stderr);
                    std::fputs(e.what(), stderr);
                    std::fputc('\n', stderr);
                }
            }
            sink.flush();

            {
                std::lock_guard<std::mutex> lock(mtx);
                written_count += batch.size();
            }
            written.notify_all();
            batch.clear();
        }
    }
};

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger()
{
    pImpl->stop();
}

Logger &Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::flush()
{
    if (!logger_is_usable("Logger::flush"))
        return;
    pImpl->wait_written();
}

void Logger::set_level(Level lvl)
{
    if (!logger_is_usable("Logger::set_level"))
        return;
    pImpl->level.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    if (!logger_is_usable("Logger::level"))
        return Level::L_INFO;
    return pImpl->level.load(std::memory_order_relaxed);
}

void Logger::set_max_queue_size(size_t max_size)
{
    if (!logger_is_usable("Logger::set_max_queue_size"))
        return;
    pImpl->max_queue_size.store(std::max<size_t>(max_size, 1), std::memory_order_relaxed);
    pImpl->has_room.notify_all();
}

size_t Logger::max_queue_size() const
{
    if (!logger_is_usable("Logger::max_queue_size"))
        return kDefaultMaxQueueSize;
    return pImpl->max_queue_size.load(std::memory_order_relaxed);
}

bool Logger::should_log(Level lvl) const noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    return static_cast<int>(lvl) >=
           static_cast<int>(pImpl->level.load(std::memory_order_relaxed));
}

void Logger::enqueue(Level lvl, const char *function, std::string &&body) noexcept
{
    try
    {
        (void)pImpl->push(LogRecord{std::chrono::system_clock::now(), static_cast<int>(lvl),
                                    function, std::move(body)});
    }
    catch (const std::exception &e)
    {
        std::fputs("[Logger] failed to queue a record: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputc('\n', stderr);
    }
}

void logger_startup()
{
    Logger::instance().pImpl->start();
    g_logger_state.store(LoggerState::Initialized, std::memory_order_release);
}

void logger_shutdown()
{
    LoggerState expected = LoggerState::Initialized;
    if (g_logger_state.compare_exchange_strong(expected, LoggerState::Shutdown,
                                               std::memory_order_acq_rel))
    {
        Logger::instance().pImpl->stop();
    }
}

ModuleDef Logger::GetLifecycleModule()
{
    return ModuleDef{"logspray::utils::Logger", &logger_startup, &logger_shutdown};
}

} // namespace logspray::utils
