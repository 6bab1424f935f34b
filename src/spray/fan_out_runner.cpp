#include "lgs_service.hpp"
#include "spray/fan_out_runner.hpp"
#include "spray/worker.hpp"
#include "spray/worker_process.hpp"

#include <memory>

namespace logspray::spray
{

FanOutRunner::FanOutRunner(SprayConfig config) : m_config(std::move(config)) {}

RunSummary FanOutRunner::run()
{
    RunSummary summary;
    if (m_config.worker_count <= 0)
    {
        return summary;
    }

    const std::string exe_path = m_config.executable_path.empty()
                                     ? platform::executable_path()
                                     : m_config.executable_path;
    const std::string mode(worker::kWorkerMode);
    const auto args = worker::worker_arguments(
        worker::WorkerTask{.line_count = m_config.lines_per_worker,
                           .line_length = m_config.line_length});

    // Destroying a WorkerProcess joins it, so an exception below still reaps every child.
    std::vector<std::unique_ptr<WorkerProcess>> workers;
    workers.reserve(static_cast<size_t>(m_config.worker_count));
    for (int i = 0; i < m_config.worker_count; ++i)
    {
        workers.push_back(std::make_unique<WorkerProcess>(exe_path, mode, args));
        LOGGER_DEBUG("spawned worker {}/{} as pid {}", i + 1, m_config.worker_count,
                     workers.back()->pid());
    }
    summary.spawned = static_cast<int>(workers.size());

    for (size_t i = 0; i < workers.size(); ++i)
    {
        const int exit_code = workers[i]->wait_for_exit();
        summary.exit_codes.push_back(exit_code);
        if (exit_code == 0)
        {
            ++summary.succeeded;
            LOGGER_DEBUG("worker {} (pid {}) finished", i + 1, workers[i]->pid());
        }
        else
        {
            LOGGER_WARN("worker {} (pid {}) {}", i + 1, workers[i]->pid(),
                        workers[i]->describe_exit());
        }
    }
    return summary;
}

} // namespace logspray::spray
