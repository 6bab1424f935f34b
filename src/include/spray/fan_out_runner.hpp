#pragma once
/**
 * @file fan_out_runner.hpp
 * @brief Starts the configured number of worker processes and waits for all of them.
 */
#include <vector>

#include "spray/spray_config.hpp"

namespace logspray::spray
{

struct RunSummary
{
    int spawned = 0;
    int succeeded = 0;
    /// One entry per worker, in spawn order.
    std::vector<int> exit_codes;
};

class FanOutRunner
{
  public:
    explicit FanOutRunner(SprayConfig config);

    /**
     * @brief Spawns `worker_count` workers, then joins them in spawn order.
     *
     * A worker that exits non-zero or is killed is reported with one WARNING
     * record; it is neither retried nor allowed to affect its siblings.
     *
     * @throws std::system_error if a worker cannot be spawned, or if no
     *         `executable_path` is configured and the running executable cannot be
     *         resolved. Workers already started are joined before the exception leaves.
     */
    RunSummary run();

    const SprayConfig &config() const { return m_config; }

  private:
    SprayConfig m_config;
};

} // namespace logspray::spray
