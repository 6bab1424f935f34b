#pragma once
/**
 * @file worker.hpp
 * @brief Body of a spawned worker process.
 *
 * A worker is the logspray binary re-executed as
 * `logspray spray.worker <lines> <length>`. It starts its own lifecycle (the
 * child is a fresh image, nothing is inherited from the parent's logger), logs
 * its quota of random lines and exits.
 */
#include <string>
#include <string_view>
#include <vector>

#include "spray/line_generator.hpp"

namespace logspray::spray::worker
{

/// argv[1] value that selects worker mode.
inline constexpr std::string_view kWorkerMode = "spray.worker";

/// Exit code for malformed worker-mode arguments.
inline constexpr int kBadArgumentsExitCode = 2;

struct WorkerTask
{
    int line_count = 0;
    int line_length = kDefaultLineLength;
};

/**
 * @brief Logs `task.line_count` INFO records of the form "<pid>: <random line>".
 *
 * The Logger module must already be started. Returns after the records have been
 * flushed to the sink.
 */
void run(const WorkerTask &task);

/// Arguments following the mode string for a worker running `task`.
std::vector<std::string> worker_arguments(const WorkerTask &task);

/**
 * @brief Runs the worker if `argv[1]` selects worker mode.
 * @return -1 if `argv[1]` is not a worker mode, kBadArgumentsExitCode for malformed
 *         arguments, otherwise the worker's exit code.
 */
int dispatch_worker_mode(int argc, char **argv);

} // namespace logspray::spray::worker
