#pragma once
/**
 * @file worker_process.hpp
 * @brief RAII handle for a child process re-executing a binary in a worker mode.
 *
 * The child inherits the parent's stdout and stderr, so whatever it logs lands
 * on the same streams as the parent's output.
 */
#include "lgs_platform.hpp"

#include <string>
#include <vector>

#if defined(LOGSPRAY_PLATFORM_WIN64)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#else
#include <sys/types.h>
#endif

namespace logspray::spray
{

#if defined(LOGSPRAY_PLATFORM_WIN64)
using ProcessHandle = HANDLE;
inline const HANDLE NULL_PROC_HANDLE = nullptr;
#else
using ProcessHandle = pid_t;
inline constexpr pid_t NULL_PROC_HANDLE = 0;
#endif

/// Exit code reported when the child could not exec the worker binary.
inline constexpr int kExecFailedExitCode = 127;

class WorkerProcess
{
  public:
    /**
     * @brief Starts `exe_path mode args...` as a child process.
     * @throws std::system_error if the process cannot be created.
     */
    WorkerProcess(const std::string &exe_path, const std::string &mode,
                  const std::vector<std::string> &args);

    /// Waits for the child if `wait_for_exit()` was not called.
    ~WorkerProcess();

    WorkerProcess(const WorkerProcess &) = delete;
    WorkerProcess &operator=(const WorkerProcess &) = delete;
    WorkerProcess(WorkerProcess &&) = delete;
    WorkerProcess &operator=(WorkerProcess &&) = delete;

    /**
     * @brief Blocks until the child terminates.
     * @return The exit status, or 128 + signal number if it was killed by a signal.
     *         Repeated calls return the same value.
     */
    int wait_for_exit();

    int exit_code() const { return exit_code_; }
    /// Signal that terminated the child, 0 if it exited normally.
    int term_signal() const { return term_signal_; }
    uint64_t pid() const { return pid_; }
    bool waited() const { return waited_; }

    /// Human readable exit description, e.g. "exited with status 3".
    std::string describe_exit() const;

  private:
    ProcessHandle handle_ = NULL_PROC_HANDLE;
    uint64_t pid_ = 0;
    int exit_code_ = -1;
    int term_signal_ = 0;
    bool waited_ = false;
};

} // namespace logspray::spray
