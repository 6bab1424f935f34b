#include "lgs_base.hpp"
#include "spray/worker_process.hpp"

#include <cerrno>
#include <system_error>

#if !defined(LOGSPRAY_PLATFORM_WIN64)
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace logspray::spray
{

namespace
{
#if defined(LOGSPRAY_PLATFORM_WIN64)
std::string quote_argument(const std::string &arg)
{
    return fmt::format("\"{}\"", arg);
}
#endif
} // namespace

WorkerProcess::WorkerProcess(const std::string &exe_path, const std::string &mode,
                             const std::vector<std::string> &args)
{
#if defined(LOGSPRAY_PLATFORM_WIN64)
    std::string cmdline = fmt::format("{} {}", quote_argument(exe_path), quote_argument(mode));
    for (const auto &a : args)
        cmdline += " " + quote_argument(a);
    std::vector<char> cmd_buf(cmdline.begin(), cmdline.end());
    cmd_buf.push_back('\0');

    STARTUPINFOA si{};
    PROCESS_INFORMATION pi{};
    si.cb = sizeof(si);
    if (!CreateProcessA(exe_path.c_str(), cmd_buf.data(), nullptr, nullptr,
                        /*bInheritHandles*/ TRUE, 0, nullptr, nullptr, &si, &pi))
    {
        throw std::system_error(static_cast<int>(GetLastError()), std::system_category(),
                                fmt::format("CreateProcess failed for '{}'", exe_path));
    }
    CloseHandle(pi.hThread);
    handle_ = pi.hProcess;
    pid_ = pi.dwProcessId;
#else
    // Build argv before forking; the child only calls execv and _exit.
    std::vector<char *> argv;
    argv.reserve(args.size() + 3);
    argv.push_back(const_cast<char *>(exe_path.c_str()));
    argv.push_back(const_cast<char *>(mode.c_str()));
    for (const auto &arg : args)
    {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid == -1)
    {
        throw std::system_error(errno, std::generic_category(),
                                fmt::format("fork failed while starting '{}'", exe_path));
    }
    if (pid == 0)
    {
        ::execv(exe_path.c_str(), argv.data());
        ::_exit(kExecFailedExitCode);
    }
    handle_ = pid;
    pid_ = static_cast<uint64_t>(pid);
#endif
    LGS_DEBUG("WorkerProcess: started '{} {}' as pid {}", exe_path, mode, pid_);
}

WorkerProcess::~WorkerProcess()
{
    if (handle_ != NULL_PROC_HANDLE && !waited_)
    {
        wait_for_exit();
    }
}

int WorkerProcess::wait_for_exit()
{
    if (waited_ || handle_ == NULL_PROC_HANDLE)
        return exit_code_;

#if defined(LOGSPRAY_PLATFORM_WIN64)
    DWORD exit_code = static_cast<DWORD>(-1);
    if (WaitForSingleObject(handle_, INFINITE) != WAIT_FAILED)
    {
        GetExitCodeProcess(handle_, &exit_code);
    }
    CloseHandle(handle_);
    exit_code_ = static_cast<int>(exit_code);
#else
    int status = 0;
    pid_t rc = -1;
    do
    {
        rc = ::waitpid(handle_, &status, 0);
    } while (rc == -1 && errno == EINTR);

    if (rc == -1)
    {
        exit_code_ = -1;
    }
    else if (WIFEXITED(status))
    {
        exit_code_ = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status))
    {
        term_signal_ = WTERMSIG(status);
        exit_code_ = 128 + term_signal_;
    }
#endif
    waited_ = true;
    handle_ = NULL_PROC_HANDLE;
    return exit_code_;
}

std::string WorkerProcess::describe_exit() const
{
    if (!waited_)
        return "still running";
    if (term_signal_ != 0)
        return fmt::format("was killed by signal {}", term_signal_);
    if (exit_code_ == kExecFailedExitCode)
        return fmt::format("exited with status {} (could not execute worker binary)", exit_code_);
    return fmt::format("exited with status {}", exit_code_);
}

} // namespace logspray::spray
