#include "lgs_spray.hpp"

#include <cstdio>
#include <exception>

using namespace logspray;

int main(int argc, char *argv[])
{
    // Re-executed as a worker by FanOutRunner.
    if (const int worker_rc = spray::worker::dispatch_worker_mode(argc, argv); worker_rc != -1)
    {
        return worker_rc;
    }

    const std::string program(
        format_tools::filename_only(argc > 0 && argv[0] != nullptr ? argv[0] : "logspray"));
    spray::CommandLine cmd;
    try
    {
        cmd = spray::parse_command_line(argc, argv);
    }
    catch (const std::invalid_argument &e)
    {
        fmt::print(stderr, "{}: error: {}\n\n{}", program, e.what(), spray::usage_text(program));
        return 1;
    }

    switch (cmd.action)
    {
    case spray::CommandAction::ShowHelp:
        fmt::print(stdout, "{}", spray::usage_text(program));
        return 0;
    case spray::CommandAction::ShowVersion:
        fmt::print(stdout, "{} {}\n", program, platform::version_string());
        return 0;
    case spray::CommandAction::Run:
        break;
    }

    utils::LifecycleGuard app_lifecycle({utils::Logger::GetLifecycleModule()});

    try
    {
        spray::FanOutRunner runner(cmd.config);
        const auto summary = runner.run();
        LOGGER_DEBUG("{} of {} workers exited cleanly", summary.succeeded, summary.spawned);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("{}", e.what());
        return 1;
    }
    return 0;
}
