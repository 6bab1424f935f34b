#include "lgs_service.hpp"
#include "spray/spray_config.hpp"
#include "spray/worker.hpp"

#include <stdexcept>

namespace logspray::spray::worker
{

void run(const WorkerTask &task)
{
    const auto pid = platform::get_pid();
    LineGenerator generator;
    for (int i = 0; i < task.line_count; ++i)
    {
        LOGGER_INFO("{}: {}", pid, generator.next(task.line_length));
    }
    utils::Logger::instance().flush();
}

std::vector<std::string> worker_arguments(const WorkerTask &task)
{
    return {std::to_string(task.line_count), std::to_string(task.line_length)};
}

int dispatch_worker_mode(int argc, char **argv)
{
    if (argc < 2 || std::string_view(argv[1]) != kWorkerMode)
    {
        return -1;
    }

    WorkerTask task;
    try
    {
        if (argc != 4)
        {
            throw std::invalid_argument(
                fmt::format("{} expects <lines> <length>, got {} argument(s)", kWorkerMode,
                            argc - 2));
        }
        task.line_count = parse_non_negative_int(argv[2], "lines");
        task.line_length = parse_non_negative_int(argv[3], "length");
    }
    catch (const std::invalid_argument &e)
    {
        fmt::print(stderr, "{}: error: {}\n", format_tools::filename_only(argv[0]), e.what());
        return kBadArgumentsExitCode;
    }

    utils::LifecycleGuard worker_lifecycle({utils::Logger::GetLifecycleModule()});
    run(task);
    return 0;
}

} // namespace logspray::spray::worker
