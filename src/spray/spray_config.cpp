#include "lgs_base.hpp"
#include "spray/spray_config.hpp"

#include <charconv>
#include <stdexcept>
#include <vector>

namespace logspray::spray
{

int parse_non_negative_int(std::string_view text, std::string_view what)
{
    int value = 0;
    const char *const first = text.data();
    const char *const last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec == std::errc::invalid_argument || ptr != last)
    {
        throw std::invalid_argument(fmt::format("{} must be an integer, got '{}'", what, text));
    }
    if (ec == std::errc::result_out_of_range)
    {
        throw std::invalid_argument(fmt::format("{} is out of range: '{}'", what, text));
    }
    if (value < 0)
    {
        throw std::invalid_argument(fmt::format("{} must not be negative, got {}", what, value));
    }
    return value;
}

CommandLine parse_command_line(int argc, const char *const *argv)
{
    CommandLine cmd;
    std::vector<std::string_view> positional;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            cmd.action = CommandAction::ShowHelp;
            return cmd;
        }
        if (arg == "--version")
        {
            cmd.action = CommandAction::ShowVersion;
            return cmd;
        }
        positional.push_back(arg);
    }

    if (positional.size() != 2)
    {
        throw std::invalid_argument(
            fmt::format("expected 2 arguments <worker_count> <lines_per_worker>, got {}",
                        positional.size()));
    }
    cmd.config.worker_count = parse_non_negative_int(positional[0], "worker_count");
    cmd.config.lines_per_worker = parse_non_negative_int(positional[1], "lines_per_worker");
    return cmd;
}

std::string usage_text(std::string_view program_name)
{
    return fmt::format("Usage: {} <worker_count> <lines_per_worker>\n"
                       "\n"
                       "Starts <worker_count> processes. Each writes <lines_per_worker> log\n"
                       "records to stderr, every record holding its pid and a {}-character\n"
                       "random string of A-Z0-9.\n"
                       "\n"
                       "Options:\n"
                       "  -h, --help     show this message and exit\n"
                       "      --version  print the version and exit\n",
                       program_name, kDefaultLineLength);
}

} // namespace logspray::spray
