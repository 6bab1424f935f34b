#pragma once
/**
 * @file spray_config.hpp
 * @brief Run configuration and command line parsing for the logspray tool.
 *
 * Usage: `logspray <worker_count> <lines_per_worker>`
 */
#include <string>
#include <string_view>

#include "spray/line_generator.hpp"

namespace logspray::spray
{

struct SprayConfig
{
    int worker_count = 0;
    int lines_per_worker = 0;
    int line_length = kDefaultLineLength;
    /// Binary re-executed in worker mode. Empty means the running executable.
    std::string executable_path;
};

enum class CommandAction
{
    Run,
    ShowHelp,
    ShowVersion
};

struct CommandLine
{
    CommandAction action = CommandAction::Run;
    SprayConfig config;
};

/**
 * @brief Parses `argv` into a CommandLine.
 *
 * Exactly two fully numeric, non-negative integers are accepted. `--help`/`-h` and
 * `--version` anywhere on the line select the matching action instead.
 *
 * @throws std::invalid_argument for a missing, extra, non-numeric, negative or
 *         out-of-range argument.
 */
CommandLine parse_command_line(int argc, const char *const *argv);

/**
 * @brief Parses a whole decimal string into a non-negative int.
 * @param what Name of the value, used in the error message.
 * @throws std::invalid_argument if `text` is not a non-negative int.
 */
int parse_non_negative_int(std::string_view text, std::string_view what);

std::string usage_text(std::string_view program_name);

} // namespace logspray::spray
