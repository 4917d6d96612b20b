#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace voyage::app {

// Parsed command line for voyage_weather.
//
//   voyage_weather [options] <command> [args...]
//
// Notes:
//   - Option names are case-insensitive; values and command arguments are kept as typed.
//   - Both "--opt value" and "--opt=value" / "--opt:value" are supported.
//   - Options may appear before or after the command.
struct CommandLineArgs
{
    bool showHelp = false;                      // --help / -h / -?

    std::optional<std::string>   configDir;     // --config <dir>   (voyage.ini location)
    std::optional<std::string>   dataDir;       // --data <dir>
    std::optional<std::string>   logDir;        // --log-dir <dir>
    std::optional<std::string>   logLevel;      // --log-level <level>
    std::optional<std::string>   journey;       // --journey <key>
    std::optional<std::uint64_t> seed;          // --seed <N>

    std::optional<int>           stageDays;     // --stage-days <1..10>  (start / configure)
    std::optional<std::string>   display;       // --display simple|detailed

    std::string              command;           // first non-option argument
    std::vector<std::string> positional;        // everything after the command

    // Unknown options and options with bad or missing values, in order seen.
    std::vector<std::string> unknown;
};

// argv[0] is the program name and is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, char** argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace voyage::app
