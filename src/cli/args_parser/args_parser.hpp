#pragma once

#include <string>
#include <vector>
#include <optional>

namespace antig::args_parser {

struct CLIArgs
{
    std::vector<std::string> sources;       // позиционные аргументы, кроме последнего
    std::string destination;                // последний позиционный аргумент
    bool recursive{false};                  // -r, --recursive
    bool noise{false};                      // --noise
    bool no_progress{false};                // --no-progress
    bool verify{false};                     // --verify
    bool quiet{false};                      // -q, --quiet
    std::optional<std::string> log_level;   // --log-level=LEVEL
    bool version{false};                    // -V, --version
    bool help{false};                       // -h, --help (usage печатается парсером)
};

/// Parses command-line arguments and returns a CLIArgs struct.
/// Returns std::nullopt on a usage error (already reported via spdlog).
std::optional<CLIArgs> parse_args(int argc, char const* const* argv);

} // namespace antig::args_parser
