#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace pcopy::args_parser {

struct CLIArgs
{
    std::string source;                       // SOURCE (позиционный)
    std::string destination;                  // DESTINATION (позиционный)
    bool no_progress{false};                  // --no-progress
    bool quiet{false};                        // -q, --quiet
    bool verbose{false};                      // -v, --verbose
    std::optional<std::uint32_t> threads;     // -j, --threads=N
    std::optional<std::size_t> buffer_size;   // --buffer-size=BYTES
    std::optional<std::size_t> path_width;    // --path-width=N
    std::optional<std::int64_t> refresh_ms;   // --refresh-ms=N
};

/// Parses command-line arguments and returns a CLIArgs struct.
/// Returns std::nullopt after printing help, version or a usage error.
std::optional<CLIArgs> parse_args(int argc, char const* const* argv);

/// Same as parse_args, but reports the CLI11 exit code for --help/--version (0)
/// and usage errors (non-zero).
std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code);

} // namespace pcopy::args_parser
