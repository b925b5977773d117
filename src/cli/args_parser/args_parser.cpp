#include "args_parser.hpp"

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <git_info.hpp>

namespace pcopy::args_parser {

std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code)
{
    exit_code = 0;
    CLIArgs args;

    CLI::App app{"pcopy - parallel file and directory copy with live progress"};
    app.set_version_flag("--version", [] {
        constexpr auto git = pcopy::build_info::get_git_info();
        return fmt::format("pcopy {} ({}{}, built {})",
                           git.branch, git.commit_short, git.dirty ? "-dirty" : "", git.timestamp);
    });

    app.add_option("source", args.source, "File or directory to copy")
        ->required();
    app.add_option("destination", args.destination, "Target file or directory")
        ->required();

    app.add_option("-j,--threads", args.threads, "Maximum number of concurrent workers")
        ->check(CLI::PositiveNumber);
    app.add_option("--buffer-size", args.buffer_size, "Read/write chunk size in bytes")
        ->check(CLI::PositiveNumber);
    app.add_option("--path-width", args.path_width, "Maximum displayed path width")
        ->check(CLI::Range(4, 4096));
    app.add_option("--refresh-ms", args.refresh_ms, "Progress redraw interval in milliseconds")
        ->check(CLI::PositiveNumber);

    app.add_flag("--no-progress", args.no_progress, "Disable the live progress display");
    auto* quiet = app.add_flag("-q,--quiet", args.quiet, "Only print warnings and errors");
    app.add_flag("-v,--verbose", args.verbose, "Enable debug logging")->excludes(quiet);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit_code = app.exit(e);
        return std::nullopt;
    }

    return args;
}

std::optional<CLIArgs> parse_args(int argc, char const* const* argv)
{
    int ignored = 0;
    return parse_args(argc, argv, ignored);
}

} // namespace pcopy::args_parser
