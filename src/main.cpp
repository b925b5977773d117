#include <chrono>
#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/error_handler/log_reporter.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "infra/monitoring/renderer.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/copy_engine/copy_engine.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>

using GIT = pcopy::build_info::GitInfo;
using REPORT = pcopy::core::CopyReport;

constexpr auto git = pcopy::build_info::get_git_info();

static auto
__out_git_verse(const GIT& git)
-> void {
    spdlog::debug("Git branch: {}", git.branch);
    spdlog::debug("Git commit: {}{}", git.commit_short, git.dirty ? " (dirty)" : "");
    spdlog::debug("Build timestamp (UTC): {}", git.timestamp);
}

static auto
__out_summary(const REPORT& report)
-> void {
    const auto seconds = std::chrono::duration<double>(report.elapsed).count();

    spdlog::info("Items attempted: {}", report.attempted);
    spdlog::info("Succeeded: {}", report.succeeded);
    spdlog::info("Failed: {}", report.failed());
    if (report.abandoned > 0) {
        spdlog::info("Abandoned: {}", report.abandoned);
    }
    spdlog::info("Bytes copied: {} ({})", report.bytes_copied,
                 pcopy::infra::format_bytes(static_cast<double>(report.bytes_copied)));
    spdlog::info("Time elapsed: {:.2f} seconds", seconds);
    if (report.bytes_copied > 0 && seconds > 0.0) {
        spdlog::info("Average speed: {}/s",
                     pcopy::infra::format_bytes(static_cast<double>(report.bytes_copied) / seconds));
    }

    for (const auto& failure : report.failures) {
        spdlog::error("  {}: {} ({})", failure.path.string(), failure.message, failure.error_kind);
    }
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        pcopy::infra::install_signal_handler();

        int cli_exit = 0;
        auto args_opt = pcopy::args_parser::parse_args(argc, argv, cli_exit);
        if (!args_opt) {
            return cli_exit; // --help, --version или ошибка
        }
        const auto& args = *args_opt;

        // 1. Загрузить из файла
        auto config_res = pcopy::infra::load_config_from_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 1;
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(pcopy::infra::config_from_cli(args));
        if (auto valid = config.validate(); !valid) {
            spdlog::error("Config error: {}", valid.error());
            return 1;
        }
        spdlog::set_level(spdlog::level::from_str(config.log_level));

        __out_git_verse(git);
        spdlog::debug("Workers: {}, buffer: {} bytes, path width: {}",
                      config.max_workers, config.buffer_size, config.max_path_width);

        pcopy::infra::ProgressAggregator progress{config.max_path_width};
        pcopy::infra::ProgressRenderer renderer{config.max_path_width, config.progress && !config.quiet};
        pcopy::infra::LogReporter reporter;
        pcopy::core::CopyEngine engine{config, progress, reporter};

        bool interrupt_logged = false;
        auto result = engine.run(args.source, args.destination, [&]() {
            renderer.draw(progress.snapshot());
            if (pcopy::infra::is_interrupted()) {
                if (!interrupt_logged) {
                    spdlog::warn("Received interrupt signal. Finishing in-flight writes...");
                    interrupt_logged = true;
                }
                return false;
            }
            return true;
        });
        renderer.finish();

        if (!result) {
            auto err = pcopy::infra::log_and_return(std::move(result.error()));
            return err.to_exit_code();
        }

        const auto& report = *result;
        if (!config.quiet || !report.ok()) {
            __out_summary(report);
        }

        if (report.interrupted) {
            return pcopy::infra::make_error(pcopy::infra::ErrorCode::Interrupted, "Interrupted").to_exit_code();
        }
        return report.ok() ? 0 : 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
