#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <array>
#include <cstdlib>
#include <algorithm>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace pcopy::infra {

    void Config::merge_with(const PartialConfig& other) {
        if (other.max_workers) max_workers = *other.max_workers;
        if (other.buffer_size) buffer_size = *other.buffer_size;
        if (other.max_path_width) max_path_width = *other.max_path_width;
        if (other.refresh_interval) refresh_interval = *other.refresh_interval;
        if (other.progress) progress = *other.progress;
        if (other.quiet) quiet = *other.quiet;
        if (other.log_level) log_level = *other.log_level;
    }

    auto Config::validate() const -> std::expected<void, std::string> {
        if (max_workers == 0) {
            return std::unexpected("threads must be at least 1");
        }
        if (buffer_size == 0) {
            return std::unexpected("buffer_size must be positive");
        }
        if (max_path_width < 4) {
            return std::unexpected(fmt::format("path_width {} is too small (minimum 4)", max_path_width));
        }
        if (refresh_interval.count() <= 0) {
            return std::unexpected("refresh_ms must be positive");
        }
        static constexpr std::array levels{"trace", "debug", "info", "warn", "error", "off"};
        if (std::find(levels.begin(), levels.end(), log_level) == levels.end()) {
            return std::unexpected(fmt::format("unknown log_level '{}'", log_level));
        }
        return {};
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".pcopy.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "pcopy" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "pcopy" / "config.yaml");
            }
        }

        return paths;
    }

    auto load_config_from_path(const std::filesystem::path& path)
        -> std::expected<Config, std::string>
    {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["threads"]) cfg.max_workers = config["threads"].as<std::uint32_t>();
            if (config["buffer_size"]) cfg.buffer_size = config["buffer_size"].as<std::size_t>();
            if (config["path_width"]) cfg.max_path_width = config["path_width"].as<std::size_t>();
            if (config["refresh_ms"]) {
                cfg.refresh_interval = std::chrono::milliseconds(config["refresh_ms"].as<std::int64_t>());
            }
            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();

            if (auto valid = cfg.validate(); !valid) {
                return std::unexpected(fmt::format("Invalid {}: {}", path.string(), valid.error()));
            }

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const YAML::Exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) continue;
            return load_config_from_path(path);
        }

        // Файл не найден — конфиг по умолчанию (не ошибка!)
        return Config{};
    }

    [[nodiscard]]
    auto config_from_cli(const pcopy::args_parser::CLIArgs& args) -> PartialConfig {
        PartialConfig cfg{};
        cfg.max_workers = args.threads;
        cfg.buffer_size = args.buffer_size;
        cfg.max_path_width = args.path_width;
        if (args.refresh_ms) cfg.refresh_interval = std::chrono::milliseconds(*args.refresh_ms);
        if (args.no_progress) cfg.progress = false;
        if (args.quiet) {
            cfg.quiet = true;
            cfg.log_level = "warn";
        }
        if (args.verbose) cfg.log_level = "debug";
        return cfg;
    }

} // namespace pcopy::infra
