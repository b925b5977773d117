#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <chrono>
#include <expected>
#include <filesystem>

namespace pcopy::args_parser {
    struct CLIArgs;
}

namespace pcopy::infra {

inline constexpr std::uint32_t kDefaultMaxWorkers = 10;
inline constexpr std::size_t kDefaultBufferSize = 64 * 1024;
inline constexpr std::size_t kDefaultMaxPathWidth = 30;
inline constexpr std::chrono::milliseconds kDefaultRefreshInterval{100};

/// Значения, заданные явно (CLI); пустые поля не переопределяют файл.
struct PartialConfig {
    std::optional<std::uint32_t> max_workers;
    std::optional<std::size_t> buffer_size;
    std::optional<std::size_t> max_path_width;
    std::optional<std::chrono::milliseconds> refresh_interval;
    std::optional<bool> progress;
    std::optional<bool> quiet;
    std::optional<std::string> log_level;
};

struct Config {
    // I/O
    std::uint32_t max_workers = kDefaultMaxWorkers;
    std::size_t buffer_size = kDefaultBufferSize;   // bytes

    // Display
    std::size_t max_path_width = kDefaultMaxPathWidth;
    std::chrono::milliseconds refresh_interval = kDefaultRefreshInterval;
    bool progress = true;
    bool quiet = false;
    std::string log_level = "info";

    // Слияние с частичным Config (например, из CLI)
    void merge_with(const PartialConfig& other);

    [[nodiscard]] auto validate() const -> std::expected<void, std::string>;
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.pcopy.yaml
///   2. $XDG_CONFIG_HOME/pcopy/config.yaml
///   3. ~/.config/pcopy/config.yaml
/// Возвращает Config по умолчанию, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Разбирает конкретный файл (используется и тестами).
[[nodiscard]] auto load_config_from_path(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Создаёт PartialConfig из CLI аргументов
[[nodiscard]] auto config_from_cli(const pcopy::args_parser::CLIArgs& args) -> PartialConfig;

} // namespace pcopy::infra
