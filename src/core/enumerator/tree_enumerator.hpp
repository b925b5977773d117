#pragma once

#include <deque>
#include <filesystem>
#include <optional>
#include <vector>
#include "../copy_task.hpp"
#include "../../infra/error_handler/error.hpp"

namespace pcopy::core {

/// Ленивый обход дерева источника через явный стек (без рекурсии).
/// Корень и каждый каталог выдаются раньше своего содержимого.
/// Нечитаемые поддеревья записываются в errors() как EnumerationError,
/// fifo/socket/device как UnsupportedType; обход остальных ветвей продолжается.
class TreeEnumerator {
public:
    TreeEnumerator(std::filesystem::path source_root,
                   std::filesystem::path destination_root);

    [[nodiscard]] auto next() -> std::optional<CopyTask>;

    // Начать обход заново
    void restart();

    [[nodiscard]] auto errors() const -> const std::vector<infra::Error>& { return errors_; }

    // Выдаёт всю последовательность сразу
    [[nodiscard]] auto collect() -> std::vector<CopyTask>;

private:
    void expand_(const std::filesystem::path& dir);
    [[nodiscard]] auto destination_for_(const std::filesystem::path& src) const -> std::filesystem::path;

    std::filesystem::path source_root_;
    std::filesystem::path destination_root_;
    std::vector<std::filesystem::path> pending_dirs_;
    std::deque<CopyTask> ready_;
    std::vector<infra::Error> errors_;
};

} // namespace pcopy::core
