#include "tree_enumerator.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../adapters/fs.hpp"

namespace pcopy::core {

TreeEnumerator::TreeEnumerator(std::filesystem::path source_root,
                               std::filesystem::path destination_root)
    : source_root_(std::move(source_root))
    , destination_root_(std::move(destination_root))
{
    restart();
}

void TreeEnumerator::restart() {
    pending_dirs_.clear();
    ready_.clear();
    errors_.clear();

    ready_.push_back(CopyTask{
        .source = source_root_,
        .destination = destination_root_,
        .kind = EntryKind::Directory,
        .size_bytes = 0
    });
    pending_dirs_.push_back(source_root_);
}

auto TreeEnumerator::destination_for_(const std::filesystem::path& src) const -> std::filesystem::path {
    return destination_root_ / src.lexically_relative(source_root_);
}

void TreeEnumerator::expand_(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        errors_.push_back(infra::Error{infra::ErrorCode::EnumerationError,
                          fmt::format("Cannot read directory: {}", ec.message()),
                          dir, ec.value()});
        return;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const auto& path = it->path();

        auto info = adapters::fs::classify(path);
        if (!info) {
            // fifo, socket, device сохраняют свой код; остальное это сбой обхода
            const auto code = info.error().code == infra::ErrorCode::UnsupportedType
                ? infra::ErrorCode::UnsupportedType
                : infra::ErrorCode::EnumerationError;
            errors_.push_back(infra::Error{code, info.error().message, path, info.error().sys_errno});
            continue;
        }

        ready_.push_back(CopyTask{
            .source = path,
            .destination = destination_for_(path),
            .kind = info->kind,
            .size_bytes = info->kind == EntryKind::File ? info->size : 0
        });
        if (info->kind == EntryKind::Directory) {
            pending_dirs_.push_back(path);
        }
    }

    if (ec) {
        errors_.push_back(infra::Error{infra::ErrorCode::EnumerationError,
                          fmt::format("Directory listing aborted: {}", ec.message()),
                          dir, ec.value()});
    }
}

auto TreeEnumerator::next() -> std::optional<CopyTask> {
    while (ready_.empty() && !pending_dirs_.empty()) {
        auto dir = std::move(pending_dirs_.back());
        pending_dirs_.pop_back();
        spdlog::trace("Enumerating {}", dir.string());
        expand_(dir);
    }
    if (ready_.empty()) {
        return std::nullopt;
    }
    auto task = std::move(ready_.front());
    ready_.pop_front();
    return task;
}

auto TreeEnumerator::collect() -> std::vector<CopyTask> {
    std::vector<CopyTask> tasks;
    while (auto task = next()) {
        tasks.push_back(std::move(*task));
    }
    return tasks;
}

} // namespace pcopy::core
