#include "copy_primitive.hpp"
#include <spdlog/spdlog.h>
#include "../../adapters/fs.hpp"

namespace pcopy::core {

namespace {

auto copy_file_task(const CopyTask& task,
                    infra::ProgressAggregator& progress,
                    std::size_t buffer_size,
                    std::stop_token st) -> infra::Result<std::uint64_t>
{
    const auto id = progress.begin(task.source.string(), task.size_bytes);

    auto res = adapters::fs::copy_regular_file(
        task.source, task.destination, buffer_size,
        [&progress, id](std::uint64_t n) { progress.advance(id, n); },
        st);

    if (!res) {
        progress.fail(id);
        return res;
    }
    progress.complete(id);
    return res;
}

} // namespace

auto execute_task(const CopyTask& task,
                  infra::ProgressAggregator& progress,
                  std::size_t buffer_size,
                  std::stop_token st) -> infra::Result<std::uint64_t>
{
    switch (task.kind) {
        case EntryKind::File:
            return copy_file_task(task, progress, buffer_size, st);

        case EntryKind::Symlink: {
            auto res = adapters::fs::copy_symlink(task.source, task.destination);
            if (!res) {
                progress.record_failed();
                return std::unexpected(std::move(res.error()));
            }
            progress.record_completed();
            return std::uint64_t{0};
        }

        case EntryKind::Directory: {
            auto res = adapters::fs::create_directory(task.destination);
            if (!res) {
                progress.record_failed();
                return std::unexpected(std::move(res.error()));
            }
            progress.record_completed();
            return std::uint64_t{0};
        }
    }

    progress.record_failed();
    return std::unexpected(infra::make_error(infra::ErrorCode::UnsupportedType,
                           "Unknown task kind", task.source));
}

} // namespace pcopy::core
