#include "work_distributor.hpp"

namespace pcopy::core {

WorkDistributor::WorkDistributor(std::vector<CopyTask> tasks) {
    for (auto& task : tasks) {
        submit(std::move(task));
    }
    seal();
}

void WorkDistributor::submit(CopyTask task) {
    queue_.push(std::move(task));
    ++submitted_;
}

void WorkDistributor::seal() {
    queue_.close();
}

auto WorkDistributor::next(std::stop_token st) -> std::optional<CopyTask> {
    return queue_.take(st);
}

auto WorkDistributor::abandon() -> std::size_t {
    return queue_.drain();
}

} // namespace pcopy::core
