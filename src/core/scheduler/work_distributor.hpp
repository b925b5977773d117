#pragma once

#include <cstddef>
#include <optional>
#include <stop_token>
#include <vector>
#include "../copy_task.hpp"
#include "../../infra/thread_pool/work_queue.hpp"

namespace pcopy::core {

/// Точка передачи задач от планировщика воркерам.
/// Распределение по запросу: свободный воркер сам берёт следующую задачу,
/// поэтому долгий файл у одного воркера не задерживает остальных.
class WorkDistributor {
public:
    WorkDistributor() = default;

    // Заполняет очередь и сразу закрывает её
    explicit WorkDistributor(std::vector<CopyTask> tasks);

    void submit(CopyTask task);

    // Больше задач не будет; пустая очередь после этого означает исчерпание
    void seal();

    // Следующая задача или std::nullopt при исчерпании / остановке
    [[nodiscard]] auto next(std::stop_token st = {}) -> std::optional<CopyTask>;

    // Отбрасывает невыданные задачи (graceful drain), возвращает их число
    auto abandon() -> std::size_t;

    [[nodiscard]] auto pending() const -> std::size_t { return queue_.size(); }
    [[nodiscard]] auto dispatched() const -> std::size_t { return queue_.taken(); }
    [[nodiscard]] auto submitted() const -> std::size_t { return submitted_; }

private:
    infra::WorkQueue<CopyTask> queue_;
    std::size_t submitted_ = 0;
};

} // namespace pcopy::core
