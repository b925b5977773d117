#pragma once

#include "copy_task.hpp"

namespace pcopy::core {

/// Получатель ошибок отдельных задач. Вызывается из потоков-воркеров,
/// реализации обязаны быть потокобезопасными.
class DiagnosticsReporter {
public:
    virtual ~DiagnosticsReporter() = default;

    virtual void report(const TaskFailure& failure) = 0;
};

} // namespace pcopy::core
