#pragma once

#include <atomic>
#include <cstdint>
#include "../../core/diagnostics.hpp"

namespace pcopy::infra {

// Пишет ошибки задач в spdlog (потокобезопасно)
class LogReporter final : public core::DiagnosticsReporter {
public:
    void report(const core::TaskFailure& failure) override;

    [[nodiscard]] auto reported() const -> std::uint64_t { return reported_.load(); }

private:
    std::atomic<std::uint64_t> reported_{0};
};

} // namespace pcopy::infra
