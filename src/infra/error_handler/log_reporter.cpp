#include "log_reporter.hpp"
#include <spdlog/spdlog.h>

namespace pcopy::infra {

void LogReporter::report(const core::TaskFailure& failure) {
    reported_.fetch_add(1, std::memory_order_relaxed);
    spdlog::warn("{}: {} ({})", failure.path.string(), failure.message, failure.error_kind);
}

} // namespace pcopy::infra
