#include "cortexgrid/tasks/MetricsTracker.hpp"

#include <algorithm>

namespace cortexgrid::tasks {

double TaskMetrics::average_execution_ms() const noexcept {
    if (completed == 0) {
        return 0.0;
    }
    return static_cast<double>(total_execution_ms) / static_cast<double>(completed);
}

double TaskMetrics::success_rate() const noexcept {
    const auto finished = completed + failed + timed_out;
    if (finished == 0) {
        return 0.5;
    }
    return static_cast<double>(completed) / static_cast<double>(finished);
}

void TaskMetrics::record_completion(std::uint32_t execution_ms) noexcept {
    min_execution_ms = completed == 0 ? execution_ms : std::min(min_execution_ms, execution_ms);
    max_execution_ms = std::max(max_execution_ms, execution_ms);
    total_execution_ms += execution_ms;
    ++completed;
}

void MetricsTracker::record_submitted(const std::optional<NodeId>& peer) {
    update(peer, [](TaskMetrics& metrics) { ++metrics.submitted; });
}

void MetricsTracker::record_completed(const std::optional<NodeId>& peer, std::uint32_t execution_ms) {
    update(peer, [execution_ms](TaskMetrics& metrics) { metrics.record_completion(execution_ms); });
}

void MetricsTracker::record_failed(const std::optional<NodeId>& peer) {
    update(peer, [](TaskMetrics& metrics) { ++metrics.failed; });
}

void MetricsTracker::record_timed_out(const std::optional<NodeId>& peer) {
    update(peer, [](TaskMetrics& metrics) { ++metrics.timed_out; });
}

TaskMetrics MetricsTracker::totals() const {
    std::scoped_lock lock(mutex_);
    return totals_;
}

TaskMetrics MetricsTracker::for_peer(const NodeId& peer) const {
    TaskMetrics copy{};
    per_peer_.with_existing(peer, [&](const TaskMetrics& metrics) {
        copy = metrics;
    });
    return copy;
}

}  // namespace cortexgrid::tasks
