#pragma once

#include "cortexgrid/Types.hpp"
#include "cortexgrid/core/PeerShardedMap.hpp"

#include <cstdint>
#include <mutex>
#include <optional>

namespace cortexgrid::tasks {

struct TaskMetrics {
    std::uint64_t submitted{0};
    std::uint64_t completed{0};
    std::uint64_t failed{0};
    std::uint64_t timed_out{0};
    std::uint32_t min_execution_ms{0};
    std::uint32_t max_execution_ms{0};
    std::uint64_t total_execution_ms{0};

    double average_execution_ms() const noexcept;
    // Completed over finished attempts; 0.5 before any attempt finished.
    double success_rate() const noexcept;

    void record_completion(std::uint32_t execution_ms) noexcept;
};

// Delegation counters, overall and per remote peer. Local executions only
// count towards the overall figures.
class MetricsTracker {
public:
    void record_submitted(const std::optional<NodeId>& peer);
    void record_completed(const std::optional<NodeId>& peer, std::uint32_t execution_ms);
    void record_failed(const std::optional<NodeId>& peer);
    void record_timed_out(const std::optional<NodeId>& peer);

    TaskMetrics totals() const;
    TaskMetrics for_peer(const NodeId& peer) const;
    double success_rate(const NodeId& peer) const { return for_peer(peer).success_rate(); }

private:
    template <typename Fn>
    void update(const std::optional<NodeId>& peer, Fn&& fn) {
        {
            std::scoped_lock lock(mutex_);
            fn(totals_);
        }
        if (peer.has_value()) {
            per_peer_.with(*peer, fn);
        }
    }

    TaskMetrics totals_{};
    PeerShardedMap<TaskMetrics> per_peer_;
    mutable std::mutex mutex_;
};

}  // namespace cortexgrid::tasks
