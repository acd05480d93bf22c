#pragma once

#include "cortexgrid/Error.hpp"
#include "cortexgrid/tasks/Task.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace cortexgrid::tasks {

enum class RetryDecision {
    Requeued,
    Exhausted,
    Unknown
};

// Four bounded FIFO tiers drained highest priority first, plus the set of
// tasks currently dispatched.
class TaskQueue {
public:
    using Clock = QueuedTask::Clock;

    struct Stats {
        std::array<std::size_t, kPriorityTiers> pending{};
        std::size_t in_flight{0};
        std::uint64_t enqueued{0};
        std::uint64_t rejected{0};
        std::uint64_t completed{0};
        std::uint64_t failed{0};
        std::uint64_t retried{0};
        std::uint64_t cancelled{0};
    };

    struct TimedOut {
        QueuedTask task;
        RetryDecision decision{RetryDecision::Unknown};
    };

    explicit TaskQueue(std::size_t capacity_per_tier = 1000, std::uint8_t max_retries = 3);

    // QueueFull when the task's tier is at capacity.
    Status enqueue(QueuedTask task);
    // Moves the next task to in-flight.
    std::optional<QueuedTask> dequeue(Clock::time_point now = Clock::now());

    bool complete(std::uint64_t task_id);
    // Requeues at the head of its tier while retries remain.
    RetryDecision fail(std::uint64_t task_id);
    // Terminal failure with no retry.
    bool abandon(std::uint64_t task_id);
    // Takes a task out of its tier or the in-flight set.
    std::optional<QueuedTask> remove(std::uint64_t task_id);
    // Restarts the timeout clock of an in-flight task.
    bool touch(std::uint64_t task_id, Clock::time_point now);
    std::optional<QueuedTask> in_flight_task(std::uint64_t task_id) const;

    // Fails every in-flight task dispatched longer ago than its timeout
    // (default_timeout when the task sets none).
    std::vector<TimedOut> cleanup_timeouts(Clock::time_point now, std::chrono::milliseconds default_timeout);

    std::size_t pending_count() const;
    std::size_t in_flight_count() const;
    Stats stats() const;

private:
    RetryDecision fail_locked(std::uint64_t task_id);

    std::size_t capacity_per_tier_;
    std::uint8_t max_retries_;
    std::array<std::deque<QueuedTask>, kPriorityTiers> tiers_;
    std::unordered_map<std::uint64_t, QueuedTask> in_flight_;
    Stats stats_{};
    mutable std::mutex mutex_;
};

}  // namespace cortexgrid::tasks
