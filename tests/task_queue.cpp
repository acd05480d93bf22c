#include "cortexgrid/tasks/Task.hpp"
#include "cortexgrid/tasks/TaskQueue.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <string>

using namespace cortexgrid;
using namespace cortexgrid::tasks;
using namespace std::chrono_literals;

namespace {

QueuedTask make_task(std::uint64_t id, TaskPriority priority) {
    QueuedTask task{};
    task.task_id = id;
    task.capability = "vision.detect";
    task.priority = priority;
    task.payload = {static_cast<std::uint8_t>(id)};
    return task;
}

void priority_bytes_map_to_tiers() {
    assert(priority_from_byte(0) == TaskPriority::Low);
    assert(priority_from_byte(63) == TaskPriority::Low);
    assert(priority_from_byte(64) == TaskPriority::Normal);
    assert(priority_from_byte(127) == TaskPriority::Normal);
    assert(priority_from_byte(128) == TaskPriority::High);
    assert(priority_from_byte(191) == TaskPriority::High);
    assert(priority_from_byte(192) == TaskPriority::Critical);
    assert(priority_from_byte(255) == TaskPriority::Critical);
    assert(priority_from_byte(priority_to_byte(TaskPriority::High)) == TaskPriority::High);
    assert(std::string(to_string(TaskPriority::Critical)) == "critical");
}

void highest_tier_first_fifo_within() {
    TaskQueue queue;
    assert(queue.enqueue(make_task(1, TaskPriority::Low)).ok());
    assert(queue.enqueue(make_task(2, TaskPriority::Normal)).ok());
    assert(queue.enqueue(make_task(3, TaskPriority::Critical)).ok());
    assert(queue.enqueue(make_task(4, TaskPriority::Normal)).ok());
    assert(queue.enqueue(make_task(5, TaskPriority::High)).ok());
    assert(queue.pending_count() == 5);

    const std::uint64_t expected[] = {3, 5, 2, 4, 1};
    for (const auto id : expected) {
        const auto task = queue.dequeue();
        assert(task.has_value());
        assert(task->task_id == id);
    }
    assert(!queue.dequeue().has_value());
    assert(queue.in_flight_count() == 5);

    assert(queue.complete(3));
    assert(!queue.complete(3));
    assert(queue.stats().completed == 1);
}

void full_tier_rejects() {
    TaskQueue queue(2);
    assert(queue.enqueue(make_task(1, TaskPriority::Normal)).ok());
    assert(queue.enqueue(make_task(2, TaskPriority::Normal)).ok());
    const auto rejected = queue.enqueue(make_task(3, TaskPriority::Normal));
    assert(!rejected.ok());
    assert(rejected.error().code == ErrorCode::QueueFull);
    assert(rejected.error().category() == ErrorCategory::Capacity);
    assert(queue.enqueue(make_task(4, TaskPriority::High)).ok());

    const auto stats = queue.stats();
    assert(stats.rejected == 1);
    assert(stats.enqueued == 3);
    assert(stats.pending[static_cast<std::size_t>(TaskPriority::Normal)] == 2);
    assert(stats.pending[static_cast<std::size_t>(TaskPriority::High)] == 1);
}

void retries_requeue_at_head_until_exhausted() {
    TaskQueue queue(10, 2);
    assert(queue.enqueue(make_task(1, TaskPriority::Normal)).ok());
    assert(queue.enqueue(make_task(2, TaskPriority::Normal)).ok());

    auto first = queue.dequeue();
    assert(first->task_id == 1);
    assert(queue.fail(1) == RetryDecision::Requeued);

    auto again = queue.dequeue();
    assert(again->task_id == 1);
    assert(again->retries == 1);
    assert(queue.fail(1) == RetryDecision::Requeued);

    again = queue.dequeue();
    assert(again->retries == 2);
    assert(queue.fail(1) == RetryDecision::Exhausted);
    assert(queue.fail(1) == RetryDecision::Unknown);

    assert(queue.dequeue()->task_id == 2);
    assert(queue.abandon(2));
    const auto stats = queue.stats();
    assert(stats.retried == 2);
    assert(stats.failed == 2);
    assert(queue.in_flight_count() == 0);
}

void timeouts_use_task_or_default_limit() {
    TaskQueue queue(10, 1);
    auto quick = make_task(1, TaskPriority::High);
    quick.timeout = 100ms;
    assert(queue.enqueue(quick).ok());
    assert(queue.enqueue(make_task(2, TaskPriority::Normal)).ok());

    const auto t0 = TaskQueue::Clock::now();
    assert(queue.dequeue(t0)->task_id == 1);
    assert(queue.dequeue(t0)->task_id == 2);

    assert(queue.cleanup_timeouts(t0 + 50ms, 1s).empty());
    assert(queue.touch(1, t0 + 50ms));

    auto expired = queue.cleanup_timeouts(t0 + 200ms, 1s);
    assert(expired.size() == 1);
    assert(expired[0].task.task_id == 1);
    assert(expired[0].decision == RetryDecision::Requeued);
    assert(queue.pending_count() == 1);
    assert(queue.in_flight_task(2).has_value());

    expired = queue.cleanup_timeouts(t0 + 2s, 1s);
    assert(expired.size() == 1);
    assert(expired[0].task.task_id == 2);
    assert(!queue.in_flight_task(2).has_value());
}

}  // namespace

int main() {
    priority_bytes_map_to_tiers();
    highest_tier_first_fifo_within();
    full_tier_rejects();
    retries_requeue_at_head_until_exhausted();
    timeouts_use_task_or_default_limit();
    return 0;
}
