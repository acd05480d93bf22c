#include "cortexgrid/tasks/TaskQueue.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace cortexgrid::tasks {

TaskQueue::TaskQueue(std::size_t capacity_per_tier, std::uint8_t max_retries)
    : capacity_per_tier_(capacity_per_tier == 0 ? 1 : capacity_per_tier),
      max_retries_(max_retries) {}

Status TaskQueue::enqueue(QueuedTask task) {
    std::scoped_lock lock(mutex_);
    auto& tier = tiers_[static_cast<std::size_t>(task.priority)];
    if (tier.size() >= capacity_per_tier_) {
        ++stats_.rejected;
        return make_error(ErrorCode::QueueFull,
                          std::string(to_string(task.priority)) + " tier holds " + std::to_string(tier.size()) + " tasks");
    }
    tier.push_back(std::move(task));
    ++stats_.enqueued;
    return {};
}

std::optional<QueuedTask> TaskQueue::dequeue(Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    for (auto tier = tiers_.rbegin(); tier != tiers_.rend(); ++tier) {
        if (tier->empty()) {
            continue;
        }
        auto task = std::move(tier->front());
        tier->pop_front();
        task.dispatched_at = now;
        in_flight_.insert_or_assign(task.task_id, task);
        return task;
    }
    return std::nullopt;
}

bool TaskQueue::complete(std::uint64_t task_id) {
    std::scoped_lock lock(mutex_);
    if (in_flight_.erase(task_id) == 0) {
        return false;
    }
    ++stats_.completed;
    return true;
}

RetryDecision TaskQueue::fail(std::uint64_t task_id) {
    std::scoped_lock lock(mutex_);
    return fail_locked(task_id);
}

bool TaskQueue::abandon(std::uint64_t task_id) {
    std::scoped_lock lock(mutex_);
    if (in_flight_.erase(task_id) == 0) {
        return false;
    }
    ++stats_.failed;
    return true;
}

std::optional<QueuedTask> TaskQueue::remove(std::uint64_t task_id) {
    std::scoped_lock lock(mutex_);
    if (const auto it = in_flight_.find(task_id); it != in_flight_.end()) {
        auto task = std::move(it->second);
        in_flight_.erase(it);
        ++stats_.cancelled;
        return task;
    }
    for (auto& tier : tiers_) {
        const auto it = std::find_if(tier.begin(), tier.end(), [task_id](const QueuedTask& task) {
            return task.task_id == task_id;
        });
        if (it != tier.end()) {
            auto task = std::move(*it);
            tier.erase(it);
            ++stats_.cancelled;
            return task;
        }
    }
    return std::nullopt;
}

bool TaskQueue::touch(std::uint64_t task_id, Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    const auto it = in_flight_.find(task_id);
    if (it == in_flight_.end()) {
        return false;
    }
    it->second.dispatched_at = now;
    return true;
}

std::optional<QueuedTask> TaskQueue::in_flight_task(std::uint64_t task_id) const {
    std::scoped_lock lock(mutex_);
    const auto it = in_flight_.find(task_id);
    if (it == in_flight_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<TaskQueue::TimedOut> TaskQueue::cleanup_timeouts(Clock::time_point now,
                                                             std::chrono::milliseconds default_timeout) {
    std::scoped_lock lock(mutex_);
    std::vector<std::uint64_t> expired;
    for (const auto& [id, task] : in_flight_) {
        const auto limit = task.timeout.count() > 0 ? task.timeout : default_timeout;
        if (now - task.dispatched_at > limit) {
            expired.push_back(id);
        }
    }

    std::vector<TimedOut> result;
    result.reserve(expired.size());
    for (const auto id : expired) {
        auto task = in_flight_.at(id);
        const auto decision = fail_locked(id);
        result.push_back(TimedOut{std::move(task), decision});
    }
    return result;
}

std::size_t TaskQueue::pending_count() const {
    std::scoped_lock lock(mutex_);
    std::size_t total = 0;
    for (const auto& tier : tiers_) {
        total += tier.size();
    }
    return total;
}

std::size_t TaskQueue::in_flight_count() const {
    std::scoped_lock lock(mutex_);
    return in_flight_.size();
}

TaskQueue::Stats TaskQueue::stats() const {
    std::scoped_lock lock(mutex_);
    auto snapshot = stats_;
    for (std::size_t i = 0; i < tiers_.size(); ++i) {
        snapshot.pending[i] = tiers_[i].size();
    }
    snapshot.in_flight = in_flight_.size();
    return snapshot;
}

RetryDecision TaskQueue::fail_locked(std::uint64_t task_id) {
    const auto it = in_flight_.find(task_id);
    if (it == in_flight_.end()) {
        return RetryDecision::Unknown;
    }
    auto task = std::move(it->second);
    in_flight_.erase(it);

    if (task.retries >= max_retries_) {
        ++stats_.failed;
        return RetryDecision::Exhausted;
    }
    ++task.retries;
    ++stats_.retried;
    tiers_[static_cast<std::size_t>(task.priority)].push_front(std::move(task));
    return RetryDecision::Requeued;
}

}  // namespace cortexgrid::tasks
