#include "cortexgrid/tasks/TaskDelegator.hpp"

#include "cortexgrid/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <utility>

namespace cortexgrid::tasks {

namespace {

using daemon::StructuredLogger;
using daemon::log_event;

std::uint32_t elapsed_ms(QueuedTask::Clock::time_point from, QueuedTask::Clock::time_point to) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
    return ms <= 0 ? 0u : static_cast<std::uint32_t>(ms);
}

}  // namespace

DelegationSettings DelegationSettings::from_config(const Config& config) {
    DelegationSettings settings{};
    settings.queue_capacity = config.task_queue_capacity;
    settings.max_retries = config.task_max_retries;
    settings.ack_timeout = config.task_ack_timeout;
    return settings;
}

TaskDelegator::TaskDelegator(DelegationSettings settings,
                             protocol::Capabilities local_capabilities,
                             Executor* executor,
                             PeerTable& peers,
                             ReputationManager& reputation,
                             MetricsTracker& metrics,
                             SendFn send)
    : settings_(settings),
      local_capabilities_(std::move(local_capabilities)),
      executor_(executor),
      peers_(peers),
      reputation_(reputation),
      metrics_(metrics),
      send_(std::move(send)),
      queue_(settings.queue_capacity, settings.max_retries),
      router_(peers, reputation, metrics) {}

void TaskDelegator::set_completion_handler(CompletionFn handler) {
    std::scoped_lock lock(mutex_);
    on_complete_ = std::move(handler);
}

Result<std::uint64_t> TaskDelegator::submit(TaskSubmission submission, Clock::time_point now) {
    QueuedTask task{};
    task.task_id = next_task_id_.fetch_add(1);
    task.capability = std::move(submission.capability);
    task.payload = std::move(submission.input);
    task.priority = submission.priority;
    task.target_node = submission.target_node;
    task.require_remote = submission.require_remote;
    task.timeout = submission.timeout;
    task.created_at = now;

    const auto id = task.task_id;
    const auto priority = task.priority;
    auto status = queue_.enqueue(std::move(task));
    if (!status) {
        log_event(StructuredLogger::Level::Warning,
                  "task.rejected",
                  {{"priority", to_string(priority)}, {"code", to_string(status.error().code)}});
        return status.error();
    }
    return id;
}

std::size_t TaskDelegator::pump(Clock::time_point now) {
    std::size_t dispatched = 0;
    while (auto task = queue_.dequeue(now)) {
        ++dispatched;
        if (runs_locally(*task)) {
            run_locally(*task);
        } else {
            dispatch_remote(*task, now);
        }
    }
    return dispatched;
}

Status TaskDelegator::cancel(std::uint64_t task_id) {
    auto task = queue_.remove(task_id);
    if (!task.has_value()) {
        return make_error(ErrorCode::NotFound, "task " + std::to_string(task_id) + " is not pending or in flight");
    }
    std::optional<NodeId> peer;
    {
        std::scoped_lock lock(mutex_);
        if (const auto it = remote_.find(task_id); it != remote_.end()) {
            peer = it->second.peer;
            remote_.erase(it);
        }
        tried_.erase(task_id);
    }
    log_event(StructuredLogger::Level::Info,
              "task.cancelled",
              {{"task", std::to_string(task_id)},
               {"peer", peer ? node_id_to_string(*peer) : std::string("none")}});

    TaskOutcome outcome{};
    outcome.task_id = task_id;
    outcome.state = TaskState::Failed;
    outcome.error = make_error(ErrorCode::Cancelled, "cancelled by submitter");
    outcome.retries = task->retries;
    finish(std::move(outcome));
    return {};
}

void TaskDelegator::on_ack(const NodeId& from, const protocol::TaskAckPayload& ack, Clock::time_point now) {
    RemoteAttempt attempt{};
    {
        std::scoped_lock lock(mutex_);
        const auto it = remote_.find(ack.task_id);
        if (it == remote_.end() || it->second.peer != from) {
            log_event(StructuredLogger::Level::Info,
                      "task.unexpected_ack",
                      {{"task", std::to_string(ack.task_id)}, {"peer", node_id_to_string(from)}});
            return;
        }
        attempt = it->second;
        if (ack.status == protocol::TaskStatus::Accepted || ack.status == protocol::TaskStatus::InProgress) {
            queue_.touch(ack.task_id, now);
            return;
        }
        remote_.erase(it);
    }

    if (ack.status != protocol::TaskStatus::Completed) {
        attempt_failed(ack.task_id,
                       from,
                       make_error(ErrorCode::PermanentlyFailed,
                                  ack.detail.empty() ? std::string("peer reported failure") : ack.detail));
        return;
    }

    // A timeout or cancel that already took the task back out of flight owns
    // its outcome.
    const auto task = queue_.in_flight_task(ack.task_id);
    if (!queue_.complete(ack.task_id)) {
        log_event(StructuredLogger::Level::Info,
                  "task.unexpected_ack",
                  {{"task", std::to_string(ack.task_id)}, {"peer", node_id_to_string(from)}, {"reason", "superseded"}});
        return;
    }

    peers_.record_latency(from, static_cast<double>(elapsed_ms(attempt.sent_at, now)));
    metrics_.record_completed(from, ack.execution_ms);
    reputation_.record_success(from);
    {
        std::scoped_lock lock(mutex_);
        tried_.erase(ack.task_id);
    }

    TaskOutcome outcome{};
    outcome.task_id = ack.task_id;
    outcome.state = TaskState::Completed;
    outcome.output = ack.output;
    outcome.executed_by = from;
    outcome.execution_ms = ack.execution_ms;
    outcome.retries = task.has_value() ? task->retries : 0;
    finish(std::move(outcome));
}

std::size_t TaskDelegator::poll_timeouts(Clock::time_point now) {
    const auto expired = queue_.cleanup_timeouts(now, settings_.ack_timeout);
    for (const auto& entry : expired) {
        std::optional<NodeId> peer;
        {
            std::scoped_lock lock(mutex_);
            const auto it = remote_.find(entry.task.task_id);
            if (it != remote_.end()) {
                peer = it->second.peer;
                tried_[entry.task.task_id].push_back(it->second.peer);
                remote_.erase(it);
            }
        }
        metrics_.record_timed_out(peer);
        if (peer.has_value()) {
            reputation_.record_failure(*peer);
        }
        settle_failure(entry.task.task_id,
                       entry.decision,
                       make_error(ErrorCode::Timeout, "no TASK_ACK within the ack timeout"));
    }
    return expired.size();
}

void TaskDelegator::on_peer_disconnected(const NodeId& peer) {
    peers_.set_online(peer, false);
    std::vector<std::uint64_t> affected;
    {
        std::scoped_lock lock(mutex_);
        for (auto it = remote_.begin(); it != remote_.end();) {
            if (it->second.peer == peer) {
                affected.push_back(it->first);
                it = remote_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto id : affected) {
        attempt_failed(id, peer, make_error(ErrorCode::ConnectionReset, "peer disconnected"));
    }
}

protocol::Message TaskDelegator::serve(const NodeId& from, const protocol::TaskRequestPayload& request) {
    protocol::TaskAckPayload ack{};
    ack.task_id = request.task_id;

    if (executor_ == nullptr || !local_capabilities_.can_compute || !local_capabilities_.has_skill(request.capability)) {
        ack.status = protocol::TaskStatus::Rejected;
        ack.detail = "capability not offered: " + request.capability;
        log_event(StructuredLogger::Level::Info,
                  "task.serve_rejected",
                  {{"peer", node_id_to_string(from)}, {"capability", request.capability}});
        return protocol::make_message(std::move(ack));
    }

    const auto started = Clock::now();
    auto result = executor_->execute(request.capability, request.input);
    ack.execution_ms = elapsed_ms(started, Clock::now());
    if (result.ok()) {
        ack.status = protocol::TaskStatus::Completed;
        ack.output = std::move(result).value();
    } else {
        ack.status = protocol::TaskStatus::Failed;
        ack.detail = result.error().message;
    }
    return protocol::make_message(std::move(ack));
}

std::size_t TaskDelegator::awaiting_ack() const {
    std::scoped_lock lock(mutex_);
    return remote_.size();
}

bool TaskDelegator::runs_locally(const QueuedTask& task) const {
    return !task.require_remote && !task.target_node.has_value() && executor_ != nullptr &&
           local_capabilities_.can_compute && local_capabilities_.has_skill(task.capability);
}

void TaskDelegator::run_locally(const QueuedTask& task) {
    metrics_.record_submitted(std::nullopt);
    const auto started = Clock::now();
    auto result = executor_->execute(task.capability, task.payload);
    const auto execution_ms = elapsed_ms(started, Clock::now());

    if (!result.ok()) {
        metrics_.record_failed(std::nullopt);
        log_event(StructuredLogger::Level::Warning,
                  "task.local_failed",
                  {{"task", std::to_string(task.task_id)}, {"detail", result.error().message}});
        settle_failure(task.task_id, queue_.fail(task.task_id), result.error());
        return;
    }

    metrics_.record_completed(std::nullopt, execution_ms);
    queue_.complete(task.task_id);

    TaskOutcome outcome{};
    outcome.task_id = task.task_id;
    outcome.state = TaskState::Completed;
    outcome.output = std::move(result).value();
    outcome.execution_ms = execution_ms;
    outcome.retries = task.retries;
    finish(std::move(outcome));
}

void TaskDelegator::dispatch_remote(const QueuedTask& task, Clock::time_point now) {
    std::vector<NodeId> exclude;
    {
        std::scoped_lock lock(mutex_);
        const auto it = tried_.find(task.task_id);
        if (it != tried_.end()) {
            exclude = it->second;
        }
    }

    std::optional<NodeId> peer;
    if (task.target_node.has_value()) {
        if (std::find(exclude.begin(), exclude.end(), *task.target_node) == exclude.end()) {
            peer = task.target_node;
        }
    } else {
        peer = router_.select(task.capability, exclude);
    }

    if (!peer.has_value()) {
        queue_.abandon(task.task_id);
        {
            std::scoped_lock lock(mutex_);
            tried_.erase(task.task_id);
        }
        TaskOutcome outcome{};
        outcome.task_id = task.task_id;
        outcome.state = TaskState::Failed;
        outcome.error = make_error(ErrorCode::NoEligiblePeer, "no peer offers " + task.capability);
        outcome.retries = task.retries;
        finish(std::move(outcome));
        return;
    }

    {
        std::scoped_lock lock(mutex_);
        remote_.insert_or_assign(task.task_id, RemoteAttempt{*peer, now});
    }
    metrics_.record_submitted(peer);

    protocol::TaskRequestPayload request{};
    request.task_id = task.task_id;
    request.priority = priority_to_byte(task.priority);
    request.capability = task.capability;
    request.input = task.payload;
    request.timeout_ms = static_cast<std::uint32_t>(
        (task.timeout.count() > 0 ? task.timeout : settings_.ack_timeout).count());

    log_event(StructuredLogger::Level::Info,
              "task.dispatched",
              {{"task", std::to_string(task.task_id)},
               {"peer", node_id_to_string(*peer)},
               {"attempt", std::to_string(task.retries + 1)}});

    if (send_ && send_(*peer, protocol::make_message(std::move(request)))) {
        return;
    }

    bool still_pending = false;
    {
        std::scoped_lock lock(mutex_);
        still_pending = remote_.erase(task.task_id) > 0;
    }
    if (still_pending) {
        attempt_failed(task.task_id, *peer, make_error(ErrorCode::NotConnected, "request could not be sent"));
    }
}

void TaskDelegator::attempt_failed(std::uint64_t task_id, const NodeId& peer, const Error& error) {
    {
        std::scoped_lock lock(mutex_);
        tried_[task_id].push_back(peer);
    }
    metrics_.record_failed(peer);
    reputation_.record_failure(peer);
    settle_failure(task_id, queue_.fail(task_id), error);
}

void TaskDelegator::settle_failure(std::uint64_t task_id, RetryDecision decision, const Error& error) {
    if (decision == RetryDecision::Requeued) {
        log_event(StructuredLogger::Level::Warning,
                  "task.retry",
                  {{"task", std::to_string(task_id)}, {"code", to_string(error.code)}, {"detail", error.message}});
        return;
    }
    if (decision == RetryDecision::Unknown) {
        return;
    }

    {
        std::scoped_lock lock(mutex_);
        tried_.erase(task_id);
    }
    TaskOutcome outcome{};
    outcome.task_id = task_id;
    outcome.state = TaskState::Failed;
    outcome.error = error;
    outcome.retries = settings_.max_retries;
    finish(std::move(outcome));
}

void TaskDelegator::finish(TaskOutcome outcome) {
    if (outcome.state == TaskState::Completed) {
        log_event(StructuredLogger::Level::Info,
                  "task.completed",
                  {{"task", std::to_string(outcome.task_id)},
                   {"executor", outcome.executed_by ? node_id_to_string(*outcome.executed_by) : std::string("local")},
                   {"execution_ms", std::to_string(outcome.execution_ms)}});
    } else {
        log_event(StructuredLogger::Level::Error,
                  "task.failed",
                  {{"task", std::to_string(outcome.task_id)},
                   {"code", outcome.error ? to_string(outcome.error->code) : "unknown"}});
    }

    CompletionFn handler;
    {
        std::scoped_lock lock(mutex_);
        handler = on_complete_;
    }
    if (handler) {
        handler(outcome);
    }
}

}  // namespace cortexgrid::tasks
