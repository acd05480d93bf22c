#pragma once

#include "cortexgrid/Config.hpp"
#include "cortexgrid/Error.hpp"
#include "cortexgrid/Types.hpp"
#include "cortexgrid/protocol/Message.hpp"
#include "cortexgrid/tasks/Executor.hpp"
#include "cortexgrid/tasks/MetricsTracker.hpp"
#include "cortexgrid/tasks/PeerTable.hpp"
#include "cortexgrid/tasks/ReputationManager.hpp"
#include "cortexgrid/tasks/Task.hpp"
#include "cortexgrid/tasks/TaskQueue.hpp"
#include "cortexgrid/tasks/TaskRouter.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cortexgrid::test {
class TaskDelegatorTestAccess;
}

namespace cortexgrid::tasks {

struct DelegationSettings {
    std::size_t queue_capacity{1000};
    std::uint8_t max_retries{3};
    std::chrono::milliseconds ack_timeout{std::chrono::seconds(60)};

    static DelegationSettings from_config(const Config& config);
};

struct TaskSubmission {
    std::string capability;
    std::vector<std::uint8_t> input;
    TaskPriority priority{TaskPriority::Normal};
    std::optional<NodeId> target_node;
    // Skip local execution even when this node could run the task.
    bool require_remote{false};
    std::chrono::milliseconds timeout{0};
};

// Runs submitted tasks locally when possible and otherwise sends them to
// the best ranked peer, retrying on the next one after a failure or a
// missed TASK_ACK.
class TaskDelegator {
public:
    using Clock = QueuedTask::Clock;
    using SendFn = std::function<bool(const NodeId& peer, const protocol::Message& message)>;
    using CompletionFn = std::function<void(const TaskOutcome& outcome)>;

    TaskDelegator(DelegationSettings settings,
                  protocol::Capabilities local_capabilities,
                  Executor* executor,
                  PeerTable& peers,
                  ReputationManager& reputation,
                  MetricsTracker& metrics,
                  SendFn send);

    void set_completion_handler(CompletionFn handler);

    // QueueFull when the priority tier is saturated.
    Result<std::uint64_t> submit(TaskSubmission submission, Clock::time_point now = Clock::now());
    // Dispatches every pending task. Returns how many dispatches were made.
    std::size_t pump(Clock::time_point now = Clock::now());

    // Withdraws a pending or in-flight task and reports it as Cancelled.
    // NotFound once the task has reached a terminal outcome.
    Status cancel(std::uint64_t task_id);

    void on_ack(const NodeId& from, const protocol::TaskAckPayload& ack, Clock::time_point now = Clock::now());
    std::size_t poll_timeouts(Clock::time_point now = Clock::now());
    void on_peer_disconnected(const NodeId& peer);

    // Serves a TASK_REQUEST from a peer; the reply is always a TASK_ACK.
    protocol::Message serve(const NodeId& from, const protocol::TaskRequestPayload& request);

    const TaskQueue& queue() const noexcept { return queue_; }
    const TaskRouter& router() const noexcept { return router_; }
    std::size_t awaiting_ack() const;

private:
    friend class test::TaskDelegatorTestAccess;

    struct RemoteAttempt {
        NodeId peer{};
        Clock::time_point sent_at{};
    };

    bool runs_locally(const QueuedTask& task) const;
    void run_locally(const QueuedTask& task);
    void dispatch_remote(const QueuedTask& task, Clock::time_point now);
    void attempt_failed(std::uint64_t task_id, const NodeId& peer, const Error& error);
    void settle_failure(std::uint64_t task_id, RetryDecision decision, const Error& error);
    void finish(TaskOutcome outcome);

    DelegationSettings settings_;
    protocol::Capabilities local_capabilities_;
    Executor* executor_;
    PeerTable& peers_;
    ReputationManager& reputation_;
    MetricsTracker& metrics_;
    SendFn send_;
    CompletionFn on_complete_;

    TaskQueue queue_;
    TaskRouter router_;
    std::atomic<std::uint64_t> next_task_id_{1};

    std::unordered_map<std::uint64_t, RemoteAttempt> remote_;
    std::unordered_map<std::uint64_t, std::vector<NodeId>> tried_;
    mutable std::mutex mutex_;
};

}  // namespace cortexgrid::tasks
