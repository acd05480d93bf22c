#include "cortexgrid/tasks/Executor.hpp"
#include "cortexgrid/tasks/MetricsTracker.hpp"
#include "cortexgrid/tasks/PeerTable.hpp"
#include "cortexgrid/tasks/ReputationManager.hpp"
#include "cortexgrid/tasks/TaskDelegator.hpp"
#include "cortexgrid/tasks/TaskRouter.hpp"
#include "test_access.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace cortexgrid;
using namespace cortexgrid::tasks;
using namespace std::chrono_literals;

namespace {

NodeId make_peer(std::uint8_t seed) {
    NodeId id{};
    for (auto& byte : id) {
        byte = seed++;
    }
    return id;
}

protocol::Capabilities compute_caps(std::vector<std::string> skills) {
    protocol::Capabilities caps{};
    caps.can_compute = true;
    caps.skills = std::move(skills);
    return caps;
}

class DoublingExecutor : public Executor {
public:
    Result<std::vector<std::uint8_t>> execute(const std::string& capability,
                                              std::span<const std::uint8_t> input) override {
        ++calls;
        if (capability == "broken") {
            return make_error(ErrorCode::PermanentlyFailed, "model crashed");
        }
        std::vector<std::uint8_t> output;
        for (const auto byte : input) {
            output.push_back(static_cast<std::uint8_t>(byte * 2));
        }
        return output;
    }

    int calls{0};
};

struct Harness {
    struct Sent {
        NodeId peer{};
        protocol::TaskRequestPayload request;
    };

    explicit Harness(protocol::Capabilities local = {}, Executor* executor = nullptr, std::uint8_t max_retries = 3)
        : delegator(DelegationSettings{100, max_retries, 60s},
                    std::move(local),
                    executor,
                    peers,
                    reputation,
                    metrics,
                    [this](const NodeId& peer, const protocol::Message& message) {
                        if (!reachable) {
                            return false;
                        }
                        sent.push_back({peer, std::get<protocol::TaskRequestPayload>(message.payload)});
                        return true;
                    }) {
        delegator.set_completion_handler([this](const TaskOutcome& outcome) { outcomes.push_back(outcome); });
    }

    void add_peer(const NodeId& id, std::vector<std::string> skills, double latency_ms = -1.0) {
        PeerRecord record{};
        record.node_id = id;
        record.capabilities = compute_caps(std::move(skills));
        record.latency_ms = latency_ms;
        record.online = true;
        peers.upsert(record);
    }

    protocol::TaskAckPayload ack(std::uint64_t task_id, protocol::TaskStatus status, std::vector<std::uint8_t> output = {}) {
        protocol::TaskAckPayload payload{};
        payload.task_id = task_id;
        payload.status = status;
        payload.output = std::move(output);
        payload.execution_ms = 12;
        return payload;
    }

    PeerTable peers;
    ReputationManager reputation;
    MetricsTracker metrics;
    TaskDelegator delegator;
    std::vector<Sent> sent;
    std::vector<TaskOutcome> outcomes;
    bool reachable{true};
};

TaskSubmission remote_job(std::string capability = "vision.detect") {
    TaskSubmission submission{};
    submission.capability = std::move(capability);
    submission.input = {1, 2, 3};
    submission.require_remote = true;
    return submission;
}

void retries_on_the_next_best_peer() {
    Harness harness;
    const auto strong = make_peer(0x10);
    const auto weak = make_peer(0x20);
    harness.add_peer(strong, {"vision.detect"});
    harness.add_peer(weak, {"vision.detect"});
    harness.reputation.record_success(strong);
    harness.reputation.record_success(strong);

    const auto id = harness.delegator.submit(remote_job());
    assert(id.ok());
    assert(harness.delegator.pump() == 1);
    assert(harness.sent.size() == 1);
    assert(harness.sent[0].peer == strong);
    assert(harness.sent[0].request.task_id == *id);
    assert(harness.sent[0].request.priority == priority_to_byte(TaskPriority::Normal));
    assert(harness.delegator.awaiting_ack() == 1);

    harness.delegator.on_ack(strong, harness.ack(*id, protocol::TaskStatus::Failed));
    assert(harness.outcomes.empty());
    assert(harness.reputation.score(strong) == 0);

    harness.delegator.pump();
    assert(harness.sent.size() == 2);
    assert(harness.sent[1].peer == weak);

    harness.delegator.on_ack(weak, harness.ack(*id, protocol::TaskStatus::Accepted));
    assert(harness.outcomes.empty());
    harness.delegator.on_ack(weak, harness.ack(*id, protocol::TaskStatus::Completed, {2, 4, 6}));

    assert(harness.outcomes.size() == 1);
    const auto& outcome = harness.outcomes[0];
    assert(outcome.task_id == *id);
    assert(outcome.state == TaskState::Completed);
    assert(outcome.executed_by == weak);
    assert(outcome.retries == 1);
    assert((outcome.output == std::vector<std::uint8_t>{2, 4, 6}));
    assert(harness.reputation.score(weak) == 1);
    assert(harness.peers.get(weak)->latency_ms >= 0.0);
    assert(harness.metrics.for_peer(weak).completed == 1);
    assert(harness.metrics.for_peer(strong).failed == 1);
    assert(harness.delegator.queue().in_flight_count() == 0);
}

void missing_ack_times_out_and_exhausts() {
    Harness harness({}, nullptr, 1);
    const auto a = make_peer(0x10);
    const auto b = make_peer(0x20);
    harness.add_peer(a, {"vision.detect"}, 5.0);
    harness.add_peer(b, {"vision.detect"}, 50.0);

    const auto t0 = TaskDelegator::Clock::now();
    const auto id = harness.delegator.submit(remote_job(), t0);
    harness.delegator.pump(t0);
    assert(harness.sent.back().peer == a);
    assert(harness.sent.back().request.timeout_ms == 60000);

    assert(harness.delegator.poll_timeouts(t0 + 30s) == 0);
    assert(harness.delegator.poll_timeouts(t0 + 61s) == 1);
    assert(harness.metrics.for_peer(a).timed_out == 1);
    assert(harness.outcomes.empty());

    harness.delegator.pump(t0 + 61s);
    assert(harness.sent.back().peer == b);

    // A late ACK from the first peer no longer counts.
    harness.delegator.on_ack(a, harness.ack(*id, protocol::TaskStatus::Completed));
    assert(harness.outcomes.empty());

    assert(harness.delegator.poll_timeouts(t0 + 125s) == 1);
    assert(harness.outcomes.size() == 1);
    assert(harness.outcomes[0].state == TaskState::Failed);
    assert(harness.outcomes[0].error->code == ErrorCode::Timeout);
    assert(harness.metrics.totals().timed_out == 2);
}

void ack_after_queue_timeout_is_dropped() {
    Harness harness;
    const auto a = make_peer(0x10);
    const auto b = make_peer(0x20);
    harness.add_peer(a, {"vision.detect"}, 5.0);
    harness.add_peer(b, {"vision.detect"}, 50.0);

    const auto t0 = TaskDelegator::Clock::now();
    const auto id = harness.delegator.submit(remote_job(), t0);
    harness.delegator.pump(t0);
    assert(harness.sent.size() == 1);

    // The queue has already put the task back in its tier when the ACK lands.
    assert(test::TaskDelegatorTestAccess::expire_in_queue(harness.delegator, t0 + 61s) == 1);
    harness.delegator.on_ack(a, harness.ack(*id, protocol::TaskStatus::Completed, {9}));
    assert(harness.outcomes.empty());
    assert(harness.metrics.for_peer(a).completed == 0);
    assert(harness.delegator.queue().pending_count() == 1);
    assert(harness.delegator.poll_timeouts(t0 + 61s) == 0);

    assert(harness.delegator.pump(t0 + 61s) == 1);
    assert(harness.sent.size() == 2);
    harness.delegator.on_ack(harness.sent.back().peer, harness.ack(*id, protocol::TaskStatus::Completed, {7}));
    assert(harness.outcomes.size() == 1);
    assert(harness.outcomes[0].state == TaskState::Completed);
    assert(harness.outcomes[0].retries == 1);
    assert((harness.outcomes[0].output == std::vector<std::uint8_t>{7}));
    assert(harness.delegator.pump(t0 + 62s) == 0);
}

void cancelling_tasks() {
    Harness harness;
    const auto a = make_peer(0x10);
    harness.add_peer(a, {"vision.detect"});

    const auto queued = harness.delegator.submit(remote_job());
    assert(harness.delegator.cancel(*queued).ok());
    assert(harness.outcomes.size() == 1);
    assert(harness.outcomes[0].task_id == *queued);
    assert(harness.outcomes[0].state == TaskState::Failed);
    assert(harness.outcomes[0].error->code == ErrorCode::Cancelled);
    assert(harness.delegator.pump() == 0);
    assert(harness.sent.empty());

    const auto again = harness.delegator.cancel(*queued);
    assert(!again.ok());
    assert(again.error().code == ErrorCode::NotFound);

    const auto t0 = TaskDelegator::Clock::now();
    const auto dispatched = harness.delegator.submit(remote_job(), t0);
    harness.delegator.pump(t0);
    assert(harness.sent.size() == 1);
    assert(harness.delegator.awaiting_ack() == 1);

    assert(harness.delegator.cancel(*dispatched).ok());
    assert(harness.delegator.awaiting_ack() == 0);
    assert(harness.delegator.queue().in_flight_count() == 0);
    assert(harness.outcomes.size() == 2);
    assert(harness.outcomes[1].error->code == ErrorCode::Cancelled);

    // Work the peer finishes after the cancel is ignored.
    harness.delegator.on_ack(a, harness.ack(*dispatched, protocol::TaskStatus::Completed, {1}));
    assert(harness.outcomes.size() == 2);
    assert(harness.delegator.poll_timeouts(t0 + 120s) == 0);
    assert(harness.delegator.pump(t0 + 120s) == 0);
    assert(harness.delegator.queue().stats().cancelled == 2);
}

void local_execution_comes_first() {
    DoublingExecutor executor;
    Harness harness(compute_caps({"vision.detect", "broken"}), &executor, 0);
    harness.add_peer(make_peer(0x10), {"vision.detect"});

    TaskSubmission local{};
    local.capability = "vision.detect";
    local.input = {5};
    const auto id = harness.delegator.submit(local);
    harness.delegator.pump();
    assert(harness.sent.empty());
    assert(executor.calls == 1);
    assert(harness.outcomes.size() == 1);
    assert(harness.outcomes[0].task_id == *id);
    assert(!harness.outcomes[0].executed_by.has_value());
    assert((harness.outcomes[0].output == std::vector<std::uint8_t>{10}));

    harness.delegator.submit(remote_job());
    harness.delegator.pump();
    assert(harness.sent.size() == 1);
    assert(executor.calls == 1);

    TaskSubmission broken{};
    broken.capability = "broken";
    harness.delegator.submit(broken);
    harness.delegator.pump();
    assert(harness.outcomes.back().state == TaskState::Failed);
    assert(harness.outcomes.back().error->code == ErrorCode::PermanentlyFailed);
}

void no_eligible_peer_fails_fast() {
    Harness harness;
    harness.add_peer(make_peer(0x10), {"audio.transcribe"});
    PeerRecord offline{};
    offline.node_id = make_peer(0x30);
    offline.capabilities = compute_caps({"vision.detect"});
    offline.online = false;
    harness.peers.upsert(offline);

    harness.delegator.submit(remote_job());
    harness.delegator.pump();
    assert(harness.sent.empty());
    assert(harness.outcomes.size() == 1);
    assert(harness.outcomes[0].error->code == ErrorCode::NoEligiblePeer);

    TaskSubmission targeted = remote_job();
    targeted.target_node = make_peer(0x30);
    harness.delegator.submit(targeted);
    harness.delegator.pump();
    assert(harness.sent.size() == 1);
    assert(harness.sent[0].peer == make_peer(0x30));
}

void disconnect_fails_over() {
    Harness harness;
    const auto a = make_peer(0x10);
    const auto b = make_peer(0x20);
    harness.add_peer(a, {"vision.detect"}, 1.0);
    harness.add_peer(b, {"vision.detect"}, 9.0);

    harness.delegator.submit(remote_job());
    harness.delegator.pump();
    assert(harness.sent.back().peer == a);

    harness.delegator.on_peer_disconnected(a);
    assert(!harness.peers.get(a)->online);
    assert(harness.delegator.awaiting_ack() == 0);
    harness.delegator.pump();
    assert(harness.sent.back().peer == b);
}

void unreachable_peer_counts_as_attempt() {
    Harness harness({}, nullptr, 1);
    harness.add_peer(make_peer(0x10), {"vision.detect"});
    harness.add_peer(make_peer(0x20), {"vision.detect"});
    harness.reachable = false;

    harness.delegator.submit(remote_job());
    harness.delegator.pump();
    assert(harness.outcomes.size() == 1);
    assert(harness.outcomes[0].error->code == ErrorCode::NotConnected);
    assert(harness.delegator.queue().pending_count() == 0);
}

void serving_requests() {
    DoublingExecutor executor;
    Harness harness(compute_caps({"vision.detect"}), &executor);

    protocol::TaskRequestPayload request{};
    request.task_id = 9;
    request.capability = "vision.detect";
    request.input = {3};
    auto reply = harness.delegator.serve(make_peer(0x40), request);
    const auto& ack = std::get<protocol::TaskAckPayload>(reply.payload);
    assert(ack.task_id == 9);
    assert(ack.status == protocol::TaskStatus::Completed);
    assert((ack.output == std::vector<std::uint8_t>{6}));

    request.capability = "audio.transcribe";
    reply = harness.delegator.serve(make_peer(0x40), request);
    assert(std::get<protocol::TaskAckPayload>(reply.payload).status == protocol::TaskStatus::Rejected);

    Harness no_executor(compute_caps({"vision.detect"}));
    request.capability = "vision.detect";
    reply = no_executor.delegator.serve(make_peer(0x40), request);
    assert(std::get<protocol::TaskAckPayload>(reply.payload).status == protocol::TaskStatus::Rejected);
}

void router_ranking() {
    PeerTable peers;
    ReputationManager reputation;
    MetricsTracker metrics;
    TaskRouter router(peers, reputation, metrics);

    const auto fast = make_peer(0x10);
    const auto slow = make_peer(0x20);
    const auto reliable = make_peer(0x30);
    for (const auto& [id, latency] : {std::pair{fast, 5.0}, std::pair{slow, 80.0}, std::pair{reliable, 200.0}}) {
        PeerRecord record{};
        record.node_id = id;
        record.capabilities = compute_caps({"vision.detect"});
        record.latency_ms = latency;
        record.online = true;
        peers.upsert(record);
    }

    auto ranked = router.rank("vision.detect");
    assert(ranked.size() == 3);
    assert(ranked[0].node_id == fast);
    assert(ranked[1].node_id == slow);
    assert(ranked[0].score == 50.0);

    metrics.record_submitted(reliable);
    metrics.record_completed(reliable, 10);
    ranked = router.rank("vision.detect");
    assert(ranked[0].node_id == reliable);
    assert(ranked[0].score == 100.0);

    assert(router.select("vision.detect", {reliable, fast}) == slow);
    assert(!router.select("audio.transcribe").has_value());
}

void reputation_is_clamped() {
    ReputationManager reputation;
    const auto peer = make_peer(0x10);
    for (int i = 0; i < 150; ++i) {
        reputation.record_success(peer);
    }
    assert(reputation.score(peer) == ReputationManager::kMaxScore);
    for (int i = 0; i < 150; ++i) {
        reputation.record_failure(peer);
    }
    assert(reputation.score(peer) == ReputationManager::kMinScore);
    reputation.forget(peer);
    assert(reputation.score(peer) == 0);
    assert(reputation.peer_count() == 0);
}

void metrics_summaries() {
    MetricsTracker metrics;
    const auto peer = make_peer(0x10);
    assert(metrics.success_rate(peer) == 0.5);
    metrics.record_completed(peer, 30);
    metrics.record_completed(peer, 10);
    metrics.record_failed(peer);
    metrics.record_completed(std::nullopt, 20);

    const auto per_peer = metrics.for_peer(peer);
    assert(per_peer.completed == 2);
    assert(per_peer.min_execution_ms == 10);
    assert(per_peer.max_execution_ms == 30);
    assert(per_peer.average_execution_ms() == 20.0);
    assert(metrics.totals().completed == 3);
    assert(metrics.success_rate(peer) > 0.66 && metrics.success_rate(peer) < 0.67);
}

}  // namespace

int main() {
    retries_on_the_next_best_peer();
    missing_ack_times_out_and_exhausts();
    ack_after_queue_timeout_is_dropped();
    cancelling_tasks();
    local_execution_comes_first();
    no_eligible_peer_fails_fast();
    disconnect_fails_over();
    unreachable_peer_counts_as_attempt();
    serving_requests();
    router_ranking();
    reputation_is_clamped();
    metrics_summaries();
    return 0;
}
