#include "cortexgrid/core/ConfigLoader.hpp"
#include "cortexgrid/core/Node.hpp"
#include "cortexgrid/tasks/Executor.hpp"
#include "test_access.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace cortexgrid;
using cortexgrid::test::NodeTestAccess;

namespace {

bool wait_until(const std::function<bool()>& predicate,
                std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

class ReverseExecutor : public tasks::Executor {
public:
    Result<std::vector<std::uint8_t>> execute(const std::string&, std::span<const std::uint8_t> input) override {
        return std::vector<std::uint8_t>(input.rbegin(), input.rend());
    }
};

Config loopback_config(bool compute) {
    Config config{};
    config.listen_host = "127.0.0.1";
    config.listen_port = 0;
    config.logging_enabled = false;
    config.can_compute = compute;
    if (compute) {
        config.skills = {"text.reverse"};
    }
    config.sync_events_per_chunk = 5;
    return config;
}

std::vector<sync::Event> make_events(std::uint64_t count) {
    std::vector<sync::Event> events;
    for (std::uint64_t i = 1; i <= count; ++i) {
        events.push_back(sync::Event{i, 1'700'000'000 + i, "agent.step", {static_cast<std::uint8_t>(i)}});
    }
    return events;
}

void identity_from_config() {
    auto config = loopback_config(false);
    config.identity_seed = std::string(64, '1');
    Node first(config);
    Node second(config);
    assert(first.id() == second.id());

    config.identity_seed = std::string("not hex");
    bool rejected = false;
    try {
        Node broken(config);
    } catch (const config::ConfigError& error) {
        rejected = true;
        assert(error.code == "E_CONFIG_VALUE");
    }
    assert(rejected);
}

void relay_deliveries_for_others_go_to_the_board() {
    Node node(loopback_config(false));
    NodeId sender{};
    sender.fill(0x44);

    relay::RelayBeacon beacon{};
    beacon.nonce.fill(0x01);
    beacon.recipient_key_hash.fill(0x02);
    beacon.ttl = 3;
    beacon.created_at = unix_seconds_now();
    beacon.payload = {1, 2, 3};
    node.handle_message(sender, protocol::make_message(protocol::RelayDeliverPayload{beacon}));
    assert(NodeTestAccess::board(node).size() == 1);
    assert(NodeTestAccess::board(node).get(beacon.recipient_key_hash).size() == 1);
}

void two_nodes_over_loopback() {
    ReverseExecutor executor;
    Node worker(loopback_config(true), &executor);
    Node client(loopback_config(false));
    worker.start_transport();
    client.start_transport();
    assert(worker.transport_port() != 0);

    NodeId stranger{};
    stranger.fill(0x99);
    const auto wrong = client.connect_peer("127.0.0.1", worker.transport_port(), stranger);
    assert(!wrong.ok());
    assert(wrong.error().code == ErrorCode::InvalidNodeId);

    const auto connected = client.connect_peer("127.0.0.1", worker.transport_port(), worker.id());
    assert(connected.ok());
    assert(*connected == worker.id());
    assert(wait_until([&] { return worker.connected_peer_count() == 1 && client.connected_peer_count() == 1; }));

    const auto worker_record = client.peers().get(worker.id());
    assert(worker_record.has_value());
    assert(worker_record->online);
    assert(worker_record->capabilities.has_skill("text.reverse"));
    assert(wait_until([&] { return worker.peers().get(client.id()).has_value(); }));

    // PING / PONG feeds the latency estimate.
    assert(client.ping(worker.id()).ok());
    assert(wait_until([&] { return client.peers().get(worker.id())->latency_ms >= 0.0; }));
    assert(NodeTestAccess::pending_pings(client) == 0);

    // Artifacts by content hash.
    const std::vector<std::uint8_t> model(4096, 0x5A);
    const auto hash = worker.put_artifact(model);
    assert(hash.ok());
    assert(client.request_artifact(worker.id(), *hash).ok());
    assert(wait_until([&] { return client.artifact(*hash).has_value(); }));
    assert(client.artifact(*hash) == model);

    // Event sync pulls only the chunks the client lacks.
    const auto events = make_events(25);
    assert(worker.append_events(events) == 5);
    assert(client.append_events(std::vector<sync::Event>(events.begin(), events.begin() + 10)) == 2);
    assert(client.sync_with(worker.id()).ok());
    assert(wait_until([&] {
        return client.events().list_chunk_hashes() == worker.events().list_chunk_hashes();
    }));
    assert(client.events().event_count() == 25);
    assert(wait_until([&] { return !NodeTestAccess::sync_engine(client).active(worker.id()); }));

    // Delegation to the only compute-capable peer.
    std::mutex outcome_mutex;
    std::optional<tasks::TaskOutcome> outcome;
    client.set_task_completion_handler([&](const tasks::TaskOutcome& result) {
        std::scoped_lock lock(outcome_mutex);
        outcome = result;
    });
    tasks::TaskSubmission submission{};
    submission.capability = "text.reverse";
    submission.input = {1, 2, 3};
    submission.priority = tasks::TaskPriority::High;
    assert(client.submit_task(submission).ok());
    client.tick();
    assert(wait_until([&] {
        std::scoped_lock lock(outcome_mutex);
        return outcome.has_value();
    }));
    {
        std::scoped_lock lock(outcome_mutex);
        assert(outcome->state == tasks::TaskState::Completed);
        assert(outcome->executed_by == worker.id());
        assert((outcome->output == std::vector<std::uint8_t>{3, 2, 1}));
    }

    // Anonymous message over the relay mesh.
    const std::vector<std::uint8_t> note{'h', 'i'};
    assert(worker.send_anonymous(client.relay_public_key(), note).ok());
    std::vector<relay::DeliveredMessage> inbox;
    assert(wait_until([&] {
        for (auto& message : client.drain_relay_inbox()) {
            inbox.push_back(std::move(message));
        }
        return !inbox.empty();
    }));
    assert(inbox.size() == 1);
    assert(inbox[0].plaintext == note);

    assert(client.disconnect_peer(worker.id()));
    assert(wait_until([&] { return worker.connected_peer_count() == 0; }));
    assert(wait_until([&] { return !worker.peers().get(client.id())->online; }));
    assert(!client.send(worker.id(), protocol::make_message(protocol::PingPayload{1})).ok());

    client.stop_transport();
    worker.stop_transport();
}

}  // namespace

int main() {
    identity_from_config();
    relay_deliveries_for_others_go_to_the_board();
    two_nodes_over_loopback();
    return 0;
}
