#pragma once

#include "cortexgrid/Config.hpp"
#include "cortexgrid/Error.hpp"
#include "cortexgrid/Types.hpp"
#include "cortexgrid/core/Identity.hpp"
#include "cortexgrid/network/NonceLedger.hpp"
#include "cortexgrid/network/SessionManager.hpp"
#include "cortexgrid/protocol/Message.hpp"
#include "cortexgrid/relay/RelayNode.hpp"
#include "cortexgrid/relay/RendezvousBoard.hpp"
#include "cortexgrid/storage/ArtifactStore.hpp"
#include "cortexgrid/sync/BandwidthThrottle.hpp"
#include "cortexgrid/sync/ChunkSyncEngine.hpp"
#include "cortexgrid/sync/EventStore.hpp"
#include "cortexgrid/sync/SyncProgress.hpp"
#include "cortexgrid/tasks/Executor.hpp"
#include "cortexgrid/tasks/MetricsTracker.hpp"
#include "cortexgrid/tasks/PeerTable.hpp"
#include "cortexgrid/tasks/ReputationManager.hpp"
#include "cortexgrid/tasks/TaskDelegator.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cortexgrid {

namespace test {
class NodeTestAccess;
}

// One peer of the grid: identity, transport and the relay, sync, task and
// artifact services, with inbound messages dispatched by kind.
class Node {
public:
    // Throws config::ConfigError when config.identity_seed is malformed.
    explicit Node(Config config = {}, tasks::Executor* executor = nullptr);
    Node(LocalIdentity identity, Config config, tasks::Executor* executor = nullptr);
    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    const NodeId& id() const noexcept { return identity_.node_id(); }
    const LocalIdentity& identity() const noexcept { return identity_; }
    const Config& config() const noexcept { return config_; }
    const protocol::Capabilities& capabilities() const noexcept { return capabilities_; }

    void start_transport();
    void stop_transport();
    std::uint16_t transport_port() const noexcept { return sessions_.listening_port(); }
    Result<NodeId> connect_peer(const std::string& host,
                                std::uint16_t port,
                                std::optional<NodeId> expected_peer = std::nullopt);
    // Dials every configured bootstrap peer; returns how many connected.
    std::size_t connect_bootstrap_peers();
    bool disconnect_peer(const NodeId& peer);
    std::size_t connected_peer_count() const { return sessions_.active_session_count(); }
    Status send(const NodeId& peer, const protocol::Message& message);

    void handle_message(const NodeId& peer, const protocol::Message& message);

    Status ping(const NodeId& peer);
    Status request_capabilities(const NodeId& peer);

    PublicKey relay_public_key() const { return relay_.identity().public_key(); }
    // Seals plaintext to the recipient's relay key and floods it to neighbours.
    Status send_anonymous(const PublicKey& recipient_relay_key,
                          std::span<const std::uint8_t> plaintext,
                          std::optional<std::uint8_t> ttl = std::nullopt);
    // Asks a rendezvous peer for beacons under our current prefixes.
    Status fetch_relay(const NodeId& rendezvous_peer);
    std::vector<relay::DeliveredMessage> drain_relay_inbox() { return relay_.drain_inbox(); }

    std::size_t append_events(const std::vector<sync::Event>& events) { return events_.append_log(events); }
    Status sync_with(const NodeId& peer) { return sync_.begin(peer); }
    std::optional<sync::SyncProgress> sync_progress(const NodeId& peer) const { return progress_.snapshot(peer); }

    Result<std::uint64_t> submit_task(tasks::TaskSubmission submission) { return delegator_.submit(std::move(submission)); }
    Status cancel_task(std::uint64_t task_id) { return delegator_.cancel(task_id); }
    void set_task_completion_handler(tasks::TaskDelegator::CompletionFn handler) {
        delegator_.set_completion_handler(std::move(handler));
    }

    Result<ContentHash> put_artifact(std::vector<std::uint8_t> data) { return artifacts_.put(std::move(data)); }
    std::optional<std::vector<std::uint8_t>> artifact(const ContentHash& hash) const { return artifacts_.get(hash); }
    Status request_artifact(const NodeId& peer, const ContentHash& hash);

    // Periodic work: dispatch queued tasks, expire unacknowledged ones,
    // rotate the relay key.
    void tick(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    relay::RelayNode& relay() noexcept { return relay_; }
    sync::InMemoryEventStore& events() noexcept { return events_; }
    tasks::TaskDelegator& tasks() noexcept { return delegator_; }
    tasks::PeerTable& peers() noexcept { return peers_; }
    storage::ArtifactStore& artifacts() noexcept { return artifacts_; }

private:
    friend class test::NodeTestAccess;

    void on_session(const NodeId& peer, const network::Session& session);
    void on_disconnect(const NodeId& peer, const Error& reason);
    void reply(const NodeId& peer, const protocol::Message& message);
    void reply_error(const NodeId& peer, ErrorCode code, protocol::MessageKind related, std::string message);
    void on_pong(const NodeId& peer, const protocol::PongPayload& pong);
    void on_relay_deliver(const NodeId& peer, const relay::RelayBeacon& beacon);
    void on_relay_fetch(const NodeId& peer, const protocol::RelayFetchPayload& fetch);
    void on_artifact_get(const NodeId& peer, const protocol::ArtifactGetPayload& request);
    void on_artifact_put(const NodeId& peer, protocol::ArtifactPutPayload put);
    bool send_quiet(const NodeId& peer, const protocol::Message& message);

    Config config_;
    LocalIdentity identity_;
    protocol::Capabilities capabilities_;
    network::NonceLedger ledger_;
    network::SessionManager sessions_;

    storage::ArtifactStore artifacts_;

    sync::InMemoryEventStore events_;
    sync::BandwidthThrottle throttle_;
    sync::SyncProgressTable progress_;
    sync::ChunkSyncEngine sync_;

    relay::InMemoryRendezvousBoard board_;
    relay::RelayNode relay_;

    tasks::PeerTable peers_;
    tasks::ReputationManager reputation_;
    tasks::MetricsTracker metrics_;
    tasks::TaskDelegator delegator_;

    std::atomic<std::uint64_t> next_ping_{1};
    std::unordered_map<std::uint64_t, std::pair<NodeId, std::chrono::steady_clock::time_point>> pending_pings_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> requested_artifacts_;
    std::mutex pending_mutex_;
};

}  // namespace cortexgrid
