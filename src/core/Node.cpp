#include "cortexgrid/core/Node.hpp"

#include "cortexgrid/core/ConfigLoader.hpp"
#include "cortexgrid/daemon/StructuredLogger.hpp"
#include "cortexgrid/relay/Beacon.hpp"

#include <iterator>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace cortexgrid {

namespace {

using daemon::StructuredLogger;
using protocol::MessageKind;

constexpr std::uint64_t kBytesPerMegabyte = 1024ull * 1024ull;

LocalIdentity identity_from_config(const Config& config) {
    if (!config.identity_seed.has_value()) {
        return LocalIdentity::generate();
    }
    auto identity = LocalIdentity::from_seed_hex(*config.identity_seed);
    if (!identity.has_value()) {
        throw config::ConfigError("E_CONFIG_VALUE", "identity_seed must be 64 hex characters");
    }
    return std::move(*identity);
}

std::uint64_t storage_capacity(const Config& config) {
    return static_cast<std::uint64_t>(config.max_storage_mb) * kBytesPerMegabyte;
}

bool is_handshake_kind(MessageKind kind) {
    return kind == MessageKind::Hello || kind == MessageKind::Challenge || kind == MessageKind::Prove ||
           kind == MessageKind::Welcome;
}

}  // namespace

Node::Node(Config config, tasks::Executor* executor)
    : Node(identity_from_config(config), config, executor) {}

Node::Node(LocalIdentity identity, Config config, tasks::Executor* executor)
    : config_(std::move(config)),
      identity_(std::move(identity)),
      capabilities_(network::HandshakeSettings::from_config(config_).capabilities),
      ledger_(config_.handshake_nonce_history),
      sessions_(identity_, ledger_, network::HandshakeSettings::from_config(config_)),
      artifacts_(storage_capacity(config_)),
      events_(config_.sync_events_per_chunk),
      throttle_(config_.sync_bandwidth_limit, config_.sync_window),
      sync_(events_,
            throttle_,
            progress_,
            [this](const NodeId& peer, const protocol::Message& message) { return send_quiet(peer, message); },
            sync::SyncSettings::from_config(config_)),
      board_(config_.relay_beacon_expiry),
      relay_(relay::RelaySettings::from_config(config_),
             [this](const NodeId& peer, const protocol::Message& message) { return send_quiet(peer, message); },
             config_.can_store ? &board_ : nullptr),
      delegator_(tasks::DelegationSettings::from_config(config_),
                 capabilities_,
                 executor,
                 peers_,
                 reputation_,
                 metrics_,
                 [this](const NodeId& peer, const protocol::Message& message) { return send_quiet(peer, message); }) {
    const auto level = StructuredLogger::parse_level(config_.log_level);
    if (!level) {
        throw config::ConfigError("E_CONFIG_VALUE", "log_level must be info, warning or error");
    }
    StructuredLogger::instance().set_enabled(config_.logging_enabled);
    StructuredLogger::instance().set_min_level(*level);

    sessions_.set_message_handler(
        [this](const NodeId& peer, const protocol::Message& message) { handle_message(peer, message); });
    sessions_.set_session_handler(
        [this](const NodeId& peer, const network::Session& session) { on_session(peer, session); });
    sessions_.set_disconnect_handler([this](const NodeId& peer, const Error& reason) { on_disconnect(peer, reason); });
}

Node::~Node() {
    sessions_.stop();
}

void Node::start_transport() {
    sessions_.start(config_.listen_host, config_.listen_port);
    daemon::log_event(StructuredLogger::Level::Info,
                      "node.listening",
                      {{"node_id", node_id_to_string(id())},
                       {"host", config_.listen_host},
                       {"port", std::to_string(sessions_.listening_port())}});
}

void Node::stop_transport() {
    sessions_.stop();
}

Result<NodeId> Node::connect_peer(const std::string& host, std::uint16_t port, std::optional<NodeId> expected_peer) {
    return sessions_.connect(host, port, expected_peer);
}

std::size_t Node::connect_bootstrap_peers() {
    std::size_t connected = 0;
    for (const auto& peer : config_.bootstrap_peers) {
        auto result = sessions_.connect(peer.host, peer.port);
        if (result.ok()) {
            ++connected;
            continue;
        }
        daemon::log_event(StructuredLogger::Level::Warning,
                          "bootstrap.connect_failed",
                          {{"host", peer.host},
                           {"port", std::to_string(peer.port)},
                           {"code", to_string(result.error().code)},
                           {"detail", result.error().message}});
    }
    return connected;
}

bool Node::disconnect_peer(const NodeId& peer) {
    return sessions_.disconnect(peer);
}

Status Node::send(const NodeId& peer, const protocol::Message& message) {
    return sessions_.send(peer, message);
}

bool Node::send_quiet(const NodeId& peer, const protocol::Message& message) {
    return sessions_.send(peer, message).ok();
}

void Node::reply(const NodeId& peer, const protocol::Message& message) {
    const auto status = sessions_.send(peer, message);
    if (!status.ok()) {
        daemon::log_event(StructuredLogger::Level::Warning,
                          "node.reply_failed",
                          {{"peer", node_id_to_string(peer)},
                           {"kind", protocol::kind_name(message.kind())},
                           {"code", to_string(status.error().code)}});
    }
}

void Node::reply_error(const NodeId& peer, ErrorCode code, MessageKind related, std::string message) {
    reply(peer, protocol::make_error_message(code, related, std::move(message)));
}

Status Node::ping(const NodeId& peer) {
    const auto sequence = next_ping_.fetch_add(1);
    {
        std::scoped_lock lock(pending_mutex_);
        pending_pings_[sequence] = {peer, std::chrono::steady_clock::now()};
    }
    auto status = sessions_.send(peer, protocol::make_message(protocol::PingPayload{sequence}));
    if (!status.ok()) {
        std::scoped_lock lock(pending_mutex_);
        pending_pings_.erase(sequence);
    }
    return status;
}

Status Node::request_capabilities(const NodeId& peer) {
    return sessions_.send(peer, protocol::make_message(protocol::CapsGetPayload{}));
}

Status Node::send_anonymous(const PublicKey& recipient_relay_key,
                            std::span<const std::uint8_t> plaintext,
                            std::optional<std::uint8_t> ttl) {
    relay::RelayBeacon beacon{};
    try {
        beacon = relay_.compose(recipient_relay_key, plaintext, ttl);
    } catch (const std::invalid_argument& error) {
        return make_error(ErrorCode::Malformed, error.what());
    }
    if (relay_.broadcast(beacon) == 0) {
        return make_error(ErrorCode::NotConnected, "no relay neighbour accepted the beacon");
    }
    return {};
}

Status Node::fetch_relay(const NodeId& rendezvous_peer) {
    for (const auto& prefix : relay_.identity().active_prefixes()) {
        auto status = sessions_.send(rendezvous_peer, protocol::make_message(protocol::RelayFetchPayload{prefix}));
        if (!status.ok()) {
            return status;
        }
    }
    return {};
}

Status Node::request_artifact(const NodeId& peer, const ContentHash& hash) {
    {
        std::scoped_lock lock(pending_mutex_);
        requested_artifacts_[hash_to_string(hash)] = std::chrono::steady_clock::now();
    }
    auto status = sessions_.send(peer, protocol::make_message(protocol::ArtifactGetPayload{hash}));
    if (!status.ok()) {
        std::scoped_lock lock(pending_mutex_);
        requested_artifacts_.erase(hash_to_string(hash));
    }
    return status;
}

void Node::tick(std::chrono::steady_clock::time_point now) {
    delegator_.poll_timeouts(now);
    delegator_.pump(now);
    relay_.tick(now);

    const auto stale_after = 2 * config_.heartbeat_interval;
    std::scoped_lock lock(pending_mutex_);
    for (auto it = pending_pings_.begin(); it != pending_pings_.end();) {
        it = now - it->second.second > stale_after ? pending_pings_.erase(it) : std::next(it);
    }
    for (auto it = requested_artifacts_.begin(); it != requested_artifacts_.end();) {
        it = now - it->second > config_.task_ack_timeout ? requested_artifacts_.erase(it) : std::next(it);
    }
}

void Node::handle_message(const NodeId& peer, const protocol::Message& message) {
    const auto kind = message.kind();
    if (is_handshake_kind(kind)) {
        reply_error(peer, ErrorCode::UnexpectedMessage, kind, "handshake message on an established session");
        return;
    }

    std::visit(
        [&](const auto& payload) {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, protocol::PingPayload>) {
                reply(peer, protocol::make_message(protocol::PongPayload{payload.sequence}));
            } else if constexpr (std::is_same_v<T, protocol::PongPayload>) {
                on_pong(peer, payload);
            } else if constexpr (std::is_same_v<T, protocol::CapsGetPayload>) {
                reply(peer, protocol::make_message(protocol::CapsSetPayload{capabilities_}));
            } else if constexpr (std::is_same_v<T, protocol::CapsSetPayload>) {
                peers_.update_capabilities(peer, payload.capabilities);
            } else if constexpr (std::is_same_v<T, protocol::TaskRequestPayload>) {
                reply(peer, delegator_.serve(peer, payload));
            } else if constexpr (std::is_same_v<T, protocol::TaskAckPayload>) {
                delegator_.on_ack(peer, payload);
            } else if constexpr (std::is_same_v<T, protocol::EventManifestGetPayload>) {
                reply(peer, sync_.serve_manifest());
            } else if constexpr (std::is_same_v<T, protocol::EventManifestPayload>) {
                sync_.on_manifest(peer, payload);
            } else if constexpr (std::is_same_v<T, protocol::EventChunkGetPayload>) {
                reply(peer, sync_.serve_chunk(payload));
            } else if constexpr (std::is_same_v<T, protocol::EventChunkPutPayload>) {
                sync_.on_chunk_put(peer, payload);
            } else if constexpr (std::is_same_v<T, protocol::ArtifactGetPayload>) {
                on_artifact_get(peer, payload);
            } else if constexpr (std::is_same_v<T, protocol::ArtifactPutPayload>) {
                on_artifact_put(peer, payload);
            } else if constexpr (std::is_same_v<T, protocol::RelayBeaconPayload>) {
                relay_.handle_beacon(payload, peer);
            } else if constexpr (std::is_same_v<T, protocol::RelayForwardPayload>) {
                relay_.handle_beacon(payload.beacon, peer);
            } else if constexpr (std::is_same_v<T, protocol::RelayDeliverPayload>) {
                on_relay_deliver(peer, payload.beacon);
            } else if constexpr (std::is_same_v<T, protocol::RelayFetchPayload>) {
                on_relay_fetch(peer, payload);
            } else if constexpr (std::is_same_v<T, protocol::ErrorPayload>) {
                const auto code = error_code_from_wire(payload.code);
                daemon::log_event(StructuredLogger::Level::Warning,
                                  "peer.error",
                                  {{"peer", node_id_to_string(peer)},
                                   {"code", code.has_value() ? to_string(*code) : std::to_string(payload.code)},
                                   {"related", protocol::kind_name(static_cast<MessageKind>(payload.related_kind))},
                                   {"detail", payload.message}});
                const auto related = static_cast<MessageKind>(payload.related_kind);
                if ((related == MessageKind::EventManifestGet || related == MessageKind::EventChunkGet) &&
                    sync_.active(peer)) {
                    sync_.abandon(peer, code.value_or(ErrorCode::UnexpectedMessage));
                }
            } else {
                reply_error(peer, ErrorCode::UnexpectedMessage, kind, "message kind not served here");
            }
        },
        message.payload);
}

void Node::on_session(const NodeId& peer, const network::Session& session) {
    tasks::PeerRecord record{};
    if (auto existing = peers_.get(peer)) {
        record = *existing;
    }
    record.node_id = peer;
    record.capabilities = session.peer_capabilities();
    record.online = true;
    peers_.upsert(record);
    relay_.add_neighbour(peer);
}

void Node::on_disconnect(const NodeId& peer, const Error& reason) {
    relay_.remove_neighbour(peer);
    peers_.set_online(peer, false);
    delegator_.on_peer_disconnected(peer);
    if (sync_.active(peer)) {
        sync_.abandon(peer, ErrorCode::ConnectionReset);
    }
    {
        std::scoped_lock lock(pending_mutex_);
        for (auto it = pending_pings_.begin(); it != pending_pings_.end();) {
            it = it->second.first == peer ? pending_pings_.erase(it) : std::next(it);
        }
    }
    daemon::log_event(StructuredLogger::Level::Info,
                      "peer.disconnected",
                      {{"peer", node_id_to_string(peer)}, {"reason", to_string(reason.code)}});
}

void Node::on_pong(const NodeId& peer, const protocol::PongPayload& pong) {
    std::optional<std::chrono::steady_clock::time_point> sent_at;
    {
        std::scoped_lock lock(pending_mutex_);
        const auto it = pending_pings_.find(pong.sequence);
        if (it != pending_pings_.end() && it->second.first == peer) {
            sent_at = it->second.second;
            pending_pings_.erase(it);
        }
    }
    if (!sent_at.has_value()) {
        return;
    }
    const std::chrono::duration<double, std::milli> rtt = std::chrono::steady_clock::now() - *sent_at;
    peers_.record_latency(peer, rtt.count());
}

void Node::on_relay_deliver(const NodeId& peer, const relay::RelayBeacon& beacon) {
    if (relay_.identity().matches(beacon.recipient_key_hash)) {
        relay_.handle_beacon(beacon, peer);
        return;
    }
    if (config_.can_store) {
        board_.put(beacon);
        return;
    }
    daemon::log_event(StructuredLogger::Level::Info,
                      "protocol.dropped",
                      {{"peer", node_id_to_string(peer)},
                       {"kind", protocol::kind_name(MessageKind::RelayDeliver)},
                       {"reason", "not addressed here and no rendezvous board"}});
}

void Node::on_relay_fetch(const NodeId& peer, const protocol::RelayFetchPayload& fetch) {
    if (!config_.can_store) {
        reply_error(peer, ErrorCode::NotFound, MessageKind::RelayFetch, "no rendezvous board");
        return;
    }
    const auto beacons = board_.get(fetch.prefix);
    if (beacons.empty()) {
        reply_error(peer, ErrorCode::NotFound, MessageKind::RelayFetch, "no beacons for prefix");
        return;
    }
    for (const auto& beacon : beacons) {
        reply(peer, protocol::make_message(protocol::RelayDeliverPayload{beacon}));
    }
}

void Node::on_artifact_get(const NodeId& peer, const protocol::ArtifactGetPayload& request) {
    auto data = artifacts_.get(request.hash);
    if (!data.has_value()) {
        reply_error(peer, ErrorCode::NotFound, MessageKind::ArtifactGet, hash_to_string(request.hash));
        return;
    }
    reply(peer, protocol::make_message(protocol::ArtifactPutPayload{request.hash, std::move(*data)}));
}

void Node::on_artifact_put(const NodeId& peer, protocol::ArtifactPutPayload put) {
    bool requested = false;
    {
        std::scoped_lock lock(pending_mutex_);
        requested = requested_artifacts_.erase(hash_to_string(put.hash)) > 0;
    }
    if (!requested) {
        daemon::log_event(StructuredLogger::Level::Info,
                          "protocol.dropped",
                          {{"peer", node_id_to_string(peer)},
                           {"kind", protocol::kind_name(MessageKind::ArtifactPut)},
                           {"reason", "unsolicited artifact"}});
        return;
    }
    const auto status = artifacts_.put(put.hash, std::move(put.data));
    if (!status.ok()) {
        daemon::log_event(StructuredLogger::Level::Warning,
                          "artifact.rejected",
                          {{"peer", node_id_to_string(peer)},
                           {"hash", hash_to_string(put.hash)},
                           {"code", to_string(status.error().code)}});
    }
}

}  // namespace cortexgrid
