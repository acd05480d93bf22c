#include "cortexgrid/relay/RelayNode.hpp"

#include "cortexgrid/crypto/CryptoManager.hpp"
#include "cortexgrid/daemon/StructuredLogger.hpp"
#include "cortexgrid/relay/SealedBox.hpp"

#include <utility>

namespace cortexgrid::relay {

namespace {

using daemon::StructuredLogger;
using daemon::log_event;

void log_drop(const RelayBeacon& beacon, std::string_view reason) {
    log_event(StructuredLogger::Level::Info,
              "relay.beacon_dropped",
              {{"reason", std::string(reason)},
               {"recipient", prefix_to_string(beacon.recipient_key_hash)},
               {"ttl", std::to_string(beacon.ttl)},
               {"hops", std::to_string(beacon.hop_count)}});
}

}  // namespace

RelaySettings RelaySettings::from_config(const Config& config) {
    RelaySettings settings{};
    settings.enabled = config.can_relay;
    settings.default_ttl = config.relay_default_ttl;
    settings.max_hops = config.relay_max_hops;
    settings.beacon_expiry = config.relay_beacon_expiry;
    settings.identity_rotation = config.relay_identity_rotation;
    settings.dedup_capacity = config.relay_dedup_capacity;
    return settings;
}

const char* to_string(BeaconOutcome outcome) noexcept {
    switch (outcome) {
        case BeaconOutcome::Delivered:
            return "delivered";
        case BeaconOutcome::Forwarded:
            return "forwarded";
        case BeaconOutcome::Duplicate:
            return "duplicate";
        case BeaconOutcome::Expired:
            return "expired";
        case BeaconOutcome::Dropped:
            return "dropped";
    }
    return "dropped";
}

RelayNode::RelayNode(RelaySettings settings, SendFn send, RendezvousBoard* board)
    : settings_(settings),
      send_(std::move(send)),
      board_(board),
      identity_(settings.identity_rotation),
      dedup_(settings.dedup_capacity) {}

void RelayNode::add_neighbour(const NodeId& neighbour) {
    std::scoped_lock lock(mutex_);
    neighbours_.insert_or_assign(node_id_to_string(neighbour), neighbour);
}

void RelayNode::remove_neighbour(const NodeId& neighbour) {
    std::scoped_lock lock(mutex_);
    neighbours_.erase(node_id_to_string(neighbour));
}

std::vector<NodeId> RelayNode::neighbours() const {
    std::scoped_lock lock(mutex_);
    std::vector<NodeId> result;
    result.reserve(neighbours_.size());
    for (const auto& [_, id] : neighbours_) {
        result.push_back(id);
    }
    return result;
}

void RelayNode::attach_board(RendezvousBoard* board) {
    std::scoped_lock lock(mutex_);
    board_ = board;
}

RelayBeacon RelayNode::compose(const PublicKey& recipient_relay_key,
                               std::span<const std::uint8_t> plaintext,
                               std::optional<std::uint8_t> ttl) const {
    RelayBeacon beacon{};
    crypto::CryptoManager::random_bytes(beacon.nonce);
    beacon.recipient_key_hash = key_hash_prefix(recipient_relay_key);
    beacon.ttl = ttl.value_or(settings_.default_ttl);
    beacon.hop_count = 0;
    beacon.created_at = unix_seconds_now();
    beacon.payload = SealedBox::seal(recipient_relay_key, plaintext);
    return beacon;
}

std::size_t RelayNode::broadcast(const RelayBeacon& beacon) {
    dedup_.insert(beacon);
    const auto message = protocol::make_message(beacon);
    std::size_t sent = 0;
    for (const auto& neighbour : neighbours()) {
        if (send_ && send_(neighbour, message)) {
            ++sent;
        }
    }
    return sent;
}

BeaconOutcome RelayNode::handle_beacon(const RelayBeacon& beacon,
                                       std::optional<NodeId> from,
                                       std::uint64_t now_unix) {
    if (!dedup_.insert(beacon)) {
        count(BeaconOutcome::Duplicate);
        return BeaconOutcome::Duplicate;
    }

    if (is_expired(beacon, now_unix, settings_.beacon_expiry)) {
        log_drop(beacon, "expired");
        count(BeaconOutcome::Expired);
        return BeaconOutcome::Expired;
    }

    if (identity_.matches(beacon.recipient_key_hash) && try_deliver(beacon)) {
        count(BeaconOutcome::Delivered);
        return BeaconOutcome::Delivered;
    }

    if (!settings_.enabled || !can_forward(beacon, settings_.max_hops)) {
        log_drop(beacon, settings_.enabled ? "ttl_exhausted" : "relay_disabled");
        count(BeaconOutcome::Dropped);
        return BeaconOutcome::Dropped;
    }

    const auto next = forwarded(beacon);
    const auto message = protocol::make_message(protocol::RelayForwardPayload{next});

    RendezvousBoard* board = nullptr;
    std::vector<NodeId> targets;
    {
        std::scoped_lock lock(mutex_);
        board = board_;
        for (const auto& [_, id] : neighbours_) {
            if (!from.has_value() || id != *from) {
                targets.push_back(id);
            }
        }
    }

    for (const auto& target : targets) {
        if (send_ && !send_(target, message)) {
            log_event(StructuredLogger::Level::Warning,
                      "relay.forward_failed",
                      {{"neighbour", node_id_to_string(target)}});
        }
    }
    if (board != nullptr) {
        board->put(next);
    }

    count(BeaconOutcome::Forwarded);
    return BeaconOutcome::Forwarded;
}

std::size_t RelayNode::fetch() {
    RendezvousBoard* board = nullptr;
    {
        std::scoped_lock lock(mutex_);
        board = board_;
    }
    if (board == nullptr) {
        return 0;
    }

    std::size_t delivered = 0;
    for (const auto& prefix : identity_.active_prefixes()) {
        for (const auto& beacon : board->get(prefix)) {
            if (dedup_.contains(beacon)) {
                continue;
            }
            if (try_deliver(beacon)) {
                dedup_.insert(beacon);
                count(BeaconOutcome::Delivered);
                ++delivered;
            }
        }
    }
    return delivered;
}

std::vector<DeliveredMessage> RelayNode::drain_inbox() {
    return inbox_.drain();
}

void RelayNode::tick(RotatingIdentity::Clock::time_point now) {
    identity_.maybe_rotate(now);
    RendezvousBoard* board = nullptr;
    {
        std::scoped_lock lock(mutex_);
        board = board_;
    }
    if (auto* in_memory = dynamic_cast<InMemoryRendezvousBoard*>(board)) {
        in_memory->prune(unix_seconds_now());
    }
}

RelayNode::Stats RelayNode::stats() const {
    std::scoped_lock lock(mutex_);
    return stats_;
}

bool RelayNode::try_deliver(const RelayBeacon& beacon) {
    for (const auto& keys : identity_.keys_for(beacon.recipient_key_hash)) {
        auto plaintext = SealedBox::open(keys, beacon.payload);
        if (plaintext.has_value()) {
            inbox_.push(DeliveredMessage{beacon.nonce, std::move(*plaintext), beacon.created_at, beacon.hop_count});
            return true;
        }
    }
    return false;
}

void RelayNode::count(BeaconOutcome outcome) {
    std::scoped_lock lock(mutex_);
    switch (outcome) {
        case BeaconOutcome::Delivered:
            ++stats_.delivered;
            break;
        case BeaconOutcome::Forwarded:
            ++stats_.forwarded;
            break;
        case BeaconOutcome::Duplicate:
            ++stats_.duplicates;
            break;
        case BeaconOutcome::Expired:
            ++stats_.expired;
            break;
        case BeaconOutcome::Dropped:
            ++stats_.dropped;
            break;
    }
}

}  // namespace cortexgrid::relay
