#pragma once

#include "cortexgrid/Config.hpp"
#include "cortexgrid/Types.hpp"
#include "cortexgrid/protocol/Message.hpp"
#include "cortexgrid/relay/Beacon.hpp"
#include "cortexgrid/relay/BeaconStore.hpp"
#include "cortexgrid/relay/DedupCache.hpp"
#include "cortexgrid/relay/RendezvousBoard.hpp"
#include "cortexgrid/relay/RotatingIdentity.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace cortexgrid::relay {

struct RelaySettings {
    bool enabled{true};
    std::uint8_t default_ttl{kDefaultTtl};
    std::uint8_t max_hops{kDefaultMaxHops};
    std::chrono::seconds beacon_expiry{std::chrono::hours(1)};
    std::chrono::seconds identity_rotation{std::chrono::minutes(15)};
    std::size_t dedup_capacity{4096};

    static RelaySettings from_config(const Config& config);
};

enum class BeaconOutcome {
    Delivered,
    Forwarded,
    Duplicate,
    Expired,
    Dropped
};

const char* to_string(BeaconOutcome outcome) noexcept;

// One participant in the relay mesh. Beacons it cannot open are passed on to
// neighbours until their ttl runs out; no acknowledgement travels back.
class RelayNode {
public:
    using SendFn = std::function<bool(const NodeId& neighbour, const protocol::Message& message)>;

    RelayNode(RelaySettings settings, SendFn send, RendezvousBoard* board = nullptr);

    void add_neighbour(const NodeId& neighbour);
    void remove_neighbour(const NodeId& neighbour);
    std::vector<NodeId> neighbours() const;

    void attach_board(RendezvousBoard* board);

    const RotatingIdentity& identity() const noexcept { return identity_; }
    RotatingIdentity& identity() noexcept { return identity_; }

    // Seals plaintext to a recipient's current relay key.
    RelayBeacon compose(const PublicKey& recipient_relay_key,
                        std::span<const std::uint8_t> plaintext,
                        std::optional<std::uint8_t> ttl = std::nullopt) const;

    // Originates a beacon: sends RELAY_BEACON to every neighbour. Returns how many sends succeeded.
    std::size_t broadcast(const RelayBeacon& beacon);

    BeaconOutcome handle_beacon(const RelayBeacon& beacon,
                                std::optional<NodeId> from = std::nullopt,
                                std::uint64_t now_unix = unix_seconds_now());

    // Polls the rendezvous board for our prefixes and opens what it finds.
    std::size_t fetch();

    std::vector<DeliveredMessage> drain_inbox();
    std::size_t inbox_size() const { return inbox_.size(); }

    // Rotates the relay key and prunes an owned in-memory board when due.
    void tick(RotatingIdentity::Clock::time_point now = RotatingIdentity::Clock::now());

    struct Stats {
        std::uint64_t delivered{0};
        std::uint64_t forwarded{0};
        std::uint64_t duplicates{0};
        std::uint64_t expired{0};
        std::uint64_t dropped{0};
    };
    Stats stats() const;

private:
    bool try_deliver(const RelayBeacon& beacon);
    void count(BeaconOutcome outcome);

    RelaySettings settings_;
    SendFn send_;
    RendezvousBoard* board_;
    RotatingIdentity identity_;
    DedupCache dedup_;
    BeaconStore inbox_;

    std::unordered_map<std::string, NodeId> neighbours_;
    Stats stats_{};
    mutable std::mutex mutex_;
};

}  // namespace cortexgrid::relay
