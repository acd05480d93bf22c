#pragma once

#include "cortexgrid/Types.hpp"
#include "cortexgrid/network/KeyExchange.hpp"
#include "cortexgrid/protocol/Message.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <vector>

namespace cortexgrid::relay {

// Relay receive key that is replaced every rotation interval so beacons
// addressed to this node cannot be linked across epochs. The previous key
// stays valid for one more interval.
class RotatingIdentity {
public:
    using Clock = std::chrono::steady_clock;

    explicit RotatingIdentity(std::chrono::seconds rotation_interval, Clock::time_point now = Clock::now());

    // Rotates when the interval has elapsed. Returns true on rotation.
    bool maybe_rotate(Clock::time_point now);
    void rotate(Clock::time_point now);

    PublicKey public_key() const;
    protocol::KeyHashPrefix key_hash() const;

    bool matches(const protocol::KeyHashPrefix& prefix) const;
    // Current key first, then the retained previous one.
    std::vector<network::EphemeralKeyPair> keys_for(const protocol::KeyHashPrefix& prefix) const;
    std::vector<protocol::KeyHashPrefix> active_prefixes() const;

private:
    struct Epoch {
        network::EphemeralKeyPair keys;
        protocol::KeyHashPrefix hash{};
    };

    static Epoch make_epoch();

    std::chrono::seconds rotation_interval_;
    Epoch current_;
    std::optional<Epoch> previous_;
    Clock::time_point rotated_at_;
    mutable std::mutex mutex_;
};

}  // namespace cortexgrid::relay
