#pragma once

#include "cortexgrid/Types.hpp"
#include "cortexgrid/protocol/Message.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace cortexgrid::relay {

using RelayBeacon = protocol::RelayBeaconPayload;

inline constexpr std::uint8_t kDefaultTtl = 7;
inline constexpr std::uint8_t kDefaultMaxHops = 15;

// ttl > 0 and hop_count below the hop ceiling.
bool can_forward(const RelayBeacon& beacon, std::uint8_t max_hops = kDefaultMaxHops) noexcept;

// Copy for the next hop: ttl - 1, hop_count + 1.
RelayBeacon forwarded(const RelayBeacon& beacon);

bool is_expired(const RelayBeacon& beacon, std::uint64_t now_unix, std::chrono::seconds expiry) noexcept;

// First eight bytes of SHA-256 over a relay public key.
protocol::KeyHashPrefix key_hash_prefix(const PublicKey& relay_public_key);

std::string prefix_to_string(const protocol::KeyHashPrefix& prefix);

// Identity used for duplicate suppression: nonce plus recipient hash.
std::string dedup_key(const RelayBeacon& beacon);

}  // namespace cortexgrid::relay
