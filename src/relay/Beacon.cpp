#include "cortexgrid/relay/Beacon.hpp"

#include "cortexgrid/crypto/Sha256.hpp"

#include <algorithm>

namespace cortexgrid::relay {

bool can_forward(const RelayBeacon& beacon, std::uint8_t max_hops) noexcept {
    return beacon.ttl > 0 && beacon.hop_count < max_hops;
}

RelayBeacon forwarded(const RelayBeacon& beacon) {
    RelayBeacon next = beacon;
    if (next.ttl > 0) {
        --next.ttl;
    }
    if (next.hop_count < 0xFF) {
        ++next.hop_count;
    }
    return next;
}

bool is_expired(const RelayBeacon& beacon, std::uint64_t now_unix, std::chrono::seconds expiry) noexcept {
    if (beacon.created_at > now_unix) {
        return false;
    }
    return now_unix - beacon.created_at > static_cast<std::uint64_t>(expiry.count());
}

protocol::KeyHashPrefix key_hash_prefix(const PublicKey& relay_public_key) {
    const auto digest = crypto::Sha256::digest(relay_public_key);
    protocol::KeyHashPrefix prefix{};
    std::copy_n(digest.begin(), prefix.size(), prefix.begin());
    return prefix;
}

std::string prefix_to_string(const protocol::KeyHashPrefix& prefix) {
    return bytes_to_hex(prefix.data(), prefix.size());
}

std::string dedup_key(const RelayBeacon& beacon) {
    return bytes_to_hex(beacon.nonce.data(), beacon.nonce.size()) + ":" + prefix_to_string(beacon.recipient_key_hash);
}

}  // namespace cortexgrid::relay
