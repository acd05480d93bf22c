#pragma once

#include "cortexgrid/Types.hpp"
#include "cortexgrid/crypto/Signing.hpp"

#include <optional>
#include <span>
#include <string>

namespace cortexgrid {

struct NodeIdentity {
    NodeId node_id{};
    PublicKey signing_pubkey{};
    PublicKey encryption_pubkey{};
};

NodeId derive_node_id(const PublicKey& signing_pubkey);
bool node_id_matches(const NodeId& node_id, const PublicKey& signing_pubkey);

class LocalIdentity {
public:
    static LocalIdentity generate();
    static LocalIdentity from_seed(const crypto::SigningKeyPair::Seed& seed);
    // Accepts 64 hex characters; empty on malformed input.
    static std::optional<LocalIdentity> from_seed_hex(const std::string& hex);

    const NodeId& node_id() const noexcept { return node_id_; }
    const PublicKey& public_key() const noexcept { return keys_.public_key(); }
    Signature sign(std::span<const std::uint8_t> message) const { return keys_.sign(message); }

private:
    explicit LocalIdentity(crypto::SigningKeyPair keys);

    crypto::SigningKeyPair keys_;
    NodeId node_id_{};
};

}  // namespace cortexgrid
