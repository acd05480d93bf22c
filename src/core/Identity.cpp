#include "cortexgrid/core/Identity.hpp"

#include "cortexgrid/crypto/Sha256.hpp"

#include <openssl/crypto.h>

#include <algorithm>
#include <utility>

namespace cortexgrid {

NodeId derive_node_id(const PublicKey& signing_pubkey) {
    return crypto::Sha256::digest(signing_pubkey);
}

bool node_id_matches(const NodeId& node_id, const PublicKey& signing_pubkey) {
    const auto expected = derive_node_id(signing_pubkey);
    return CRYPTO_memcmp(expected.data(), node_id.data(), node_id.size()) == 0;
}

LocalIdentity::LocalIdentity(crypto::SigningKeyPair keys)
    : keys_(std::move(keys)),
      node_id_(derive_node_id(keys_.public_key())) {}

LocalIdentity LocalIdentity::generate() {
    return LocalIdentity(crypto::SigningKeyPair::generate());
}

LocalIdentity LocalIdentity::from_seed(const crypto::SigningKeyPair::Seed& seed) {
    return LocalIdentity(crypto::SigningKeyPair::from_seed(seed));
}

std::optional<LocalIdentity> LocalIdentity::from_seed_hex(const std::string& hex) {
    // Seeds share the 32-byte hex encoding used for node ids.
    const auto parsed = node_id_from_string(hex);
    if (!parsed.has_value()) {
        return std::nullopt;
    }
    crypto::SigningKeyPair::Seed seed{};
    std::copy(parsed->begin(), parsed->end(), seed.begin());
    return from_seed(seed);
}

}  // namespace cortexgrid
