#pragma once

#include "cortexgrid/Types.hpp"
#include "cortexgrid/crypto/ChaCha20Poly1305.hpp"

#include <array>
#include <cstdint>
#include <optional>

namespace cortexgrid::network {

// X25519 key pair. Fresh per handshake, or per relay identity epoch.
class EphemeralKeyPair {
public:
    using Secret = std::array<std::uint8_t, 32>;

    static EphemeralKeyPair generate();
    static EphemeralKeyPair from_secret(const Secret& secret);

    EphemeralKeyPair(const EphemeralKeyPair&) = default;
    EphemeralKeyPair& operator=(const EphemeralKeyPair&) = default;
    ~EphemeralKeyPair();

    const PublicKey& public_key() const noexcept { return public_key_; }

    // Raw X25519 output; empty for low-order or otherwise invalid peer keys.
    std::optional<crypto::Key> derive_shared_secret(const PublicKey& remote_public) const;

private:
    EphemeralKeyPair(const Secret& secret, const PublicKey& public_key);

    Secret secret_{};
    PublicKey public_key_{};
};

}  // namespace cortexgrid::network
