#pragma once

#include "cortexgrid/Types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace cortexgrid::crypto {

// Ed25519 long-term signing key.
class SigningKeyPair {
public:
    static constexpr std::size_t kSeedSize = 32;
    using Seed = std::array<std::uint8_t, kSeedSize>;

    static SigningKeyPair generate();
    static SigningKeyPair from_seed(const Seed& seed);

    SigningKeyPair(const SigningKeyPair&) = default;
    SigningKeyPair& operator=(const SigningKeyPair&) = default;
    ~SigningKeyPair();

    const PublicKey& public_key() const noexcept { return public_key_; }
    Signature sign(std::span<const std::uint8_t> message) const;

private:
    SigningKeyPair(const Seed& seed, const PublicKey& public_key);

    Seed seed_{};
    PublicKey public_key_{};
};

bool verify_signature(const PublicKey& public_key,
                      std::span<const std::uint8_t> message,
                      const Signature& signature);

}  // namespace cortexgrid::crypto
