#pragma once

#include "cortexgrid/Types.hpp"
#include "cortexgrid/network/KeyExchange.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace cortexgrid::relay {

inline constexpr std::string_view kRelayKeyContext = "cortexgrid-relay-v1";

// Anonymous public-key encryption for beacon payloads. The sender uses a
// throwaway X25519 key, so the sealed bytes carry nothing that identifies it.
// Layout: ephemeral_pub(32) | nonce(12) | ciphertext | tag(16).
class SealedBox {
public:
    static constexpr std::size_t kOverhead = 32 + 12 + 16;

    static std::vector<std::uint8_t> seal(const PublicKey& recipient, std::span<const std::uint8_t> plaintext);
    static std::optional<std::vector<std::uint8_t>> open(const network::EphemeralKeyPair& recipient,
                                                         std::span<const std::uint8_t> sealed);
};

}  // namespace cortexgrid::relay
