#pragma once

#include "cortexgrid/crypto/ChaCha20Poly1305.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace cortexgrid::crypto {

// Seals frames under one session key. Frame layout: nonce(12) | ciphertext | tag(16).
class CryptoManager {
public:
    static constexpr std::size_t kFrameOverhead = sizeof(Nonce::bytes) + ChaCha20Poly1305::kTagSize;

    CryptoManager();
    explicit CryptoManager(Key key);

    std::vector<std::uint8_t> seal(std::span<const std::uint8_t> plaintext,
                                   std::span<const std::uint8_t> aad = {}) const;
    std::optional<std::vector<std::uint8_t>> open(std::span<const std::uint8_t> frame,
                                                  std::span<const std::uint8_t> aad = {}) const;

    static Key generate_key();
    static Nonce generate_nonce();
    static void random_bytes(std::span<std::uint8_t> buffer);

    const Key& key() const noexcept { return key_; }

private:
    Key key_{};
};

}  // namespace cortexgrid::crypto
