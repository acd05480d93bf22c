#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace cortexgrid::crypto {

struct Key {
    std::array<std::uint8_t, 32> bytes{};
};

struct Nonce {
    std::array<std::uint8_t, 12> bytes{};
};

class ChaCha20Poly1305 {
public:
    static constexpr std::size_t kTagSize = 16;

    // Returns ciphertext followed by the 16-byte tag.
    static std::vector<std::uint8_t> seal(const Key& key,
                                          const Nonce& nonce,
                                          std::span<const std::uint8_t> plaintext,
                                          std::span<const std::uint8_t> aad = {});

    // Empty when the tag does not authenticate.
    static std::optional<std::vector<std::uint8_t>> open(const Key& key,
                                                         const Nonce& nonce,
                                                         std::span<const std::uint8_t> sealed,
                                                         std::span<const std::uint8_t> aad = {});
};

}  // namespace cortexgrid::crypto
