#pragma once

#include "cortexgrid/crypto/ChaCha20Poly1305.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace cortexgrid::crypto {

// HKDF-SHA256 (RFC 5869).
class Hkdf {
public:
    static std::vector<std::uint8_t> derive(std::span<const std::uint8_t> input_key_material,
                                            std::span<const std::uint8_t> salt,
                                            std::span<const std::uint8_t> info,
                                            std::size_t length);

    static Key derive_key(std::span<const std::uint8_t> input_key_material,
                          std::span<const std::uint8_t> salt,
                          std::string_view context);
};

}  // namespace cortexgrid::crypto
