#include "cortexgrid/crypto/CryptoManager.hpp"

#include <openssl/rand.h>

#include <algorithm>
#include <stdexcept>

namespace cortexgrid::crypto {

CryptoManager::CryptoManager()
    : CryptoManager(generate_key()) {}

CryptoManager::CryptoManager(Key key)
    : key_(key) {}

std::vector<std::uint8_t> CryptoManager::seal(std::span<const std::uint8_t> plaintext,
                                              std::span<const std::uint8_t> aad) const {
    const auto nonce = generate_nonce();
    const auto sealed = ChaCha20Poly1305::seal(key_, nonce, plaintext, aad);

    std::vector<std::uint8_t> frame;
    frame.reserve(nonce.bytes.size() + sealed.size());
    frame.insert(frame.end(), nonce.bytes.begin(), nonce.bytes.end());
    frame.insert(frame.end(), sealed.begin(), sealed.end());
    return frame;
}

std::optional<std::vector<std::uint8_t>> CryptoManager::open(std::span<const std::uint8_t> frame,
                                                             std::span<const std::uint8_t> aad) const {
    if (frame.size() < kFrameOverhead) {
        return std::nullopt;
    }
    Nonce nonce{};
    std::copy_n(frame.begin(), nonce.bytes.size(), nonce.bytes.begin());
    return ChaCha20Poly1305::open(key_, nonce, frame.subspan(nonce.bytes.size()), aad);
}

Key CryptoManager::generate_key() {
    Key key{};
    random_bytes(key.bytes);
    return key;
}

Nonce CryptoManager::generate_nonce() {
    Nonce nonce{};
    random_bytes(nonce.bytes);
    return nonce;
}

void CryptoManager::random_bytes(std::span<std::uint8_t> buffer) {
    if (buffer.empty()) {
        return;
    }
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("System randomness unavailable");
    }
}

}  // namespace cortexgrid::crypto
