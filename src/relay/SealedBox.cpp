#include "cortexgrid/relay/SealedBox.hpp"

#include "cortexgrid/crypto/ChaCha20Poly1305.hpp"
#include "cortexgrid/crypto/CryptoManager.hpp"
#include "cortexgrid/crypto/Hkdf.hpp"

#include <algorithm>
#include <stdexcept>

namespace cortexgrid::relay {

namespace {

crypto::Key box_key(const crypto::Key& shared_secret, const PublicKey& ephemeral, const PublicKey& recipient) {
    std::array<std::uint8_t, 64> salt{};
    std::copy(ephemeral.begin(), ephemeral.end(), salt.begin());
    std::copy(recipient.begin(), recipient.end(), salt.begin() + 32);
    return crypto::Hkdf::derive_key(shared_secret.bytes, salt, kRelayKeyContext);
}

}  // namespace

std::vector<std::uint8_t> SealedBox::seal(const PublicKey& recipient, std::span<const std::uint8_t> plaintext) {
    const auto ephemeral = network::EphemeralKeyPair::generate();
    const auto shared = ephemeral.derive_shared_secret(recipient);
    if (!shared.has_value()) {
        throw std::invalid_argument("relay recipient key is not a valid X25519 point");
    }

    const auto key = box_key(*shared, ephemeral.public_key(), recipient);
    const auto nonce = crypto::CryptoManager::generate_nonce();
    const auto ciphertext = crypto::ChaCha20Poly1305::seal(key, nonce, plaintext, recipient);

    std::vector<std::uint8_t> sealed;
    sealed.reserve(kOverhead + plaintext.size());
    sealed.insert(sealed.end(), ephemeral.public_key().begin(), ephemeral.public_key().end());
    sealed.insert(sealed.end(), nonce.bytes.begin(), nonce.bytes.end());
    sealed.insert(sealed.end(), ciphertext.begin(), ciphertext.end());
    return sealed;
}

std::optional<std::vector<std::uint8_t>> SealedBox::open(const network::EphemeralKeyPair& recipient,
                                                         std::span<const std::uint8_t> sealed) {
    if (sealed.size() < kOverhead) {
        return std::nullopt;
    }

    PublicKey ephemeral{};
    std::copy_n(sealed.begin(), ephemeral.size(), ephemeral.begin());
    crypto::Nonce nonce{};
    std::copy_n(sealed.begin() + ephemeral.size(), nonce.bytes.size(), nonce.bytes.begin());

    const auto shared = recipient.derive_shared_secret(ephemeral);
    if (!shared.has_value()) {
        return std::nullopt;
    }

    const auto key = box_key(*shared, ephemeral, recipient.public_key());
    return crypto::ChaCha20Poly1305::open(key,
                                          nonce,
                                          sealed.subspan(ephemeral.size() + nonce.bytes.size()),
                                          recipient.public_key());
}

}  // namespace cortexgrid::relay
