#include "cortexgrid/core/Identity.hpp"
#include "cortexgrid/crypto/ChaCha20Poly1305.hpp"
#include "cortexgrid/crypto/CryptoManager.hpp"
#include "cortexgrid/crypto/Hkdf.hpp"
#include "cortexgrid/crypto/Sha256.hpp"
#include "cortexgrid/crypto/Signing.hpp"
#include "cortexgrid/network/KeyExchange.hpp"

#include <cassert>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

using namespace cortexgrid;

namespace {

std::vector<std::uint8_t> bytes_of(std::string_view text) {
    return {text.begin(), text.end()};
}

std::string hex(std::span<const std::uint8_t> data) {
    return bytes_to_hex(data.data(), data.size());
}

void sha256_known_answer() {
    const auto abc = bytes_of("abc");
    const auto digest = crypto::Sha256::digest(abc);
    assert(hex(digest) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    crypto::Sha256 incremental;
    incremental.update(bytes_of("a"));
    incremental.update(bytes_of("bc"));
    assert(incremental.finalize() == digest);

    assert(crypto::Sha256::digest(bytes_of("abd")) != digest);
}

void hkdf_rfc5869_case_one() {
    const std::vector<std::uint8_t> ikm(22, 0x0b);
    std::vector<std::uint8_t> salt;
    for (std::uint8_t i = 0x00; i <= 0x0c; ++i) {
        salt.push_back(i);
    }
    std::vector<std::uint8_t> info;
    for (std::uint8_t i = 0xf0; i <= 0xf9; ++i) {
        info.push_back(i);
    }
    const auto okm = crypto::Hkdf::derive(ikm, salt, info, 42);
    assert(hex(okm) ==
           "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf34007208d5b887185865");
}

void aead_rejects_tampering() {
    const auto key = crypto::CryptoManager::generate_key();
    const auto nonce = crypto::CryptoManager::generate_nonce();
    const auto plaintext = bytes_of("event chunk payload");
    const auto aad = bytes_of("header");

    auto sealed = crypto::ChaCha20Poly1305::seal(key, nonce, plaintext, aad);
    assert(sealed.size() == plaintext.size() + crypto::ChaCha20Poly1305::kTagSize);

    const auto opened = crypto::ChaCha20Poly1305::open(key, nonce, sealed, aad);
    assert(opened.has_value());
    assert(*opened == plaintext);

    const auto wrong_aad = crypto::ChaCha20Poly1305::open(key, nonce, sealed, bytes_of("other"));
    assert(!wrong_aad.has_value());

    sealed[0] ^= 0x01;
    assert(!crypto::ChaCha20Poly1305::open(key, nonce, sealed, aad).has_value());
}

void session_cipher_frames() {
    crypto::CryptoManager sender(crypto::CryptoManager::generate_key());
    crypto::CryptoManager receiver(sender.key());
    crypto::CryptoManager stranger(crypto::CryptoManager::generate_key());

    const auto message = bytes_of("ping");
    auto frame = sender.seal(message);
    assert(frame.size() == message.size() + crypto::CryptoManager::kFrameOverhead);

    const auto first = sender.seal(message);
    assert(first != frame);

    const auto opened = receiver.open(frame);
    assert(opened.has_value() && *opened == message);
    assert(!stranger.open(frame).has_value());

    frame.back() ^= 0x80;
    assert(!receiver.open(frame).has_value());
    assert(!receiver.open(std::vector<std::uint8_t>(4, 0)).has_value());
}

void signatures_bind_key_and_message() {
    crypto::SigningKeyPair::Seed seed{};
    seed.fill(0x42);
    const auto keys = crypto::SigningKeyPair::from_seed(seed);
    const auto again = crypto::SigningKeyPair::from_seed(seed);
    assert(keys.public_key() == again.public_key());

    const auto message = bytes_of("hello");
    const auto signature = keys.sign(message);
    assert(crypto::verify_signature(keys.public_key(), message, signature));
    assert(!crypto::verify_signature(keys.public_key(), bytes_of("hellp"), signature));

    const auto other = crypto::SigningKeyPair::generate();
    assert(!crypto::verify_signature(other.public_key(), message, signature));

    auto forged = signature;
    forged[10] ^= 0x01;
    assert(!crypto::verify_signature(keys.public_key(), message, forged));
}

void key_agreement_matches() {
    const auto alice = network::EphemeralKeyPair::generate();
    const auto bob = network::EphemeralKeyPair::generate();
    const auto ab = alice.derive_shared_secret(bob.public_key());
    const auto ba = bob.derive_shared_secret(alice.public_key());
    assert(ab.has_value() && ba.has_value());
    assert(ab->bytes == ba->bytes);

    const PublicKey low_order{};
    assert(!alice.derive_shared_secret(low_order).has_value());
}

void identity_from_seed() {
    const std::string seed_hex(64, 'a');
    const auto identity = LocalIdentity::from_seed_hex(seed_hex);
    assert(identity.has_value());
    assert(identity->node_id() == derive_node_id(identity->public_key()));
    assert(node_id_matches(identity->node_id(), identity->public_key()));

    const auto repeat = LocalIdentity::from_seed_hex(seed_hex);
    assert(repeat->node_id() == identity->node_id());

    assert(!LocalIdentity::from_seed_hex("abc").has_value());
    assert(!LocalIdentity::from_seed_hex(std::string(64, 'z')).has_value());

    const auto other = LocalIdentity::generate();
    assert(!node_id_matches(identity->node_id(), other.public_key()));
}

}  // namespace

int main() {
    sha256_known_answer();
    hkdf_rfc5869_case_one();
    aead_rejects_tampering();
    session_cipher_frames();
    signatures_bind_key_and_message();
    key_agreement_matches();
    identity_from_seed();
    return 0;
}
