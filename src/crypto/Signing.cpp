#include "cortexgrid/crypto/Signing.hpp"

#include "cortexgrid/crypto/CryptoManager.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace cortexgrid::crypto {

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const noexcept { EVP_PKEY_free(key); }
};

struct MdContextDeleter {
    void operator()(EVP_MD_CTX* context) const noexcept { EVP_MD_CTX_free(context); }
};

using PkeyHandle = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdContextHandle = std::unique_ptr<EVP_MD_CTX, MdContextDeleter>;

PkeyHandle private_key_from_seed(const SigningKeyPair::Seed& seed) {
    PkeyHandle key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()));
    if (!key) {
        throw std::runtime_error("Failed to load Ed25519 private key");
    }
    return key;
}

}  // namespace

SigningKeyPair::SigningKeyPair(const Seed& seed, const PublicKey& public_key)
    : seed_(seed), public_key_(public_key) {}

SigningKeyPair::~SigningKeyPair() {
    OPENSSL_cleanse(seed_.data(), seed_.size());
}

SigningKeyPair SigningKeyPair::generate() {
    Seed seed{};
    CryptoManager::random_bytes(seed);
    return from_seed(seed);
}

SigningKeyPair SigningKeyPair::from_seed(const Seed& seed) {
    const auto key = private_key_from_seed(seed);
    PublicKey public_key{};
    std::size_t length = public_key.size();
    if (EVP_PKEY_get_raw_public_key(key.get(), public_key.data(), &length) != 1 || length != public_key.size()) {
        throw std::runtime_error("Failed to derive Ed25519 public key");
    }
    return SigningKeyPair(seed, public_key);
}

Signature SigningKeyPair::sign(std::span<const std::uint8_t> message) const {
    const auto key = private_key_from_seed(seed_);
    MdContextHandle context(EVP_MD_CTX_new());
    if (!context || EVP_DigestSignInit(context.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        throw std::runtime_error("Failed to initialise Ed25519 signing");
    }
    Signature signature{};
    std::size_t length = signature.size();
    if (EVP_DigestSign(context.get(), signature.data(), &length, message.data(), message.size()) != 1 ||
        length != signature.size()) {
        throw std::runtime_error("Ed25519 signing failed");
    }
    return signature;
}

bool verify_signature(const PublicKey& public_key,
                      std::span<const std::uint8_t> message,
                      const Signature& signature) {
    PkeyHandle key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size()));
    if (!key) {
        return false;
    }
    MdContextHandle context(EVP_MD_CTX_new());
    if (!context || EVP_DigestVerifyInit(context.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(context.get(), signature.data(), signature.size(), message.data(), message.size()) == 1;
}

}  // namespace cortexgrid::crypto
