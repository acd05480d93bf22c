#include "cortexgrid/network/KeyExchange.hpp"

#include "cortexgrid/crypto/CryptoManager.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace cortexgrid::network {

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const noexcept { EVP_PKEY_free(key); }
};

struct PkeyContextDeleter {
    void operator()(EVP_PKEY_CTX* context) const noexcept { EVP_PKEY_CTX_free(context); }
};

using PkeyHandle = std::unique_ptr<EVP_PKEY, PkeyDeleter>;

}  // namespace

EphemeralKeyPair::EphemeralKeyPair(const Secret& secret, const PublicKey& public_key)
    : secret_(secret), public_key_(public_key) {}

EphemeralKeyPair::~EphemeralKeyPair() {
    OPENSSL_cleanse(secret_.data(), secret_.size());
}

EphemeralKeyPair EphemeralKeyPair::generate() {
    Secret secret{};
    crypto::CryptoManager::random_bytes(secret);
    return from_secret(secret);
}

EphemeralKeyPair EphemeralKeyPair::from_secret(const Secret& secret) {
    PkeyHandle key(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, secret.data(), secret.size()));
    if (!key) {
        throw std::runtime_error("Failed to load X25519 private key");
    }
    PublicKey public_key{};
    std::size_t length = public_key.size();
    if (EVP_PKEY_get_raw_public_key(key.get(), public_key.data(), &length) != 1 || length != public_key.size()) {
        throw std::runtime_error("Failed to derive X25519 public key");
    }
    return EphemeralKeyPair(secret, public_key);
}

std::optional<crypto::Key> EphemeralKeyPair::derive_shared_secret(const PublicKey& remote_public) const {
    PkeyHandle local(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, secret_.data(), secret_.size()));
    PkeyHandle remote(EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, remote_public.data(), remote_public.size()));
    if (!local || !remote) {
        return std::nullopt;
    }

    std::unique_ptr<EVP_PKEY_CTX, PkeyContextDeleter> context(EVP_PKEY_CTX_new(local.get(), nullptr));
    if (!context || EVP_PKEY_derive_init(context.get()) != 1 ||
        EVP_PKEY_derive_set_peer(context.get(), remote.get()) != 1) {
        return std::nullopt;
    }

    crypto::Key shared{};
    std::size_t length = shared.bytes.size();
    if (EVP_PKEY_derive(context.get(), shared.bytes.data(), &length) != 1 || length != shared.bytes.size()) {
        return std::nullopt;
    }
    if (std::all_of(shared.bytes.begin(), shared.bytes.end(), [](std::uint8_t value) { return value == 0U; })) {
        return std::nullopt;
    }
    return shared;
}

}  // namespace cortexgrid::network
