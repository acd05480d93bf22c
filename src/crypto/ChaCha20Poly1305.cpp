#include "cortexgrid/crypto/ChaCha20Poly1305.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace cortexgrid::crypto {

namespace {

struct CipherContextDeleter {
    void operator()(EVP_CIPHER_CTX* context) const noexcept { EVP_CIPHER_CTX_free(context); }
};

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter>;

CipherContext make_context(bool encrypt, const Key& key, const Nonce& nonce) {
    CipherContext context(EVP_CIPHER_CTX_new());
    if (!context) {
        throw std::runtime_error("Failed to allocate cipher context");
    }
    const int ok = encrypt
        ? EVP_EncryptInit_ex(context.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr)
        : EVP_DecryptInit_ex(context.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr);
    if (ok != 1 ||
        EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(nonce.bytes.size()), nullptr) != 1) {
        throw std::runtime_error("Failed to initialise ChaCha20-Poly1305");
    }
    const int keyed = encrypt
        ? EVP_EncryptInit_ex(context.get(), nullptr, nullptr, key.bytes.data(), nonce.bytes.data())
        : EVP_DecryptInit_ex(context.get(), nullptr, nullptr, key.bytes.data(), nonce.bytes.data());
    if (keyed != 1) {
        throw std::runtime_error("Failed to key ChaCha20-Poly1305");
    }
    return context;
}

}  // namespace

std::vector<std::uint8_t> ChaCha20Poly1305::seal(const Key& key,
                                                 const Nonce& nonce,
                                                 std::span<const std::uint8_t> plaintext,
                                                 std::span<const std::uint8_t> aad) {
    auto context = make_context(true, key, nonce);
    int length = 0;
    if (!aad.empty() &&
        EVP_EncryptUpdate(context.get(), nullptr, &length, aad.data(), static_cast<int>(aad.size())) != 1) {
        throw std::runtime_error("ChaCha20-Poly1305 aad failed");
    }

    std::vector<std::uint8_t> output(plaintext.size() + kTagSize);
    int written = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(context.get(), output.data(), &length, plaintext.data(),
                              static_cast<int>(plaintext.size())) != 1) {
            throw std::runtime_error("ChaCha20-Poly1305 encrypt failed");
        }
        written = length;
    }
    if (EVP_EncryptFinal_ex(context.get(), output.data() + written, &length) != 1) {
        throw std::runtime_error("ChaCha20-Poly1305 finalize failed");
    }
    written += length;

    if (EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(kTagSize),
                            output.data() + written) != 1) {
        throw std::runtime_error("ChaCha20-Poly1305 tag extraction failed");
    }
    output.resize(static_cast<std::size_t>(written) + kTagSize);
    return output;
}

std::optional<std::vector<std::uint8_t>> ChaCha20Poly1305::open(const Key& key,
                                                                const Nonce& nonce,
                                                                std::span<const std::uint8_t> sealed,
                                                                std::span<const std::uint8_t> aad) {
    if (sealed.size() < kTagSize) {
        return std::nullopt;
    }
    const auto ciphertext = sealed.first(sealed.size() - kTagSize);
    const auto tag = sealed.last(kTagSize);

    auto context = make_context(false, key, nonce);
    int length = 0;
    if (!aad.empty() &&
        EVP_DecryptUpdate(context.get(), nullptr, &length, aad.data(), static_cast<int>(aad.size())) != 1) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> plaintext(ciphertext.size());
    int written = 0;
    if (!ciphertext.empty()) {
        if (EVP_DecryptUpdate(context.get(), plaintext.data(), &length, ciphertext.data(),
                              static_cast<int>(ciphertext.size())) != 1) {
            return std::nullopt;
        }
        written = length;
    }

    std::array<std::uint8_t, kTagSize> expected_tag{};
    std::copy(tag.begin(), tag.end(), expected_tag.begin());
    if (EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(kTagSize),
                            expected_tag.data()) != 1) {
        return std::nullopt;
    }
    if (EVP_DecryptFinal_ex(context.get(), plaintext.data() + written, &length) != 1) {
        return std::nullopt;
    }
    plaintext.resize(static_cast<std::size_t>(written + length));
    return plaintext;
}

}  // namespace cortexgrid::crypto
