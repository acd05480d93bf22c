#include "cortexgrid/crypto/Hkdf.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace cortexgrid::crypto {

namespace {

struct PkeyContextDeleter {
    void operator()(EVP_PKEY_CTX* context) const noexcept { EVP_PKEY_CTX_free(context); }
};

}  // namespace

std::vector<std::uint8_t> Hkdf::derive(std::span<const std::uint8_t> input_key_material,
                                       std::span<const std::uint8_t> salt,
                                       std::span<const std::uint8_t> info,
                                       std::size_t length) {
    std::unique_ptr<EVP_PKEY_CTX, PkeyContextDeleter> context(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
    if (!context || EVP_PKEY_derive_init(context.get()) <= 0 ||
        EVP_PKEY_CTX_set_hkdf_md(context.get(), EVP_sha256()) <= 0) {
        throw std::runtime_error("Failed to initialise HKDF");
    }
    if (!salt.empty() &&
        EVP_PKEY_CTX_set1_hkdf_salt(context.get(), salt.data(), static_cast<int>(salt.size())) <= 0) {
        throw std::runtime_error("Failed to set HKDF salt");
    }
    if (EVP_PKEY_CTX_set1_hkdf_key(context.get(), input_key_material.data(),
                                   static_cast<int>(input_key_material.size())) <= 0) {
        throw std::runtime_error("Failed to set HKDF key");
    }
    if (!info.empty() &&
        EVP_PKEY_CTX_add1_hkdf_info(context.get(), info.data(), static_cast<int>(info.size())) <= 0) {
        throw std::runtime_error("Failed to set HKDF info");
    }

    std::vector<std::uint8_t> output(length);
    std::size_t output_length = output.size();
    if (EVP_PKEY_derive(context.get(), output.data(), &output_length) <= 0 || output_length != length) {
        throw std::runtime_error("HKDF derivation failed");
    }
    return output;
}

Key Hkdf::derive_key(std::span<const std::uint8_t> input_key_material,
                     std::span<const std::uint8_t> salt,
                     std::string_view context) {
    const auto* info = reinterpret_cast<const std::uint8_t*>(context.data());
    const auto material = derive(input_key_material, salt, std::span<const std::uint8_t>(info, context.size()), Key{}.bytes.size());
    Key key{};
    std::copy(material.begin(), material.end(), key.bytes.begin());
    return key;
}

}  // namespace cortexgrid::crypto
