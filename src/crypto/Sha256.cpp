#include "cortexgrid/crypto/Sha256.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace cortexgrid::crypto {

void Sha256::ContextDeleter::operator()(evp_md_ctx_st* context) const noexcept {
    EVP_MD_CTX_free(context);
}

Sha256::Sha256()
    : context_(EVP_MD_CTX_new()) {
    if (!context_ || EVP_DigestInit_ex(context_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialise SHA-256 context");
    }
}

Sha256::~Sha256() = default;

void Sha256::update(std::span<const std::uint8_t> data) {
    if (finalized_ || data.empty()) {
        return;
    }
    if (EVP_DigestUpdate(context_.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

Sha256::Digest Sha256::finalize() {
    Digest digest{};
    unsigned int length = 0;
    if (finalized_ || EVP_DigestFinal_ex(context_.get(), digest.data(), &length) != 1 || length != kDigestSize) {
        throw std::runtime_error("SHA-256 finalize failed");
    }
    finalized_ = true;
    return digest;
}

Sha256::Digest Sha256::digest(std::span<const std::uint8_t> data) {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

}  // namespace cortexgrid::crypto
