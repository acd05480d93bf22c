#include "cortexgrid/network/Session.hpp"

#include <utility>

namespace cortexgrid::network {

Session::Session(protocol::SessionParams params,
                 crypto::Key key,
                 NodeIdentity peer,
                 protocol::Capabilities peer_capabilities)
    : params_(params),
      cipher_(key),
      peer_(peer),
      peer_capabilities_(std::move(peer_capabilities)),
      created_at_(std::chrono::steady_clock::now()) {}

std::vector<std::uint8_t> Session::seal(const protocol::Message& message) const {
    return protocol::encode_sealed(message, cipher_);
}

Result<protocol::Message> Session::open(std::span<const std::uint8_t> frame) const {
    if (frame.size() > params_.max_message_size + crypto::CryptoManager::kFrameOverhead + protocol::kEnvelopeHeaderSize) {
        return make_error(ErrorCode::Malformed, "frame exceeds negotiated maximum");
    }
    return protocol::decode_sealed(frame, cipher_);
}

}  // namespace cortexgrid::network
