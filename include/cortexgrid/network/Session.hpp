#pragma once

#include "cortexgrid/Error.hpp"
#include "cortexgrid/Types.hpp"
#include "cortexgrid/core/Identity.hpp"
#include "cortexgrid/crypto/CryptoManager.hpp"
#include "cortexgrid/protocol/Message.hpp"

#include <chrono>
#include <cstdint>
#include <span>
#include <vector>

namespace cortexgrid::network {

// Authenticated channel state produced by a completed handshake. Never persisted.
class Session {
public:
    Session(protocol::SessionParams params,
            crypto::Key key,
            NodeIdentity peer,
            protocol::Capabilities peer_capabilities);

    const SessionId& id() const noexcept { return params_.session_id; }
    const protocol::SessionParams& params() const noexcept { return params_; }
    const NodeIdentity& peer() const noexcept { return peer_; }
    const protocol::Capabilities& peer_capabilities() const noexcept { return peer_capabilities_; }
    std::chrono::steady_clock::time_point created_at() const noexcept { return created_at_; }
    const crypto::Key& key() const noexcept { return cipher_.key(); }

    std::vector<std::uint8_t> seal(const protocol::Message& message) const;
    // DecryptionFailed means the session must be torn down.
    Result<protocol::Message> open(std::span<const std::uint8_t> frame) const;

private:
    protocol::SessionParams params_{};
    crypto::CryptoManager cipher_;
    NodeIdentity peer_{};
    protocol::Capabilities peer_capabilities_{};
    std::chrono::steady_clock::time_point created_at_{};
};

}  // namespace cortexgrid::network
