#pragma once

#include "cortexgrid/Config.hpp"
#include "cortexgrid/Error.hpp"
#include "cortexgrid/core/Identity.hpp"
#include "cortexgrid/network/KeyExchange.hpp"
#include "cortexgrid/network/NonceLedger.hpp"
#include "cortexgrid/network/Session.hpp"
#include "cortexgrid/protocol/Message.hpp"

#include <chrono>
#include <optional>
#include <string_view>
#include <variant>

namespace cortexgrid::test {
class HandshakeTestAccess;
}

namespace cortexgrid::network {

inline constexpr std::string_view kSessionKeyContext = "cortexgrid-session-v1";

struct HandshakeSettings {
    std::chrono::seconds replay_window{std::chrono::minutes(5)};
    std::chrono::milliseconds timeout{std::chrono::milliseconds(2000)};
    std::uint32_t heartbeat_interval_ms{30000};
    std::uint32_t max_message_size{protocol::kMaxMessageSize};
    protocol::Capabilities capabilities{};

    static HandshakeSettings from_config(const Config& config);
};

enum class HandshakeRole {
    Initiator,
    Responder
};

enum class HandshakeStage {
    Initial,
    HelloSent,
    ChallengeSent,
    ProveSent,
    Completed,
    Failed
};

const char* to_string(HandshakeStage stage) noexcept;

// One in-progress handshake. All progress lives in the tagged state, so
// dropping the object (timeout, cancel, disconnect) discards everything.
class Handshake {
public:
    using Clock = std::chrono::steady_clock;

    static Handshake initiator(const LocalIdentity& identity,
                               NonceLedger& ledger,
                               HandshakeSettings settings,
                               std::optional<NodeId> expected_peer = std::nullopt);
    static Handshake responder(const LocalIdentity& identity,
                               NonceLedger& ledger,
                               HandshakeSettings settings);

    HandshakeRole role() const noexcept { return role_; }
    HandshakeStage stage() const noexcept;
    bool completed() const noexcept { return stage() == HandshakeStage::Completed; }
    bool failed() const noexcept { return stage() == HandshakeStage::Failed; }

    // Initiator only; produces HELLO.
    Result<protocol::Message> start();

    // Feeds one inbound handshake message. Returns the reply to send, if any.
    Result<std::optional<protocol::Message>> process(const protocol::Message& message,
                                                     Clock::time_point now = Clock::now());

    bool expired(Clock::time_point now) const noexcept;
    void cancel();

    const Session* session() const noexcept;
    std::optional<Session> take_session();
    std::optional<Error> failure() const;
    std::optional<NodeId> remote_node_id() const noexcept { return remote_node_id_; }
    std::chrono::milliseconds elapsed(Clock::time_point now = Clock::now()) const;

private:
    friend class cortexgrid::test::HandshakeTestAccess;

    struct Initial {};
    struct HelloSent {
        EphemeralKeyPair ephemeral;
        protocol::HelloPayload hello;
    };
    struct ChallengeSent {
        EphemeralKeyPair ephemeral;
        protocol::HelloPayload hello;
        protocol::ChallengeNonce nonce{};
        crypto::Key key{};
    };
    struct ProveSent {
        crypto::Key key{};
        NodeIdentity peer{};
        protocol::Capabilities peer_capabilities{};
    };
    struct Completed {
        Session session;
    };
    struct Failed {
        Error error;
    };

    using State = std::variant<Initial, HelloSent, ChallengeSent, ProveSent, Completed, Failed>;

    Handshake(HandshakeRole role,
              const LocalIdentity& identity,
              NonceLedger& ledger,
              HandshakeSettings settings,
              std::optional<NodeId> expected_peer);

    Result<std::optional<protocol::Message>> on_hello(const protocol::HelloPayload& hello);
    Result<std::optional<protocol::Message>> on_challenge(HelloSent& state, const protocol::ChallengePayload& challenge);
    Result<std::optional<protocol::Message>> on_prove(ChallengeSent& state, const protocol::ProvePayload& prove);
    Result<std::optional<protocol::Message>> on_welcome(ProveSent& state, const protocol::WelcomePayload& welcome);

    Error fail(ErrorCode code, std::string message);

    HandshakeRole role_;
    const LocalIdentity* identity_;
    NonceLedger* ledger_;
    HandshakeSettings settings_;
    std::optional<NodeId> expected_peer_;
    std::optional<NodeId> remote_node_id_;
    Clock::time_point started_at_;
    State state_{Initial{}};
};

}  // namespace cortexgrid::network
