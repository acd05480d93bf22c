#include "cortexgrid/network/Handshake.hpp"

#include "cortexgrid/crypto/CryptoManager.hpp"
#include "cortexgrid/crypto/Hkdf.hpp"
#include "cortexgrid/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <utility>

namespace cortexgrid::network {

namespace {

using daemon::StructuredLogger;
using daemon::log_event;

crypto::Key derive_session_key(const crypto::Key& shared_secret,
                               const PublicKey& initiator_ephemeral,
                               const PublicKey& responder_ephemeral) {
    std::array<std::uint8_t, 64> salt{};
    std::copy(initiator_ephemeral.begin(), initiator_ephemeral.end(), salt.begin());
    std::copy(responder_ephemeral.begin(), responder_ephemeral.end(), salt.begin() + 32);
    return crypto::Hkdf::derive_key(shared_secret.bytes, salt, kSessionKeyContext);
}

const char* role_name(HandshakeRole role) {
    return role == HandshakeRole::Initiator ? "initiator" : "responder";
}

}  // namespace

HandshakeSettings HandshakeSettings::from_config(const Config& config) {
    HandshakeSettings settings{};
    settings.replay_window = config.handshake_replay_window;
    settings.timeout = config.handshake_timeout;
    settings.heartbeat_interval_ms = static_cast<std::uint32_t>(config.heartbeat_interval.count());
    settings.max_message_size = std::min(config.max_message_size, protocol::kMaxMessageSize);
    settings.capabilities.can_relay = config.can_relay;
    settings.capabilities.can_store = config.can_store;
    settings.capabilities.can_compute = config.can_compute;
    settings.capabilities.max_storage_mb = config.max_storage_mb;
    settings.capabilities.skills = config.skills;
    return settings;
}

const char* to_string(HandshakeStage stage) noexcept {
    switch (stage) {
        case HandshakeStage::Initial:
            return "initial";
        case HandshakeStage::HelloSent:
            return "hello_sent";
        case HandshakeStage::ChallengeSent:
            return "challenge_sent";
        case HandshakeStage::ProveSent:
            return "prove_sent";
        case HandshakeStage::Completed:
            return "completed";
        case HandshakeStage::Failed:
            return "failed";
    }
    return "failed";
}

Handshake::Handshake(HandshakeRole role,
                     const LocalIdentity& identity,
                     NonceLedger& ledger,
                     HandshakeSettings settings,
                     std::optional<NodeId> expected_peer)
    : role_(role),
      identity_(&identity),
      ledger_(&ledger),
      settings_(std::move(settings)),
      expected_peer_(expected_peer),
      started_at_(Clock::now()) {}

Handshake Handshake::initiator(const LocalIdentity& identity,
                               NonceLedger& ledger,
                               HandshakeSettings settings,
                               std::optional<NodeId> expected_peer) {
    return Handshake(HandshakeRole::Initiator, identity, ledger, std::move(settings), expected_peer);
}

Handshake Handshake::responder(const LocalIdentity& identity,
                               NonceLedger& ledger,
                               HandshakeSettings settings) {
    return Handshake(HandshakeRole::Responder, identity, ledger, std::move(settings), std::nullopt);
}

HandshakeStage Handshake::stage() const noexcept {
    return static_cast<HandshakeStage>(state_.index());
}

Result<protocol::Message> Handshake::start() {
    if (role_ != HandshakeRole::Initiator || !std::holds_alternative<Initial>(state_)) {
        return fail(ErrorCode::UnexpectedMessage, "start() is only valid for a fresh initiator");
    }

    auto ephemeral = EphemeralKeyPair::generate();
    protocol::HelloPayload hello{};
    hello.protocol_version = protocol::kProtocolVersion;
    hello.node_id = identity_->node_id();
    hello.signing_pubkey = identity_->public_key();
    hello.capabilities = settings_.capabilities;
    hello.ephemeral_pubkey = ephemeral.public_key();
    hello.timestamp = unix_seconds_now();
    hello.signature = identity_->sign(protocol::hello_signing_bytes(hello));

    started_at_ = Clock::now();
    auto message = protocol::make_message(hello);
    state_ = HelloSent{std::move(ephemeral), std::move(hello)};
    return message;
}

Result<std::optional<protocol::Message>> Handshake::process(const protocol::Message& message,
                                                            Clock::time_point now) {
    if (const auto* failed = std::get_if<Failed>(&state_)) {
        return failed->error;
    }
    if (std::holds_alternative<Completed>(state_)) {
        return fail(ErrorCode::UnexpectedMessage,
                    std::string("handshake already completed, got ") + protocol::kind_name(message.kind()));
    }
    if (expired(now)) {
        return fail(ErrorCode::Timeout, "handshake deadline exceeded");
    }

    if (const auto* error = std::get_if<protocol::ErrorPayload>(&message.payload)) {
        const auto code = error_code_from_wire(error->code).value_or(ErrorCode::UnexpectedMessage);
        return fail(code, "peer aborted handshake: " + error->message);
    }

    if (role_ == HandshakeRole::Responder) {
        if (std::holds_alternative<Initial>(state_)) {
            if (const auto* hello = std::get_if<protocol::HelloPayload>(&message.payload)) {
                return on_hello(*hello);
            }
        } else if (auto* waiting = std::get_if<ChallengeSent>(&state_)) {
            if (const auto* prove = std::get_if<protocol::ProvePayload>(&message.payload)) {
                return on_prove(*waiting, *prove);
            }
        }
    } else {
        if (auto* waiting = std::get_if<HelloSent>(&state_)) {
            if (const auto* challenge = std::get_if<protocol::ChallengePayload>(&message.payload)) {
                return on_challenge(*waiting, *challenge);
            }
        } else if (auto* waiting = std::get_if<ProveSent>(&state_)) {
            if (const auto* welcome = std::get_if<protocol::WelcomePayload>(&message.payload)) {
                return on_welcome(*waiting, *welcome);
            }
        }
    }

    return fail(ErrorCode::UnexpectedMessage,
                std::string(protocol::kind_name(message.kind())) + " in stage " + to_string(stage()));
}

Result<std::optional<protocol::Message>> Handshake::on_hello(const protocol::HelloPayload& hello) {
    remote_node_id_ = hello.node_id;

    if (!node_id_matches(hello.node_id, hello.signing_pubkey)) {
        return fail(ErrorCode::InvalidNodeId, "node id is not the hash of the signing key");
    }

    const auto now = unix_seconds_now();
    const auto drift = now > hello.timestamp ? now - hello.timestamp : hello.timestamp - now;
    if (drift > static_cast<std::uint64_t>(settings_.replay_window.count())) {
        return fail(ErrorCode::ReplayDetected, "hello timestamp outside window by " + std::to_string(drift) + "s");
    }

    if (!crypto::verify_signature(hello.signing_pubkey, protocol::hello_signing_bytes(hello), hello.signature)) {
        return fail(ErrorCode::InvalidSignature, "hello signature rejected");
    }

    if (!protocol::is_supported_protocol_version(hello.protocol_version)) {
        return fail(ErrorCode::VersionMismatch, "peer speaks version " + std::to_string(hello.protocol_version));
    }

    auto ephemeral = EphemeralKeyPair::generate();
    const auto shared = ephemeral.derive_shared_secret(hello.ephemeral_pubkey);
    if (!shared.has_value()) {
        return fail(ErrorCode::Malformed, "unusable ephemeral key in hello");
    }

    protocol::ChallengePayload challenge{};
    crypto::CryptoManager::random_bytes(challenge.nonce);
    challenge.ephemeral_pubkey = ephemeral.public_key();
    challenge.responder_node_id = identity_->node_id();
    challenge.responder_signing_pubkey = identity_->public_key();
    challenge.responder_capabilities = settings_.capabilities;
    challenge.responder_signature = identity_->sign(protocol::challenge_signing_bytes(hello, challenge));

    const auto key = derive_session_key(*shared, hello.ephemeral_pubkey, challenge.ephemeral_pubkey);
    const auto nonce = challenge.nonce;
    state_ = ChallengeSent{std::move(ephemeral), hello, nonce, key};
    return std::optional<protocol::Message>(protocol::make_message(std::move(challenge)));
}

Result<std::optional<protocol::Message>> Handshake::on_challenge(HelloSent& state,
                                                                 const protocol::ChallengePayload& challenge) {
    remote_node_id_ = challenge.responder_node_id;

    if (!node_id_matches(challenge.responder_node_id, challenge.responder_signing_pubkey)) {
        return fail(ErrorCode::InvalidNodeId, "responder node id is not the hash of its signing key");
    }
    if (expected_peer_.has_value() && *expected_peer_ != challenge.responder_node_id) {
        return fail(ErrorCode::InvalidNodeId, "responder is not the expected peer");
    }
    if (!crypto::verify_signature(challenge.responder_signing_pubkey,
                                  protocol::challenge_signing_bytes(state.hello, challenge),
                                  challenge.responder_signature)) {
        return fail(ErrorCode::InvalidSignature, "challenge signature rejected");
    }
    if (!ledger_->record(challenge.responder_node_id, challenge.nonce)) {
        return fail(ErrorCode::ReplayDetected, "challenge nonce already seen");
    }

    const auto shared = state.ephemeral.derive_shared_secret(challenge.ephemeral_pubkey);
    if (!shared.has_value()) {
        return fail(ErrorCode::Malformed, "unusable ephemeral key in challenge");
    }

    ProveSent next{};
    next.key = derive_session_key(*shared, state.hello.ephemeral_pubkey, challenge.ephemeral_pubkey);
    next.peer = NodeIdentity{challenge.responder_node_id, challenge.responder_signing_pubkey, challenge.ephemeral_pubkey};
    next.peer_capabilities = challenge.responder_capabilities;

    protocol::ProvePayload prove{};
    prove.signature = identity_->sign(challenge.nonce);

    state_ = std::move(next);
    return std::optional<protocol::Message>(protocol::make_message(prove));
}

Result<std::optional<protocol::Message>> Handshake::on_prove(ChallengeSent& state,
                                                             const protocol::ProvePayload& prove) {
    if (!crypto::verify_signature(state.hello.signing_pubkey, state.nonce, prove.signature)) {
        return fail(ErrorCode::InvalidSignature, "prove signature rejected");
    }
    if (!ledger_->record(state.hello.node_id, state.nonce)) {
        return fail(ErrorCode::ReplayDetected, "prove answers a consumed nonce");
    }

    protocol::SessionParams params{};
    crypto::CryptoManager::random_bytes(params.session_id);
    params.heartbeat_interval_ms = settings_.heartbeat_interval_ms;
    params.max_message_size = settings_.max_message_size;

    NodeIdentity peer{state.hello.node_id, state.hello.signing_pubkey, state.hello.ephemeral_pubkey};
    Session session(params, state.key, peer, state.hello.capabilities);

    log_event(StructuredLogger::Level::Info,
              "handshake.completed",
              {{"role", role_name(role_)},
               {"peer", node_id_to_string(peer.node_id)},
               {"elapsed_ms", std::to_string(elapsed().count())}});

    state_ = Completed{std::move(session)};
    return std::optional<protocol::Message>(protocol::make_message(protocol::WelcomePayload{params}));
}

Result<std::optional<protocol::Message>> Handshake::on_welcome(ProveSent& state,
                                                               const protocol::WelcomePayload& welcome) {
    auto params = welcome.params;
    if (params.max_message_size == 0) {
        return fail(ErrorCode::Malformed, "welcome negotiated a zero message size");
    }
    params.max_message_size = std::min(params.max_message_size, settings_.max_message_size);

    Session session(params, state.key, state.peer, state.peer_capabilities);

    log_event(StructuredLogger::Level::Info,
              "handshake.completed",
              {{"role", role_name(role_)},
               {"peer", node_id_to_string(state.peer.node_id)},
               {"elapsed_ms", std::to_string(elapsed().count())}});

    state_ = Completed{std::move(session)};
    return std::optional<protocol::Message>{};
}

bool Handshake::expired(Clock::time_point now) const noexcept {
    if (std::holds_alternative<Completed>(state_) || std::holds_alternative<Failed>(state_)) {
        return false;
    }
    return now - started_at_ > settings_.timeout;
}

void Handshake::cancel() {
    if (std::holds_alternative<Failed>(state_)) {
        return;
    }
    state_ = Failed{make_error(ErrorCode::Cancelled, "handshake cancelled")};
}

const Session* Handshake::session() const noexcept {
    if (const auto* completed = std::get_if<Completed>(&state_)) {
        return &completed->session;
    }
    return nullptr;
}

std::optional<Session> Handshake::take_session() {
    auto* completed = std::get_if<Completed>(&state_);
    if (completed == nullptr) {
        return std::nullopt;
    }
    std::optional<Session> session{std::move(completed->session)};
    state_ = Failed{make_error(ErrorCode::Cancelled, "session handed off")};
    return session;
}

std::optional<Error> Handshake::failure() const {
    if (const auto* failed = std::get_if<Failed>(&state_)) {
        return failed->error;
    }
    return std::nullopt;
}

std::chrono::milliseconds Handshake::elapsed(Clock::time_point now) const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - started_at_);
}

Error Handshake::fail(ErrorCode code, std::string message) {
    auto error = make_error(code, std::move(message));
    const auto previous = stage();
    state_ = Failed{error};

    StructuredLogger::FieldList fields{{"role", role_name(role_)},
                                       {"stage", to_string(previous)},
                                       {"code", to_string(code)},
                                       {"detail", error.message}};
    if (remote_node_id_.has_value()) {
        fields.emplace_back("peer", node_id_to_string(*remote_node_id_));
    }
    log_event(StructuredLogger::Level::Warning, "handshake.failed", std::move(fields));
    return error;
}

}  // namespace cortexgrid::network
