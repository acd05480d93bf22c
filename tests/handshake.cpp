#include "cortexgrid/core/Identity.hpp"
#include "cortexgrid/network/Handshake.hpp"
#include "cortexgrid/network/NonceLedger.hpp"
#include "cortexgrid/protocol/Message.hpp"
#include "test_access.hpp"

#include <cassert>
#include <chrono>
#include <optional>
#include <variant>

using namespace cortexgrid;
using namespace cortexgrid::network;
using cortexgrid::test::HandshakeTestAccess;

namespace {

HandshakeSettings settings_with(bool compute) {
    HandshakeSettings settings{};
    settings.capabilities.can_compute = compute;
    if (compute) {
        settings.capabilities.skills = {"vision.detect"};
    }
    return settings;
}

protocol::Message reply_of(Result<std::optional<protocol::Message>>& result) {
    assert(result.ok());
    assert(result->has_value());
    return **result;
}

void completes_with_equal_keys() {
    const auto alice = LocalIdentity::generate();
    const auto bob = LocalIdentity::generate();
    NonceLedger alice_ledger;
    NonceLedger bob_ledger;

    auto initiator = Handshake::initiator(alice, alice_ledger, settings_with(false), bob.node_id());
    auto responder = Handshake::responder(bob, bob_ledger, settings_with(true));

    auto hello = initiator.start();
    assert(hello.ok());
    assert(initiator.stage() == HandshakeStage::HelloSent);

    auto challenge = responder.process(*hello);
    const auto challenge_message = reply_of(challenge);
    assert(challenge_message.kind() == protocol::MessageKind::Challenge);
    assert(responder.stage() == HandshakeStage::ChallengeSent);

    auto prove = initiator.process(challenge_message);
    const auto prove_message = reply_of(prove);
    assert(initiator.stage() == HandshakeStage::ProveSent);

    auto welcome = responder.process(prove_message);
    const auto welcome_message = reply_of(welcome);
    assert(responder.completed());

    auto done = initiator.process(welcome_message);
    assert(done.ok());
    assert(!done->has_value());
    assert(initiator.completed());

    const auto* client = initiator.session();
    const auto* server = responder.session();
    assert(client != nullptr && server != nullptr);
    assert(client->key().bytes == server->key().bytes);
    assert(client->id() == server->id());
    assert(client->params().heartbeat_interval_ms == 30000);
    assert(client->params().max_message_size == protocol::kMaxMessageSize);
    assert(client->peer().node_id == bob.node_id());
    assert(server->peer().node_id == alice.node_id());
    assert(client->peer_capabilities().has_skill("vision.detect"));
    assert(!server->peer_capabilities().can_compute);

    const auto sealed = client->seal(protocol::make_message(protocol::PingPayload{5}));
    const auto opened = server->open(sealed);
    assert(opened.ok());
    assert(std::get<protocol::PingPayload>(opened->payload).sequence == 5);

    auto late = responder.process(prove_message);
    assert(!late.ok());
    assert(late.error().code == ErrorCode::UnexpectedMessage);
}

void stale_hello_is_a_replay() {
    const auto alice = LocalIdentity::generate();
    const auto bob = LocalIdentity::generate();
    NonceLedger ledger;

    protocol::HelloPayload hello{};
    hello.node_id = alice.node_id();
    hello.signing_pubkey = alice.public_key();
    hello.ephemeral_pubkey = EphemeralKeyPair::generate().public_key();
    hello.timestamp = unix_seconds_now() - 600;
    hello.signature = alice.sign(protocol::hello_signing_bytes(hello));

    auto responder = Handshake::responder(bob, ledger, HandshakeSettings{});
    auto result = responder.process(protocol::make_message(hello));
    assert(!result.ok());
    assert(result.error().code == ErrorCode::ReplayDetected);
    assert(responder.failed());
    assert(responder.session() == nullptr);
}

void forged_hello_fields_are_rejected() {
    const auto alice = LocalIdentity::generate();
    const auto bob = LocalIdentity::generate();
    NonceLedger ledger;

    auto initiator = Handshake::initiator(alice, ledger, HandshakeSettings{});
    auto hello = initiator.start();
    assert(hello.ok());

    auto wrong_id = std::get<protocol::HelloPayload>(hello->payload);
    wrong_id.node_id[0] ^= 0xFF;
    auto responder = Handshake::responder(bob, ledger, HandshakeSettings{});
    assert(responder.process(protocol::make_message(wrong_id)).error().code == ErrorCode::InvalidNodeId);

    auto tampered = std::get<protocol::HelloPayload>(hello->payload);
    tampered.capabilities.can_compute = true;
    auto second = Handshake::responder(bob, ledger, HandshakeSettings{});
    assert(second.process(protocol::make_message(tampered)).error().code == ErrorCode::InvalidSignature);

    auto old_version = std::get<protocol::HelloPayload>(hello->payload);
    old_version.protocol_version = 0;
    old_version.signature = alice.sign(protocol::hello_signing_bytes(old_version));
    auto third = Handshake::responder(bob, ledger, HandshakeSettings{});
    assert(third.process(protocol::make_message(old_version)).error().code == ErrorCode::VersionMismatch);
}

void tampered_prove_fails_signature() {
    const auto alice = LocalIdentity::generate();
    const auto bob = LocalIdentity::generate();
    NonceLedger alice_ledger;
    NonceLedger bob_ledger;

    auto initiator = Handshake::initiator(alice, alice_ledger, HandshakeSettings{});
    auto responder = Handshake::responder(bob, bob_ledger, HandshakeSettings{});

    auto hello = initiator.start();
    auto challenge = responder.process(*hello);
    auto prove = initiator.process(reply_of(challenge));
    auto prove_message = reply_of(prove);

    std::get<protocol::ProvePayload>(prove_message.payload).signature[0] ^= 0x01;
    auto result = responder.process(prove_message);
    assert(!result.ok());
    assert(result.error().code == ErrorCode::InvalidSignature);
    assert(responder.session() == nullptr);
    assert(responder.failure().has_value());
}

void replayed_challenge_is_rejected() {
    const auto alice = LocalIdentity::generate();
    const auto bob = LocalIdentity::generate();
    NonceLedger alice_ledger;
    NonceLedger bob_ledger;

    auto first = Handshake::initiator(alice, alice_ledger, HandshakeSettings{});
    auto responder = Handshake::responder(bob, bob_ledger, HandshakeSettings{});
    auto hello = first.start();
    auto challenge = responder.process(*hello);
    const auto challenge_message = reply_of(challenge);
    auto prove = first.process(challenge_message);
    assert(prove.ok());

    // A second attempt answered with a recorded CHALLENGE: re-signed for the
    // new HELLO, but carrying a nonce the initiator already accepted.
    auto second = Handshake::initiator(alice, alice_ledger, HandshakeSettings{});
    auto second_hello = second.start();
    assert(second_hello.ok());
    auto replay = std::get<protocol::ChallengePayload>(challenge_message.payload);
    const auto* sent = HandshakeTestAccess::sent_hello(second);
    assert(sent != nullptr);
    replay.responder_signature = bob.sign(protocol::challenge_signing_bytes(*sent, replay));

    auto result = second.process(protocol::make_message(replay));
    assert(!result.ok());
    assert(result.error().code == ErrorCode::ReplayDetected);
}

void out_of_order_message_fails() {
    const auto alice = LocalIdentity::generate();
    const auto bob = LocalIdentity::generate();
    NonceLedger ledger;

    auto responder = Handshake::responder(bob, ledger, HandshakeSettings{});
    auto result = responder.process(protocol::make_message(protocol::WelcomePayload{}));
    assert(!result.ok());
    assert(result.error().code == ErrorCode::UnexpectedMessage);
    assert(responder.failed());

    auto initiator = Handshake::initiator(alice, ledger, HandshakeSettings{});
    auto hello = initiator.start();
    assert(hello.ok());
    auto premature = initiator.process(protocol::make_message(protocol::PingPayload{1}));
    assert(premature.error().code == ErrorCode::UnexpectedMessage);

    auto restarted = initiator.start();
    assert(!restarted.ok());
}

void deadline_and_cancel() {
    const auto alice = LocalIdentity::generate();
    const auto bob = LocalIdentity::generate();
    NonceLedger ledger;

    HandshakeSettings settings{};
    settings.timeout = std::chrono::milliseconds(2000);
    auto initiator = Handshake::initiator(alice, ledger, settings);
    auto responder = Handshake::responder(bob, ledger, settings);
    auto hello = initiator.start();
    auto challenge = responder.process(*hello);
    assert(challenge.ok());

    HandshakeTestAccess::age(initiator, std::chrono::milliseconds(2500));
    assert(initiator.expired(Handshake::Clock::now()));
    auto late = initiator.process(reply_of(challenge));
    assert(!late.ok());
    assert(late.error().code == ErrorCode::Timeout);

    responder.cancel();
    assert(responder.failed());
    assert(responder.failure()->code == ErrorCode::Cancelled);
    assert(!responder.expired(Handshake::Clock::now()));
}

void peer_error_aborts() {
    const auto alice = LocalIdentity::generate();
    NonceLedger ledger;
    auto initiator = Handshake::initiator(alice, ledger, HandshakeSettings{});
    auto hello = initiator.start();
    assert(hello.ok());

    const auto notice = protocol::make_error_message(ErrorCode::VersionMismatch, protocol::MessageKind::Hello, "too old");
    auto result = initiator.process(notice);
    assert(!result.ok());
    assert(result.error().code == ErrorCode::VersionMismatch);
}

void expected_peer_is_enforced() {
    const auto alice = LocalIdentity::generate();
    const auto bob = LocalIdentity::generate();
    const auto carol = LocalIdentity::generate();
    NonceLedger ledger;

    auto initiator = Handshake::initiator(alice, ledger, HandshakeSettings{}, carol.node_id());
    auto responder = Handshake::responder(bob, ledger, HandshakeSettings{});
    auto hello = initiator.start();
    auto challenge = responder.process(*hello);
    auto result = initiator.process(reply_of(challenge));
    assert(!result.ok());
    assert(result.error().code == ErrorCode::InvalidNodeId);
}

}  // namespace

int main() {
    completes_with_equal_keys();
    stale_hello_is_a_replay();
    forged_hello_fields_are_rejected();
    tampered_prove_fails_signature();
    replayed_challenge_is_rejected();
    out_of_order_message_fails();
    deadline_and_cancel();
    peer_error_aborts();
    expected_peer_is_enforced();
    return 0;
}
