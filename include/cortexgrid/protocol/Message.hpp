#pragma once

#include "cortexgrid/Error.hpp"
#include "cortexgrid/Types.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cortexgrid::crypto {
class CryptoManager;
}

namespace cortexgrid::protocol {

inline constexpr std::uint8_t kMinimumProtocolVersion = 1;
inline constexpr std::uint8_t kProtocolVersion = 1;
inline constexpr std::uint32_t kMaxMessageSize = 16u * 1024u * 1024u;
inline constexpr std::size_t kEnvelopeHeaderSize = 1 + 2 + 4;
inline constexpr std::uint8_t kErrorPayloadVersion = 1;

bool is_supported_protocol_version(std::uint8_t version) noexcept;

enum class MessageKind : std::uint16_t {
    Hello = 0x0001,
    Challenge = 0x0002,
    Prove = 0x0003,
    Welcome = 0x0004,
    Ping = 0x0010,
    Pong = 0x0011,
    CapsGet = 0x0020,
    CapsSet = 0x0021,
    TaskRequest = 0x0030,
    TaskAck = 0x0031,
    EventChunkGet = 0x0040,
    EventChunkPut = 0x0041,
    EventManifestGet = 0x0042,
    EventManifest = 0x0043,
    ArtifactGet = 0x0050,
    ArtifactPut = 0x0051,
    RelayBeacon = 0x0060,
    RelayForward = 0x0061,
    RelayDeliver = 0x0062,
    RelayFetch = 0x0063,
    Error = 0x00FF,
};

const char* kind_name(MessageKind kind) noexcept;

struct Capabilities {
    bool can_relay{true};
    bool can_store{false};
    bool can_compute{false};
    std::uint32_t max_storage_mb{0};
    std::vector<std::string> skills;

    bool has_skill(std::string_view skill) const;
};

std::vector<std::uint8_t> encode_capabilities(const Capabilities& capabilities);

using ChallengeNonce = std::array<std::uint8_t, 32>;
using BeaconNonce = std::array<std::uint8_t, 16>;
using KeyHashPrefix = std::array<std::uint8_t, 8>;

struct HelloPayload {
    std::uint8_t protocol_version{kProtocolVersion};
    NodeId node_id{};
    PublicKey signing_pubkey{};
    Capabilities capabilities{};
    PublicKey ephemeral_pubkey{};
    std::uint64_t timestamp{0};
    Signature signature{};
};

// Bytes covered by the HELLO signature: every field before it.
std::vector<std::uint8_t> hello_signing_bytes(const HelloPayload& hello);

struct ChallengePayload {
    ChallengeNonce nonce{};
    PublicKey ephemeral_pubkey{};
    NodeId responder_node_id{};
    PublicKey responder_signing_pubkey{};
    Capabilities responder_capabilities{};
    Signature responder_signature{};
};

// Bytes covered by the responder's CHALLENGE signature; binds it to the HELLO it answers.
std::vector<std::uint8_t> challenge_signing_bytes(const HelloPayload& hello, const ChallengePayload& challenge);

struct ProvePayload {
    Signature signature{};
};

struct SessionParams {
    SessionId session_id{};
    std::uint32_t heartbeat_interval_ms{30000};
    std::uint32_t max_message_size{kMaxMessageSize};
};

struct WelcomePayload {
    SessionParams params{};
};

struct PingPayload {
    std::uint64_t sequence{0};
};

struct PongPayload {
    std::uint64_t sequence{0};
};

struct CapsGetPayload {};

struct CapsSetPayload {
    Capabilities capabilities{};
};

enum class TaskStatus : std::uint8_t {
    Accepted = 0,
    Rejected = 1,
    InProgress = 2,
    Completed = 3,
    Failed = 4,
};

struct TaskRequestPayload {
    std::uint64_t task_id{0};
    std::uint8_t priority{0};
    std::string capability;
    std::vector<std::uint8_t> input;
    std::uint32_t timeout_ms{0};
};

struct TaskAckPayload {
    std::uint64_t task_id{0};
    TaskStatus status{TaskStatus::Accepted};
    std::vector<std::uint8_t> output;
    std::string detail;
    std::uint32_t execution_ms{0};
};

struct EventChunkGetPayload {
    ContentHash hash{};
};

struct EventChunkPutPayload {
    ContentHash hash{};
    std::vector<std::uint8_t> data;
};

struct EventManifestGetPayload {};

struct EventManifestPayload {
    std::vector<ContentHash> hashes;
};

struct ArtifactGetPayload {
    ContentHash hash{};
};

struct ArtifactPutPayload {
    ContentHash hash{};
    std::vector<std::uint8_t> data;
};

struct RelayBeaconPayload {
    BeaconNonce nonce{};
    KeyHashPrefix recipient_key_hash{};
    std::uint8_t ttl{0};
    std::uint8_t hop_count{0};
    std::uint64_t created_at{0};
    std::vector<std::uint8_t> payload;
};

struct RelayForwardPayload {
    RelayBeaconPayload beacon{};
};

struct RelayDeliverPayload {
    RelayBeaconPayload beacon{};
};

struct RelayFetchPayload {
    KeyHashPrefix prefix{};
};

struct ErrorPayload {
    std::uint8_t error_version{kErrorPayloadVersion};
    std::uint32_t code{0};
    std::uint16_t related_kind{0};
    std::string message;
};

using Payload = std::variant<HelloPayload,
                             ChallengePayload,
                             ProvePayload,
                             WelcomePayload,
                             PingPayload,
                             PongPayload,
                             CapsGetPayload,
                             CapsSetPayload,
                             TaskRequestPayload,
                             TaskAckPayload,
                             EventChunkGetPayload,
                             EventChunkPutPayload,
                             EventManifestGetPayload,
                             EventManifestPayload,
                             ArtifactGetPayload,
                             ArtifactPutPayload,
                             RelayBeaconPayload,
                             RelayForwardPayload,
                             RelayDeliverPayload,
                             RelayFetchPayload,
                             ErrorPayload>;

MessageKind kind_of(const Payload& payload) noexcept;

struct Message {
    std::uint8_t version{kProtocolVersion};
    Payload payload{PingPayload{}};

    MessageKind kind() const noexcept { return kind_of(payload); }
};

Message make_message(Payload payload);
Message make_error_message(ErrorCode code, MessageKind related, std::string message);

std::vector<std::uint8_t> encode(const Message& message);
Result<Message> decode(std::span<const std::uint8_t> buffer);

std::vector<std::uint8_t> encode_sealed(const Message& message, const crypto::CryptoManager& cipher);
Result<Message> decode_sealed(std::span<const std::uint8_t> frame, const crypto::CryptoManager& cipher);

}  // namespace cortexgrid::protocol
