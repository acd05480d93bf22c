#include "cortexgrid/protocol/Message.hpp"

#include "cortexgrid/crypto/CryptoManager.hpp"
#include "cortexgrid/crypto/Sha256.hpp"
#include "cortexgrid/protocol/Codec.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <utility>

namespace cortexgrid::protocol {

namespace {

constexpr std::array<MessageKind, std::variant_size_v<Payload>> kKindByIndex{
    MessageKind::Hello,
    MessageKind::Challenge,
    MessageKind::Prove,
    MessageKind::Welcome,
    MessageKind::Ping,
    MessageKind::Pong,
    MessageKind::CapsGet,
    MessageKind::CapsSet,
    MessageKind::TaskRequest,
    MessageKind::TaskAck,
    MessageKind::EventChunkGet,
    MessageKind::EventChunkPut,
    MessageKind::EventManifestGet,
    MessageKind::EventManifest,
    MessageKind::ArtifactGet,
    MessageKind::ArtifactPut,
    MessageKind::RelayBeacon,
    MessageKind::RelayForward,
    MessageKind::RelayDeliver,
    MessageKind::RelayFetch,
    MessageKind::Error,
};

constexpr std::uint8_t kCapRelay = 0x01;
constexpr std::uint8_t kCapStore = 0x02;
constexpr std::uint8_t kCapCompute = 0x04;
constexpr std::uint32_t kMaxSkills = 256;
constexpr std::uint32_t kMaxManifestEntries = kMaxMessageSize / 32;

void write_capabilities(ByteWriter& writer, const Capabilities& capabilities) {
    std::uint8_t flags = 0;
    flags |= capabilities.can_relay ? kCapRelay : 0;
    flags |= capabilities.can_store ? kCapStore : 0;
    flags |= capabilities.can_compute ? kCapCompute : 0;
    writer.write_u8(flags);
    writer.write_u32(capabilities.max_storage_mb);
    writer.write_u32(static_cast<std::uint32_t>(capabilities.skills.size()));
    for (const auto& skill : capabilities.skills) {
        writer.write_string(skill);
    }
}

Capabilities read_capabilities(ByteReader& reader) {
    Capabilities capabilities{};
    const auto flags = reader.read_u8();
    capabilities.can_relay = (flags & kCapRelay) != 0;
    capabilities.can_store = (flags & kCapStore) != 0;
    capabilities.can_compute = (flags & kCapCompute) != 0;
    capabilities.max_storage_mb = reader.read_u32();
    const auto count = reader.read_u32();
    if (count > kMaxSkills) {
        reader.invalidate();
        return capabilities;
    }
    for (std::uint32_t i = 0; i < count && reader.ok(); ++i) {
        capabilities.skills.push_back(reader.read_string());
    }
    return capabilities;
}

void write_beacon(ByteWriter& writer, const RelayBeaconPayload& beacon) {
    writer.write_array(beacon.nonce);
    writer.write_array(beacon.recipient_key_hash);
    writer.write_u8(beacon.ttl);
    writer.write_u8(beacon.hop_count);
    writer.write_u64(beacon.created_at);
    writer.write_blob(beacon.payload);
}

RelayBeaconPayload read_beacon(ByteReader& reader) {
    RelayBeaconPayload beacon{};
    beacon.nonce = reader.read_array<16>();
    beacon.recipient_key_hash = reader.read_array<8>();
    beacon.ttl = reader.read_u8();
    beacon.hop_count = reader.read_u8();
    beacon.created_at = reader.read_u64();
    beacon.payload = reader.read_blob();
    return beacon;
}

void write_payload(ByteWriter& writer, const Payload& payload) {
    std::visit(
        [&](const auto& value) {
            using PayloadType = std::decay_t<decltype(value)>;

            if constexpr (std::is_same_v<PayloadType, HelloPayload>) {
                writer.write_raw(hello_signing_bytes(value));
                writer.write_array(value.signature);
            } else if constexpr (std::is_same_v<PayloadType, ChallengePayload>) {
                writer.write_array(value.nonce);
                writer.write_array(value.ephemeral_pubkey);
                writer.write_array(value.responder_node_id);
                writer.write_array(value.responder_signing_pubkey);
                write_capabilities(writer, value.responder_capabilities);
                writer.write_array(value.responder_signature);
            } else if constexpr (std::is_same_v<PayloadType, ProvePayload>) {
                writer.write_array(value.signature);
            } else if constexpr (std::is_same_v<PayloadType, WelcomePayload>) {
                writer.write_array(value.params.session_id);
                writer.write_u32(value.params.heartbeat_interval_ms);
                writer.write_u32(value.params.max_message_size);
            } else if constexpr (std::is_same_v<PayloadType, PingPayload> ||
                                 std::is_same_v<PayloadType, PongPayload>) {
                writer.write_u64(value.sequence);
            } else if constexpr (std::is_same_v<PayloadType, CapsGetPayload> ||
                                 std::is_same_v<PayloadType, EventManifestGetPayload>) {
            } else if constexpr (std::is_same_v<PayloadType, CapsSetPayload>) {
                write_capabilities(writer, value.capabilities);
            } else if constexpr (std::is_same_v<PayloadType, TaskRequestPayload>) {
                writer.write_u64(value.task_id);
                writer.write_u8(value.priority);
                writer.write_string(value.capability);
                writer.write_blob(value.input);
                writer.write_u32(value.timeout_ms);
            } else if constexpr (std::is_same_v<PayloadType, TaskAckPayload>) {
                writer.write_u64(value.task_id);
                writer.write_u8(static_cast<std::uint8_t>(value.status));
                writer.write_blob(value.output);
                writer.write_string(value.detail);
                writer.write_u32(value.execution_ms);
            } else if constexpr (std::is_same_v<PayloadType, EventChunkGetPayload> ||
                                 std::is_same_v<PayloadType, ArtifactGetPayload>) {
                writer.write_array(value.hash);
            } else if constexpr (std::is_same_v<PayloadType, EventChunkPutPayload> ||
                                 std::is_same_v<PayloadType, ArtifactPutPayload>) {
                writer.write_array(value.hash);
                writer.write_blob(value.data);
            } else if constexpr (std::is_same_v<PayloadType, EventManifestPayload>) {
                writer.write_u32(static_cast<std::uint32_t>(value.hashes.size()));
                for (const auto& hash : value.hashes) {
                    writer.write_array(hash);
                }
            } else if constexpr (std::is_same_v<PayloadType, RelayBeaconPayload>) {
                write_beacon(writer, value);
            } else if constexpr (std::is_same_v<PayloadType, RelayForwardPayload> ||
                                 std::is_same_v<PayloadType, RelayDeliverPayload>) {
                write_beacon(writer, value.beacon);
            } else if constexpr (std::is_same_v<PayloadType, RelayFetchPayload>) {
                writer.write_array(value.prefix);
            } else if constexpr (std::is_same_v<PayloadType, ErrorPayload>) {
                writer.write_u8(value.error_version);
                writer.write_u32(value.code);
                writer.write_u16(value.related_kind);
                writer.write_string(value.message);
            }
        },
        payload);
}

// Fields past the last one known here are left unread on purpose.
std::optional<Payload> read_payload(MessageKind kind, ByteReader& reader) {
    std::optional<Payload> payload{};
    switch (kind) {
        case MessageKind::Hello: {
            HelloPayload hello{};
            hello.protocol_version = reader.read_u8();
            hello.node_id = reader.read_array<32>();
            hello.signing_pubkey = reader.read_array<32>();
            hello.capabilities = read_capabilities(reader);
            hello.ephemeral_pubkey = reader.read_array<32>();
            hello.timestamp = reader.read_u64();
            hello.signature = reader.read_array<64>();
            payload = std::move(hello);
            break;
        }
        case MessageKind::Challenge: {
            ChallengePayload challenge{};
            challenge.nonce = reader.read_array<32>();
            challenge.ephemeral_pubkey = reader.read_array<32>();
            challenge.responder_node_id = reader.read_array<32>();
            challenge.responder_signing_pubkey = reader.read_array<32>();
            challenge.responder_capabilities = read_capabilities(reader);
            challenge.responder_signature = reader.read_array<64>();
            payload = std::move(challenge);
            break;
        }
        case MessageKind::Prove:
            payload = ProvePayload{reader.read_array<64>()};
            break;
        case MessageKind::Welcome: {
            WelcomePayload welcome{};
            welcome.params.session_id = reader.read_array<32>();
            welcome.params.heartbeat_interval_ms = reader.read_u32();
            welcome.params.max_message_size = reader.read_u32();
            payload = welcome;
            break;
        }
        case MessageKind::Ping:
            payload = PingPayload{reader.read_u64()};
            break;
        case MessageKind::Pong:
            payload = PongPayload{reader.read_u64()};
            break;
        case MessageKind::CapsGet:
            payload = CapsGetPayload{};
            break;
        case MessageKind::CapsSet:
            payload = CapsSetPayload{read_capabilities(reader)};
            break;
        case MessageKind::TaskRequest: {
            TaskRequestPayload request{};
            request.task_id = reader.read_u64();
            request.priority = reader.read_u8();
            request.capability = reader.read_string();
            request.input = reader.read_blob();
            request.timeout_ms = reader.read_u32();
            payload = std::move(request);
            break;
        }
        case MessageKind::TaskAck: {
            TaskAckPayload ack{};
            ack.task_id = reader.read_u64();
            const auto status = reader.read_u8();
            if (status > static_cast<std::uint8_t>(TaskStatus::Failed)) {
                return std::nullopt;
            }
            ack.status = static_cast<TaskStatus>(status);
            ack.output = reader.read_blob();
            ack.detail = reader.read_string();
            ack.execution_ms = reader.read_u32();
            payload = std::move(ack);
            break;
        }
        case MessageKind::EventChunkGet:
            payload = EventChunkGetPayload{reader.read_array<32>()};
            break;
        case MessageKind::EventChunkPut: {
            EventChunkPutPayload put{};
            put.hash = reader.read_array<32>();
            put.data = reader.read_blob();
            payload = std::move(put);
            break;
        }
        case MessageKind::EventManifestGet:
            payload = EventManifestGetPayload{};
            break;
        case MessageKind::EventManifest: {
            EventManifestPayload manifest{};
            const auto count = reader.read_u32();
            if (count > kMaxManifestEntries) {
                return std::nullopt;
            }
            manifest.hashes.reserve(std::min<std::size_t>(count, reader.remaining() / 32));
            for (std::uint32_t i = 0; i < count && reader.ok(); ++i) {
                manifest.hashes.push_back(reader.read_array<32>());
            }
            payload = std::move(manifest);
            break;
        }
        case MessageKind::ArtifactGet:
            payload = ArtifactGetPayload{reader.read_array<32>()};
            break;
        case MessageKind::ArtifactPut: {
            ArtifactPutPayload put{};
            put.hash = reader.read_array<32>();
            put.data = reader.read_blob();
            payload = std::move(put);
            break;
        }
        case MessageKind::RelayBeacon:
            payload = read_beacon(reader);
            break;
        case MessageKind::RelayForward:
            payload = RelayForwardPayload{read_beacon(reader)};
            break;
        case MessageKind::RelayDeliver:
            payload = RelayDeliverPayload{read_beacon(reader)};
            break;
        case MessageKind::RelayFetch:
            payload = RelayFetchPayload{reader.read_array<8>()};
            break;
        case MessageKind::Error: {
            ErrorPayload error{};
            error.error_version = reader.read_u8();
            error.code = reader.read_u32();
            error.related_kind = reader.read_u16();
            error.message = reader.read_string();
            payload = std::move(error);
            break;
        }
    }

    if (!reader.ok()) {
        return std::nullopt;
    }
    return payload;
}

bool is_known_kind(std::uint16_t raw) noexcept {
    return std::find(kKindByIndex.begin(), kKindByIndex.end(), static_cast<MessageKind>(raw)) != kKindByIndex.end();
}

}  // namespace

bool is_supported_protocol_version(std::uint8_t version) noexcept {
    return version >= kMinimumProtocolVersion && version <= kProtocolVersion;
}

const char* kind_name(MessageKind kind) noexcept {
    switch (kind) {
        case MessageKind::Hello: return "hello";
        case MessageKind::Challenge: return "challenge";
        case MessageKind::Prove: return "prove";
        case MessageKind::Welcome: return "welcome";
        case MessageKind::Ping: return "ping";
        case MessageKind::Pong: return "pong";
        case MessageKind::CapsGet: return "caps_get";
        case MessageKind::CapsSet: return "caps_set";
        case MessageKind::TaskRequest: return "task_request";
        case MessageKind::TaskAck: return "task_ack";
        case MessageKind::EventChunkGet: return "event_chunk_get";
        case MessageKind::EventChunkPut: return "event_chunk_put";
        case MessageKind::EventManifestGet: return "event_manifest_get";
        case MessageKind::EventManifest: return "event_manifest";
        case MessageKind::ArtifactGet: return "artifact_get";
        case MessageKind::ArtifactPut: return "artifact_put";
        case MessageKind::RelayBeacon: return "relay_beacon";
        case MessageKind::RelayForward: return "relay_forward";
        case MessageKind::RelayDeliver: return "relay_deliver";
        case MessageKind::RelayFetch: return "relay_fetch";
        case MessageKind::Error: return "error";
    }
    return "unknown";
}

bool Capabilities::has_skill(std::string_view skill) const {
    return std::find(skills.begin(), skills.end(), skill) != skills.end();
}

std::vector<std::uint8_t> encode_capabilities(const Capabilities& capabilities) {
    ByteWriter writer;
    write_capabilities(writer, capabilities);
    return writer.take();
}

std::vector<std::uint8_t> hello_signing_bytes(const HelloPayload& hello) {
    ByteWriter writer;
    writer.write_u8(hello.protocol_version);
    writer.write_array(hello.node_id);
    writer.write_array(hello.signing_pubkey);
    write_capabilities(writer, hello.capabilities);
    writer.write_array(hello.ephemeral_pubkey);
    writer.write_u64(hello.timestamp);
    return writer.take();
}

std::vector<std::uint8_t> challenge_signing_bytes(const HelloPayload& hello, const ChallengePayload& challenge) {
    ByteWriter writer;
    writer.write_array(crypto::Sha256::digest(hello_signing_bytes(hello)));
    writer.write_array(challenge.nonce);
    writer.write_array(challenge.ephemeral_pubkey);
    writer.write_array(challenge.responder_node_id);
    writer.write_array(challenge.responder_signing_pubkey);
    write_capabilities(writer, challenge.responder_capabilities);
    return writer.take();
}

MessageKind kind_of(const Payload& payload) noexcept {
    return kKindByIndex[payload.index()];
}

Message make_message(Payload payload) {
    Message message{};
    message.payload = std::move(payload);
    return message;
}

Message make_error_message(ErrorCode code, MessageKind related, std::string text) {
    ErrorPayload error{};
    error.code = static_cast<std::uint32_t>(code);
    error.related_kind = static_cast<std::uint16_t>(related);
    error.message = std::move(text);
    return make_message(std::move(error));
}

std::vector<std::uint8_t> encode(const Message& message) {
    ByteWriter body;
    write_payload(body, message.payload);
    const auto& payload = body.bytes();

    ByteWriter envelope;
    envelope.write_u8(message.version);
    envelope.write_u16(static_cast<std::uint16_t>(message.kind()));
    envelope.write_u32(static_cast<std::uint32_t>(payload.size()));
    envelope.write_raw(payload);
    return envelope.take();
}

Result<Message> decode(std::span<const std::uint8_t> buffer) {
    if (buffer.size() < kEnvelopeHeaderSize) {
        return make_error(ErrorCode::Malformed, "envelope shorter than header");
    }

    ByteReader header(buffer.first(kEnvelopeHeaderSize));
    const auto version = header.read_u8();
    const auto raw_kind = header.read_u16();
    const auto length = header.read_u32();

    if (version < kMinimumProtocolVersion) {
        return make_error(ErrorCode::VersionMismatch, "protocol version " + std::to_string(version));
    }
    if (length > kMaxMessageSize || length > buffer.size() - kEnvelopeHeaderSize) {
        return make_error(ErrorCode::Malformed, "payload length " + std::to_string(length));
    }
    if (!is_known_kind(raw_kind)) {
        return make_error(ErrorCode::UnknownMessageKind, "kind " + std::to_string(raw_kind));
    }

    const auto kind = static_cast<MessageKind>(raw_kind);
    ByteReader reader(buffer.subspan(kEnvelopeHeaderSize, length));
    auto payload = read_payload(kind, reader);
    if (!payload.has_value()) {
        return make_error(ErrorCode::Malformed, std::string("truncated ") + kind_name(kind));
    }

    Message message{};
    message.version = version;
    message.payload = std::move(*payload);
    return message;
}

std::vector<std::uint8_t> encode_sealed(const Message& message, const crypto::CryptoManager& cipher) {
    return cipher.seal(encode(message));
}

Result<Message> decode_sealed(std::span<const std::uint8_t> frame, const crypto::CryptoManager& cipher) {
    const auto plaintext = cipher.open(frame);
    if (!plaintext.has_value()) {
        return make_error(ErrorCode::DecryptionFailed, "session frame failed authentication");
    }
    return decode(*plaintext);
}

}  // namespace cortexgrid::protocol
