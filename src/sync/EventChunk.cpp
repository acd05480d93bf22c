#include "cortexgrid/sync/EventChunk.hpp"

#include "cortexgrid/crypto/Sha256.hpp"
#include "cortexgrid/protocol/Codec.hpp"

#include <algorithm>
#include <utility>

namespace cortexgrid::sync {

namespace {
// Format tag leading every serialized chunk.
constexpr std::uint8_t kChunkFormatVersion = 1;
}

std::vector<std::uint8_t> serialize_events(const std::vector<Event>& events) {
    protocol::ByteWriter writer;
    writer.write_u8(kChunkFormatVersion);
    writer.write_u32(static_cast<std::uint32_t>(events.size()));
    for (const auto& event : events) {
        writer.write_u64(event.sequence);
        writer.write_u64(event.timestamp);
        writer.write_string(event.kind);
        writer.write_blob(event.payload);
    }
    return writer.take();
}

ContentHash chunk_hash(std::span<const std::uint8_t> bytes) {
    return crypto::Sha256::digest(bytes);
}

EventChunk::EventChunk(std::vector<Event> events, std::vector<std::uint8_t> bytes)
    : events_(std::move(events)),
      bytes_(std::move(bytes)),
      hash_(chunk_hash(bytes_)) {}

EventChunk EventChunk::from_events(std::vector<Event> events) {
    auto bytes = serialize_events(events);
    return EventChunk(std::move(events), std::move(bytes));
}

std::optional<EventChunk> EventChunk::deserialize(std::span<const std::uint8_t> bytes) {
    protocol::ByteReader reader(bytes);
    if (reader.read_u8() != kChunkFormatVersion) {
        return std::nullopt;
    }
    const auto count = reader.read_u32();
    // Each event needs at least 24 bytes, which bounds the reservation.
    if (!reader.ok() || count > reader.remaining() / 24) {
        return std::nullopt;
    }

    std::vector<Event> events;
    events.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        Event event{};
        event.sequence = reader.read_u64();
        event.timestamp = reader.read_u64();
        event.kind = reader.read_string();
        event.payload = reader.read_blob();
        if (!reader.ok()) {
            return std::nullopt;
        }
        events.push_back(std::move(event));
    }
    if (reader.remaining() != 0) {
        return std::nullopt;
    }
    return EventChunk(std::move(events), std::vector<std::uint8_t>(bytes.begin(), bytes.end()));
}

std::vector<EventChunk> Chunker::partition(const std::vector<Event>& events, std::size_t events_per_chunk) {
    const auto step = std::max<std::size_t>(events_per_chunk, 1);
    std::vector<EventChunk> chunks;
    chunks.reserve((events.size() + step - 1) / step);
    for (std::size_t offset = 0; offset < events.size(); offset += step) {
        const auto end = std::min(events.size(), offset + step);
        chunks.push_back(EventChunk::from_events(
            std::vector<Event>(events.begin() + static_cast<std::ptrdiff_t>(offset),
                               events.begin() + static_cast<std::ptrdiff_t>(end))));
    }
    return chunks;
}

}  // namespace cortexgrid::sync
