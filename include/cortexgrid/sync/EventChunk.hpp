#pragma once

#include "cortexgrid/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace cortexgrid::sync {

struct Event {
    std::uint64_t sequence{0};
    std::uint64_t timestamp{0};
    std::string kind;
    std::vector<std::uint8_t> payload;

    bool operator==(const Event&) const = default;
};

// Immutable run of consecutive events addressed by the SHA-256 of its
// serialized bytes.
class EventChunk {
public:
    static EventChunk from_events(std::vector<Event> events);
    // Empty when the bytes do not parse as a chunk.
    static std::optional<EventChunk> deserialize(std::span<const std::uint8_t> bytes);

    const ContentHash& hash() const noexcept { return hash_; }
    const std::vector<Event>& events() const noexcept { return events_; }
    const std::vector<std::uint8_t>& bytes() const noexcept { return bytes_; }
    std::size_t size() const noexcept { return bytes_.size(); }

private:
    EventChunk(std::vector<Event> events, std::vector<std::uint8_t> bytes);

    std::vector<Event> events_;
    std::vector<std::uint8_t> bytes_;
    ContentHash hash_{};
};

std::vector<std::uint8_t> serialize_events(const std::vector<Event>& events);
ContentHash chunk_hash(std::span<const std::uint8_t> bytes);

class Chunker {
public:
    // Splits in order into chunks of events_per_chunk; the last may be shorter.
    static std::vector<EventChunk> partition(const std::vector<Event>& events, std::size_t events_per_chunk);
};

}  // namespace cortexgrid::sync
