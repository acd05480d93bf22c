#pragma once

#include "cortexgrid/Types.hpp"
#include "cortexgrid/sync/EventChunk.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cortexgrid::sync {

enum class AppendResult {
    Accepted,
    Rejected
};

// Append-only event log seen through its chunk hashes.
class EventStore {
public:
    virtual ~EventStore() = default;

    virtual std::set<ContentHash> list_chunk_hashes() const = 0;
    virtual std::optional<std::vector<std::uint8_t>> read_chunk(const ContentHash& hash) const = 0;
    virtual AppendResult append(const std::vector<Event>& events) = 0;
};

// Each accepted batch becomes one chunk. Empty batches, batches whose
// sequences are not strictly increasing, and already held chunks are rejected.
class InMemoryEventStore : public EventStore {
public:
    explicit InMemoryEventStore(std::size_t events_per_chunk = 64);

    std::set<ContentHash> list_chunk_hashes() const override;
    std::optional<std::vector<std::uint8_t>> read_chunk(const ContentHash& hash) const override;
    AppendResult append(const std::vector<Event>& events) override;

    // Chunks a whole log locally; returns how many chunks were accepted.
    std::size_t append_log(const std::vector<Event>& events);

    std::size_t chunk_count() const;
    std::size_t event_count() const;

private:
    std::size_t events_per_chunk_;
    std::map<ContentHash, EventChunk> chunks_;
    std::size_t events_{0};
    mutable std::mutex mutex_;
};

}  // namespace cortexgrid::sync
