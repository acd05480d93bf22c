#include "cortexgrid/sync/EventStore.hpp"

#include <algorithm>

namespace cortexgrid::sync {

InMemoryEventStore::InMemoryEventStore(std::size_t events_per_chunk)
    : events_per_chunk_(std::max<std::size_t>(events_per_chunk, 1)) {}

std::set<ContentHash> InMemoryEventStore::list_chunk_hashes() const {
    std::scoped_lock lock(mutex_);
    std::set<ContentHash> hashes;
    for (const auto& [hash, _] : chunks_) {
        hashes.insert(hash);
    }
    return hashes;
}

std::optional<std::vector<std::uint8_t>> InMemoryEventStore::read_chunk(const ContentHash& hash) const {
    std::scoped_lock lock(mutex_);
    const auto it = chunks_.find(hash);
    if (it == chunks_.end()) {
        return std::nullopt;
    }
    return it->second.bytes();
}

AppendResult InMemoryEventStore::append(const std::vector<Event>& events) {
    if (events.empty()) {
        return AppendResult::Rejected;
    }
    const auto ordered = std::adjacent_find(events.begin(), events.end(), [](const Event& lhs, const Event& rhs) {
        return rhs.sequence <= lhs.sequence;
    }) == events.end();
    if (!ordered) {
        return AppendResult::Rejected;
    }

    auto chunk = EventChunk::from_events(events);
    const auto hash = chunk.hash();
    std::scoped_lock lock(mutex_);
    const auto [_, inserted] = chunks_.try_emplace(hash, std::move(chunk));
    if (!inserted) {
        return AppendResult::Rejected;
    }
    events_ += events.size();
    return AppendResult::Accepted;
}

std::size_t InMemoryEventStore::append_log(const std::vector<Event>& events) {
    std::size_t accepted = 0;
    for (const auto& chunk : Chunker::partition(events, events_per_chunk_)) {
        if (append(chunk.events()) == AppendResult::Accepted) {
            ++accepted;
        }
    }
    return accepted;
}

std::size_t InMemoryEventStore::chunk_count() const {
    std::scoped_lock lock(mutex_);
    return chunks_.size();
}

std::size_t InMemoryEventStore::event_count() const {
    std::scoped_lock lock(mutex_);
    return events_;
}

}  // namespace cortexgrid::sync
