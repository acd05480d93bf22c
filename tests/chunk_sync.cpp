#include "cortexgrid/sync/BandwidthThrottle.hpp"
#include "cortexgrid/sync/ChunkSyncEngine.hpp"
#include "cortexgrid/sync/Delta.hpp"
#include "cortexgrid/sync/EventChunk.hpp"
#include "cortexgrid/sync/EventStore.hpp"
#include "cortexgrid/sync/SyncProgress.hpp"

#include <cassert>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using namespace cortexgrid;
using namespace cortexgrid::sync;

namespace {

NodeId make_peer(std::uint8_t seed) {
    NodeId id{};
    for (auto& byte : id) {
        byte = seed++;
    }
    return id;
}

std::vector<Event> make_events(std::uint64_t count) {
    std::vector<Event> events;
    for (std::uint64_t i = 1; i <= count; ++i) {
        events.push_back(Event{i, 1'700'000'000 + i, "sensor.reading", {static_cast<std::uint8_t>(i), 0x42}});
    }
    return events;
}

// Two engines joined by an in-order queue. The puller is "local", the
// server is "remote".
struct Link {
    using Tamper = std::function<void(protocol::Message&)>;

    struct Pending {
        bool to_remote{false};
        protocol::Message message;
    };

    Link()
        : local_engine(local_store,
                       local_throttle,
                       local_progress,
                       [this](const NodeId&, const protocol::Message& message) {
                           if (message.kind() == protocol::MessageKind::EventChunkGet) {
                               ++chunk_gets;
                           }
                           queue.push_back({true, message});
                           return true;
                       }),
          remote_engine(remote_store, remote_throttle, remote_progress, nullptr) {
        local_engine.set_completion_handler([this](const NodeId&, const SyncProgress& progress) {
            completed = progress;
        });
    }

    void run() {
        while (step()) {
        }
    }

    bool step() {
        if (queue.empty()) {
            return false;
        }
        auto pending = std::move(queue.front());
        queue.pop_front();
        if (pending.to_remote) {
            serve(pending.message);
        } else {
            consume(pending.message);
        }
        return true;
    }

    void serve(const protocol::Message& request) {
        std::optional<protocol::Message> reply;
        if (request.kind() == protocol::MessageKind::EventManifestGet) {
            reply = remote_engine.serve_manifest();
        } else if (const auto* get = std::get_if<protocol::EventChunkGetPayload>(&request.payload)) {
            reply = remote_engine.serve_chunk(*get);
        }
        if (reply.has_value()) {
            if (tamper) {
                tamper(*reply);
            }
            queue.push_back({false, std::move(*reply)});
        }
    }

    void consume(const protocol::Message& reply) {
        if (const auto* manifest = std::get_if<protocol::EventManifestPayload>(&reply.payload)) {
            local_engine.on_manifest(remote_id, *manifest);
        } else if (const auto* put = std::get_if<protocol::EventChunkPutPayload>(&reply.payload)) {
            local_engine.on_chunk_put(remote_id, *put);
        }
    }

    NodeId remote_id{make_peer(0xA0)};
    InMemoryEventStore local_store{5};
    InMemoryEventStore remote_store{5};
    BandwidthThrottle local_throttle;
    BandwidthThrottle remote_throttle;
    SyncProgressTable local_progress;
    SyncProgressTable remote_progress;
    ChunkSyncEngine local_engine;
    ChunkSyncEngine remote_engine;
    std::deque<Pending> queue;
    std::size_t chunk_gets{0};
    std::optional<SyncProgress> completed;
    Tamper tamper;
};

void pulls_only_the_delta() {
    Link link;
    const auto events = make_events(25);
    assert(link.remote_store.append_log(events) == 5);

    const auto chunks = Chunker::partition(events, 5);
    assert(chunks.size() == 5);
    assert(link.local_store.append(chunks[0].events()) == AppendResult::Accepted);
    assert(link.local_store.append(chunks[3].events()) == AppendResult::Accepted);

    assert(link.local_engine.begin(link.remote_id).ok());
    assert(!link.local_engine.begin(link.remote_id).ok());
    link.run();

    assert(link.chunk_gets == 3);
    assert(link.local_store.list_chunk_hashes() == link.remote_store.list_chunk_hashes());
    assert(link.local_store.event_count() == 25);
    assert(!link.local_engine.active(link.remote_id));

    assert(link.completed.has_value());
    assert(link.completed->total_chunks == 3);
    assert(link.completed->synced_chunks == 3);
    assert(link.completed->failed_chunks == 0);
    assert(link.completed->percent() == 100.0);
    assert(link.completed->bytes_transferred ==
           chunks[1].size() + chunks[2].size() + chunks[4].size());
    assert(link.local_progress.active_count() == 0);

    link.chunk_gets = 0;
    link.completed.reset();
    assert(link.local_engine.begin(link.remote_id).ok());
    link.run();
    assert(link.chunk_gets == 0);
    assert(link.completed.has_value() && link.completed->total_chunks == 0);
}

void tampered_chunk_fails_after_rerequests() {
    Link link;
    const auto events = make_events(10);
    assert(link.remote_store.append_log(events) == 2);
    const auto chunks = Chunker::partition(events, 5);
    const auto poisoned = chunks[1].hash();

    std::size_t tampered = 0;
    link.tamper = [&](protocol::Message& reply) {
        if (auto* put = std::get_if<protocol::EventChunkPutPayload>(&reply.payload)) {
            if (put->hash == poisoned) {
                put->data.back() ^= 0x01;
                ++tampered;
            }
        }
    };

    assert(link.local_engine.begin(link.remote_id).ok());
    link.run();

    // One original request plus two re-requests for the poisoned chunk.
    assert(tampered == 3);
    assert(link.chunk_gets == 4);
    assert(link.completed.has_value());
    assert(link.completed->synced_chunks == 1);
    assert(link.completed->failed_chunks == 1);
    assert(link.completed->is_complete());
    assert(link.local_store.chunk_count() == 1);
    assert(!link.local_store.list_chunk_hashes().contains(poisoned));
}

void unsolicited_and_missing_chunks() {
    Link link;
    const auto events = make_events(5);
    const auto chunk = EventChunk::from_events(events);

    link.local_engine.on_chunk_put(link.remote_id, protocol::EventChunkPutPayload{chunk.hash(), chunk.bytes()});
    assert(link.local_store.chunk_count() == 0);

    const auto reply = link.remote_engine.serve_chunk(protocol::EventChunkGetPayload{chunk.hash()});
    const auto* error = std::get_if<protocol::ErrorPayload>(&reply.payload);
    assert(error != nullptr);
    assert(error_code_from_wire(error->code) == ErrorCode::NotFound);

    assert(link.local_engine.begin(link.remote_id).ok());
    link.local_engine.abandon(link.remote_id, ErrorCode::ConnectionReset);
    assert(!link.local_engine.active(link.remote_id));
    assert(link.local_engine.begin(link.remote_id).ok());
}

void repeated_manifest_is_ignored() {
    Link link;
    assert(link.remote_store.append_log(make_events(25)) == 5);
    assert(link.local_engine.begin(link.remote_id).ok());

    assert(link.step());
    const auto manifest = std::get<protocol::EventManifestPayload>(link.queue.front().message.payload);
    assert(link.step());
    assert(link.chunk_gets == 5);

    while (link.local_progress.snapshot(link.remote_id)->synced_chunks == 0) {
        assert(link.step());
    }

    link.local_engine.on_manifest(link.remote_id, manifest);
    assert(link.chunk_gets == 5);
    assert(link.local_engine.outstanding(link.remote_id) == 4);
    const auto progress = link.local_progress.snapshot(link.remote_id);
    assert(progress->synced_chunks == 1);
    assert(progress->total_chunks == 5);

    link.run();
    assert(link.chunk_gets == 5);
    assert(link.completed.has_value());
    assert(link.completed->synced_chunks == 5);
    assert(link.completed->failed_chunks == 0);
    assert(!link.local_engine.active(link.remote_id));
}

void chunk_encoding_is_deterministic() {
    const auto events = make_events(3);
    const auto first = EventChunk::from_events(events);
    const auto second = EventChunk::from_events(events);
    assert(first.bytes() == second.bytes());
    assert(first.hash() == chunk_hash(first.bytes()));

    for (const std::size_t position : {std::size_t{0}, first.bytes().size() / 2, first.bytes().size() - 1}) {
        auto mutated = first.bytes();
        mutated[position] ^= 0x01;
        assert(chunk_hash(mutated) != first.hash());
    }

    const auto parsed = EventChunk::deserialize(first.bytes());
    assert(parsed.has_value());
    assert(parsed->events() == events);
    assert(parsed->hash() == first.hash());

    auto trailing = first.bytes();
    trailing.push_back(0);
    assert(!EventChunk::deserialize(trailing).has_value());
    auto cut = first.bytes();
    cut.resize(cut.size() - 1);
    assert(!EventChunk::deserialize(cut).has_value());

    const auto parts = Chunker::partition(make_events(7), 3);
    assert(parts.size() == 3);
    assert(parts[2].events().size() == 1);
    assert(parts[2].events()[0].sequence == 7);
}

void delta_keeps_manifest_order() {
    const auto a = EventChunk::from_events(make_events(1)).hash();
    const auto b = EventChunk::from_events(make_events(2)).hash();
    const auto c = EventChunk::from_events(make_events(3)).hash();

    const std::set<ContentHash> local{b};
    const auto missing = compute_delta(local, {c, b, a, c});
    assert(missing.size() == 2);
    assert(missing[0] == c);
    assert(missing[1] == a);
    assert(compute_delta({a, b, c}, {a, b}).empty());
}

void store_rejects_bad_batches() {
    InMemoryEventStore store;
    assert(store.append({}) == AppendResult::Rejected);

    auto events = make_events(3);
    std::swap(events[0], events[2]);
    assert(store.append(events) == AppendResult::Rejected);

    const auto ordered = make_events(3);
    assert(store.append(ordered) == AppendResult::Accepted);
    assert(store.append(ordered) == AppendResult::Rejected);
    assert(store.chunk_count() == 1);
}

}  // namespace

int main() {
    pulls_only_the_delta();
    tampered_chunk_fails_after_rerequests();
    unsolicited_and_missing_chunks();
    repeated_manifest_is_ignored();
    chunk_encoding_is_deterministic();
    delta_keeps_manifest_order();
    store_rejects_bad_batches();
    return 0;
}
