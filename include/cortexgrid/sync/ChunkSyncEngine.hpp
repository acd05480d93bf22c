#pragma once

#include "cortexgrid/Config.hpp"
#include "cortexgrid/Error.hpp"
#include "cortexgrid/Types.hpp"
#include "cortexgrid/core/PeerShardedMap.hpp"
#include "cortexgrid/protocol/Message.hpp"
#include "cortexgrid/sync/BandwidthThrottle.hpp"
#include "cortexgrid/sync/EventStore.hpp"
#include "cortexgrid/sync/SyncProgress.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace cortexgrid::sync {

struct SyncSettings {
    std::uint8_t max_rerequests{2};

    static SyncSettings from_config(const Config& config);
};

// Pulls missing event chunks from peers and serves local chunks to them.
// Requests go out as EVENT_MANIFEST_GET / EVENT_CHUNK_GET; replies arrive
// through on_manifest / on_chunk_put.
class ChunkSyncEngine {
public:
    using SendFn = std::function<bool(const NodeId& peer, const protocol::Message& message)>;
    using CompletionFn = std::function<void(const NodeId& peer, const SyncProgress& progress)>;

    ChunkSyncEngine(EventStore& store,
                    BandwidthThrottle& throttle,
                    SyncProgressTable& progress,
                    SendFn send,
                    SyncSettings settings = {});

    void set_completion_handler(CompletionFn handler);

    // Starts a pass against the peer by asking for its manifest.
    Status begin(const NodeId& peer);
    void on_manifest(const NodeId& peer, const protocol::EventManifestPayload& manifest);
    void on_chunk_put(const NodeId& peer, const protocol::EventChunkPutPayload& put);
    // Ends the pass; outstanding chunks count as failed.
    void abandon(const NodeId& peer, ErrorCode reason);

    protocol::Message serve_manifest() const;
    // Throttled; answers ERROR(NotFound) for hashes we do not hold.
    protocol::Message serve_chunk(const protocol::EventChunkGetPayload& request);

    bool active(const NodeId& peer) const;
    std::size_t outstanding(const NodeId& peer) const;

private:
    struct Pass {
        // Later manifests for the same pass are ignored.
        bool manifest_received{false};
        std::map<ContentHash, std::uint8_t> outstanding;
    };

    void finish_if_done(const NodeId& peer);
    void request(const NodeId& peer, const ContentHash& hash);

    EventStore& store_;
    BandwidthThrottle& throttle_;
    SyncProgressTable& progress_;
    SendFn send_;
    SyncSettings settings_;
    CompletionFn on_complete_;
    std::mutex handler_mutex_;

    PeerShardedMap<Pass> passes_;
};

}  // namespace cortexgrid::sync
