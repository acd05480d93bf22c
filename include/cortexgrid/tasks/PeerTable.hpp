#pragma once

#include "cortexgrid/Types.hpp"
#include "cortexgrid/core/PeerShardedMap.hpp"
#include "cortexgrid/protocol/Message.hpp"

#include <optional>
#include <vector>

namespace cortexgrid::tasks {

struct PeerRecord {
    NodeId node_id{};
    protocol::Capabilities capabilities{};
    // Smoothed round-trip estimate; negative until measured.
    double latency_ms{-1.0};
    bool online{false};
};

// Routing view of known peers. Owned by the node and handed to the router
// by reference, so tests can populate it directly.
class PeerTable {
public:
    void upsert(const PeerRecord& record);
    void update_capabilities(const NodeId& peer, const protocol::Capabilities& capabilities);
    void set_online(const NodeId& peer, bool online);
    void record_latency(const NodeId& peer, double latency_ms);
    bool remove(const NodeId& peer);

    std::optional<PeerRecord> get(const NodeId& peer) const;
    std::vector<PeerRecord> snapshot() const;
    std::size_t size() const { return records_.size(); }

private:
    PeerShardedMap<PeerRecord> records_;
};

}  // namespace cortexgrid::tasks
