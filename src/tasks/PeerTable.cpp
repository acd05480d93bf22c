#include "cortexgrid/tasks/PeerTable.hpp"

namespace cortexgrid::tasks {

namespace {
// Weight given to each new latency sample.
constexpr double kLatencySmoothing = 0.25;
}

void PeerTable::upsert(const PeerRecord& record) {
    records_.with(record.node_id, [&](PeerRecord& entry) {
        entry = record;
    });
}

void PeerTable::update_capabilities(const NodeId& peer, const protocol::Capabilities& capabilities) {
    records_.with(peer, [&](PeerRecord& entry) {
        entry.node_id = peer;
        entry.capabilities = capabilities;
    });
}

void PeerTable::set_online(const NodeId& peer, bool online) {
    records_.with(peer, [&](PeerRecord& entry) {
        entry.node_id = peer;
        entry.online = online;
    });
}

void PeerTable::record_latency(const NodeId& peer, double latency_ms) {
    records_.with_existing(peer, [&](PeerRecord& entry) {
        if (entry.latency_ms < 0.0) {
            entry.latency_ms = latency_ms;
        } else {
            entry.latency_ms += kLatencySmoothing * (latency_ms - entry.latency_ms);
        }
    });
}

bool PeerTable::remove(const NodeId& peer) {
    return records_.erase(peer);
}

std::optional<PeerRecord> PeerTable::get(const NodeId& peer) const {
    std::optional<PeerRecord> copy;
    records_.with_existing(peer, [&](const PeerRecord& entry) {
        copy = entry;
    });
    return copy;
}

std::vector<PeerRecord> PeerTable::snapshot() const {
    std::vector<PeerRecord> records;
    records_.for_each([&](const NodeId&, const PeerRecord& entry) {
        records.push_back(entry);
    });
    return records;
}

}  // namespace cortexgrid::tasks
