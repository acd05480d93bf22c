#include "cortexgrid/tasks/TaskRouter.hpp"

#include <algorithm>

namespace cortexgrid::tasks {

namespace {
// Unmeasured peers sort after every measured one.
constexpr double kUnknownLatency = 1e12;

double effective_latency(double latency_ms) {
    return latency_ms < 0.0 ? kUnknownLatency : latency_ms;
}
}

TaskRouter::TaskRouter(const PeerTable& peers, const ReputationManager& reputation, const MetricsTracker& metrics)
    : peers_(peers), reputation_(reputation), metrics_(metrics) {}

std::vector<RankedPeer> TaskRouter::rank(const std::string& capability, const std::vector<NodeId>& exclude) const {
    std::vector<RankedPeer> ranked;
    for (const auto& record : peers_.snapshot()) {
        if (!record.online || !record.capabilities.can_compute || !record.capabilities.has_skill(capability)) {
            continue;
        }
        if (std::find(exclude.begin(), exclude.end(), record.node_id) != exclude.end()) {
            continue;
        }
        const auto score = static_cast<double>(reputation_.score(record.node_id)) +
                           100.0 * metrics_.success_rate(record.node_id);
        ranked.push_back(RankedPeer{record.node_id, score, record.latency_ms});
    }

    std::sort(ranked.begin(), ranked.end(), [](const RankedPeer& lhs, const RankedPeer& rhs) {
        if (lhs.score != rhs.score) {
            return lhs.score > rhs.score;
        }
        const auto lhs_latency = effective_latency(lhs.latency_ms);
        const auto rhs_latency = effective_latency(rhs.latency_ms);
        if (lhs_latency != rhs_latency) {
            return lhs_latency < rhs_latency;
        }
        return lhs.node_id < rhs.node_id;
    });
    return ranked;
}

std::optional<NodeId> TaskRouter::select(const std::string& capability, const std::vector<NodeId>& exclude) const {
    const auto ranked = rank(capability, exclude);
    if (ranked.empty()) {
        return std::nullopt;
    }
    return ranked.front().node_id;
}

}  // namespace cortexgrid::tasks
