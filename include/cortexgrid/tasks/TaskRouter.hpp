#pragma once

#include "cortexgrid/Types.hpp"
#include "cortexgrid/tasks/MetricsTracker.hpp"
#include "cortexgrid/tasks/PeerTable.hpp"
#include "cortexgrid/tasks/ReputationManager.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cortexgrid::tasks {

struct RankedPeer {
    NodeId node_id{};
    double score{0.0};
    double latency_ms{-1.0};
};

// Orders eligible peers for a capability: online, compute-capable and
// advertising the skill. Score is reputation plus 100 times success rate;
// ties go to the lower latency, then the lower node id.
class TaskRouter {
public:
    TaskRouter(const PeerTable& peers, const ReputationManager& reputation, const MetricsTracker& metrics);

    std::vector<RankedPeer> rank(const std::string& capability, const std::vector<NodeId>& exclude = {}) const;
    std::optional<NodeId> select(const std::string& capability, const std::vector<NodeId>& exclude = {}) const;

private:
    const PeerTable& peers_;
    const ReputationManager& reputation_;
    const MetricsTracker& metrics_;
};

}  // namespace cortexgrid::tasks
