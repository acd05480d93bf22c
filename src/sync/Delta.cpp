#include "cortexgrid/sync/Delta.hpp"

namespace cortexgrid::sync {

std::vector<ContentHash> compute_delta(const std::set<ContentHash>& local, const std::vector<ContentHash>& remote) {
    std::vector<ContentHash> missing;
    std::set<ContentHash> queued;
    for (const auto& hash : remote) {
        if (!local.contains(hash) && queued.insert(hash).second) {
            missing.push_back(hash);
        }
    }
    return missing;
}

}  // namespace cortexgrid::sync
