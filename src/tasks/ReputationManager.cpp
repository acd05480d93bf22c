#include "cortexgrid/tasks/ReputationManager.hpp"

#include <algorithm>

namespace cortexgrid::tasks {

ReputationManager::ReputationManager(int success_reward, int failure_penalty)
    : success_reward_(success_reward), failure_penalty_(failure_penalty) {}

void ReputationManager::record_success(const NodeId& peer) {
    std::scoped_lock lock(mutex_);
    auto& entry = entries_[node_id_to_string(peer)];
    entry.score = std::min(entry.score + success_reward_, kMaxScore);
    entry.last_update = std::chrono::steady_clock::now();
}

void ReputationManager::record_failure(const NodeId& peer) {
    std::scoped_lock lock(mutex_);
    auto& entry = entries_[node_id_to_string(peer)];
    entry.score = std::max(entry.score - failure_penalty_, kMinScore);
    entry.last_update = std::chrono::steady_clock::now();
}

int ReputationManager::score(const NodeId& peer) const {
    std::scoped_lock lock(mutex_);
    const auto it = entries_.find(node_id_to_string(peer));
    return it == entries_.end() ? 0 : it->second.score;
}

void ReputationManager::forget(const NodeId& peer) {
    std::scoped_lock lock(mutex_);
    entries_.erase(node_id_to_string(peer));
}

std::size_t ReputationManager::peer_count() const {
    std::scoped_lock lock(mutex_);
    return entries_.size();
}

}  // namespace cortexgrid::tasks
