#pragma once

#include "cortexgrid/Types.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace cortexgrid::tasks {

class ReputationManager {
public:
    ReputationManager(int success_reward = 1, int failure_penalty = 2);

    void record_success(const NodeId& peer);
    void record_failure(const NodeId& peer);
    int score(const NodeId& peer) const;
    void forget(const NodeId& peer);
    std::size_t peer_count() const;

    static constexpr int kMaxScore = 100;
    static constexpr int kMinScore = -100;

private:
    struct Entry {
        int score{0};
        std::chrono::steady_clock::time_point last_update{};
    };

    int success_reward_;
    int failure_penalty_;
    std::unordered_map<std::string, Entry> entries_;
    mutable std::mutex mutex_;
};

}  // namespace cortexgrid::tasks
