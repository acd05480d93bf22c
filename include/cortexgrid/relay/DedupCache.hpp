#pragma once

#include "cortexgrid/relay/Beacon.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_set>

namespace cortexgrid::relay {

// Bounded set of (nonce, recipient hash) pairs already handled. Oldest
// entries are evicted first.
class DedupCache {
public:
    explicit DedupCache(std::size_t capacity = 4096);

    // False when the beacon was seen before.
    bool insert(const RelayBeacon& beacon);
    bool contains(const RelayBeacon& beacon) const;
    std::size_t size() const;
    std::size_t capacity() const noexcept { return capacity_; }

private:
    std::size_t capacity_;
    std::deque<std::string> order_;
    std::unordered_set<std::string> seen_;
    mutable std::mutex mutex_;
};

}  // namespace cortexgrid::relay
