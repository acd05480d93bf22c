#include "cortexgrid/relay/DedupCache.hpp"

namespace cortexgrid::relay {

DedupCache::DedupCache(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool DedupCache::insert(const RelayBeacon& beacon) {
    auto key = dedup_key(beacon);
    std::scoped_lock lock(mutex_);
    if (!seen_.insert(key).second) {
        return false;
    }
    order_.push_back(std::move(key));
    while (order_.size() > capacity_) {
        seen_.erase(order_.front());
        order_.pop_front();
    }
    return true;
}

bool DedupCache::contains(const RelayBeacon& beacon) const {
    const auto key = dedup_key(beacon);
    std::scoped_lock lock(mutex_);
    return seen_.contains(key);
}

std::size_t DedupCache::size() const {
    std::scoped_lock lock(mutex_);
    return seen_.size();
}

}  // namespace cortexgrid::relay
