#include "cortexgrid/relay/RendezvousBoard.hpp"

#include <algorithm>

namespace cortexgrid::relay {

InMemoryRendezvousBoard::InMemoryRendezvousBoard(std::chrono::seconds expiry, std::size_t per_prefix_limit)
    : expiry_(expiry),
      per_prefix_limit_(per_prefix_limit == 0 ? 1 : per_prefix_limit) {}

void InMemoryRendezvousBoard::put(const RelayBeacon& beacon) {
    std::scoped_lock lock(mutex_);
    auto& slot = slots_[prefix_to_string(beacon.recipient_key_hash)];
    const auto duplicate = std::any_of(slot.begin(), slot.end(), [&](const RelayBeacon& existing) {
        return existing.nonce == beacon.nonce;
    });
    if (duplicate) {
        return;
    }
    if (slot.size() >= per_prefix_limit_) {
        slot.erase(slot.begin());
    }
    slot.push_back(beacon);
}

std::vector<RelayBeacon> InMemoryRendezvousBoard::get(const protocol::KeyHashPrefix& prefix) {
    std::scoped_lock lock(mutex_);
    const auto it = slots_.find(prefix_to_string(prefix));
    if (it == slots_.end()) {
        return {};
    }
    const auto now = unix_seconds_now();
    std::vector<RelayBeacon> live;
    for (const auto& beacon : it->second) {
        if (!is_expired(beacon, now, expiry_)) {
            live.push_back(beacon);
        }
    }
    return live;
}

std::size_t InMemoryRendezvousBoard::prune(std::uint64_t now_unix) {
    std::scoped_lock lock(mutex_);
    std::size_t removed = 0;
    for (auto it = slots_.begin(); it != slots_.end();) {
        auto& slot = it->second;
        const auto before = slot.size();
        slot.erase(std::remove_if(slot.begin(), slot.end(), [&](const RelayBeacon& beacon) {
                       return is_expired(beacon, now_unix, expiry_);
                   }),
                   slot.end());
        removed += before - slot.size();
        if (slot.empty()) {
            it = slots_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t InMemoryRendezvousBoard::size() const {
    std::scoped_lock lock(mutex_);
    std::size_t total = 0;
    for (const auto& [_, slot] : slots_) {
        total += slot.size();
    }
    return total;
}

}  // namespace cortexgrid::relay
