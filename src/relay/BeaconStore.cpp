#include "cortexgrid/relay/BeaconStore.hpp"

#include <iterator>
#include <utility>

namespace cortexgrid::relay {

BeaconStore::BeaconStore(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void BeaconStore::push(DeliveredMessage message) {
    std::scoped_lock lock(mutex_);
    if (messages_.size() >= capacity_) {
        messages_.pop_front();
        ++dropped_;
    }
    messages_.push_back(std::move(message));
}

std::vector<DeliveredMessage> BeaconStore::drain() {
    std::scoped_lock lock(mutex_);
    std::vector<DeliveredMessage> out(std::make_move_iterator(messages_.begin()),
                                      std::make_move_iterator(messages_.end()));
    messages_.clear();
    return out;
}

std::size_t BeaconStore::size() const {
    std::scoped_lock lock(mutex_);
    return messages_.size();
}

std::size_t BeaconStore::dropped() const {
    std::scoped_lock lock(mutex_);
    return dropped_;
}

}  // namespace cortexgrid::relay
