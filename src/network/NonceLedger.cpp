#include "cortexgrid/network/NonceLedger.hpp"

namespace cortexgrid::network {

NonceLedger::NonceLedger(std::size_t history_per_peer)
    : history_per_peer_(history_per_peer == 0 ? 1 : history_per_peer) {}

bool NonceLedger::record(const NodeId& peer, const protocol::ChallengeNonce& nonce) {
    return histories_.with(peer, [&](History& history) {
        if (history.lookup.contains(nonce)) {
            return false;
        }
        history.order.push_back(nonce);
        history.lookup.insert(nonce);
        while (history.order.size() > history_per_peer_) {
            history.lookup.erase(history.order.front());
            history.order.pop_front();
        }
        return true;
    });
}

bool NonceLedger::contains(const NodeId& peer, const protocol::ChallengeNonce& nonce) const {
    bool found = false;
    histories_.with_existing(peer, [&](const History& history) {
        found = history.lookup.contains(nonce);
    });
    return found;
}

std::size_t NonceLedger::history_size(const NodeId& peer) const {
    std::size_t size = 0;
    histories_.with_existing(peer, [&](const History& history) {
        size = history.order.size();
    });
    return size;
}

}  // namespace cortexgrid::network
