#pragma once

#include "cortexgrid/Types.hpp"
#include "cortexgrid/core/PeerShardedMap.hpp"
#include "cortexgrid/protocol/Message.hpp"

#include <cstddef>
#include <deque>
#include <set>

namespace cortexgrid::network {

// Recently seen challenge nonces, bounded per peer with oldest-first eviction.
class NonceLedger {
public:
    explicit NonceLedger(std::size_t history_per_peer = 100);

    // False when the nonce is already in the peer's history.
    bool record(const NodeId& peer, const protocol::ChallengeNonce& nonce);
    bool contains(const NodeId& peer, const protocol::ChallengeNonce& nonce) const;
    std::size_t history_size(const NodeId& peer) const;
    std::size_t capacity() const noexcept { return history_per_peer_; }

private:
    struct History {
        std::deque<protocol::ChallengeNonce> order;
        std::set<protocol::ChallengeNonce> lookup;
    };

    std::size_t history_per_peer_;
    PeerShardedMap<History> histories_;
};

}  // namespace cortexgrid::network
