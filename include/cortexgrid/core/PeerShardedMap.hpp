#pragma once

#include "cortexgrid/Types.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cortexgrid {

// Per-peer records spread over independently locked shards, so work for
// different peers does not contend on one mutex.
template <typename Value>
class PeerShardedMap {
public:
    explicit PeerShardedMap(std::size_t shard_count = 16) {
        shards_.reserve(shard_count == 0 ? 1 : shard_count);
        for (std::size_t i = 0; i < shards_.capacity(); ++i) {
            shards_.push_back(std::make_unique<Shard>());
        }
    }

    // Runs fn on the peer's record, creating it first if needed.
    template <typename Fn>
    decltype(auto) with(const NodeId& peer, Fn&& fn) {
        auto& shard = shard_for(peer);
        std::scoped_lock lock(shard.mutex);
        auto& entry = shard.entries[node_id_to_string(peer)];
        entry.first = peer;
        return fn(entry.second);
    }

    template <typename Fn>
    bool with_existing(const NodeId& peer, Fn&& fn) {
        auto& shard = shard_for(peer);
        std::scoped_lock lock(shard.mutex);
        const auto it = shard.entries.find(node_id_to_string(peer));
        if (it == shard.entries.end()) {
            return false;
        }
        fn(it->second.second);
        return true;
    }

    template <typename Fn>
    bool with_existing(const NodeId& peer, Fn&& fn) const {
        const auto& shard = shard_for(peer);
        std::scoped_lock lock(shard.mutex);
        const auto it = shard.entries.find(node_id_to_string(peer));
        if (it == shard.entries.end()) {
            return false;
        }
        fn(it->second.second);
        return true;
    }

    // Leaves an existing record untouched; returns whether value was stored.
    bool try_insert(const NodeId& peer, Value value) {
        auto& shard = shard_for(peer);
        std::scoped_lock lock(shard.mutex);
        return shard.entries.try_emplace(node_id_to_string(peer), peer, std::move(value)).second;
    }

    // Removes the record and hands it back.
    std::optional<Value> take(const NodeId& peer) {
        auto& shard = shard_for(peer);
        std::scoped_lock lock(shard.mutex);
        const auto it = shard.entries.find(node_id_to_string(peer));
        if (it == shard.entries.end()) {
            return std::nullopt;
        }
        auto value = std::move(it->second.second);
        shard.entries.erase(it);
        return value;
    }

    template <typename Predicate>
    bool erase_if(const NodeId& peer, Predicate&& predicate) {
        auto& shard = shard_for(peer);
        std::scoped_lock lock(shard.mutex);
        const auto it = shard.entries.find(node_id_to_string(peer));
        if (it == shard.entries.end() || !predicate(it->second.second)) {
            return false;
        }
        shard.entries.erase(it);
        return true;
    }

    bool erase(const NodeId& peer) {
        auto& shard = shard_for(peer);
        std::scoped_lock lock(shard.mutex);
        return shard.entries.erase(node_id_to_string(peer)) > 0;
    }

    std::size_t size() const {
        std::size_t total = 0;
        for (const auto& shard : shards_) {
            std::scoped_lock lock(shard->mutex);
            total += shard->entries.size();
        }
        return total;
    }

    // Visits shard by shard; fn must not re-enter this map.
    template <typename Fn>
    void for_each(Fn&& fn) const {
        for (const auto& shard : shards_) {
            std::scoped_lock lock(shard->mutex);
            for (const auto& [_, entry] : shard->entries) {
                fn(entry.first, entry.second);
            }
        }
    }

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, std::pair<NodeId, Value>> entries;
    };

    Shard& shard_for(const NodeId& peer) {
        return *shards_[index_for(peer)];
    }

    const Shard& shard_for(const NodeId& peer) const {
        return *shards_[index_for(peer)];
    }

    std::size_t index_for(const NodeId& peer) const noexcept {
        const std::size_t mixed = (static_cast<std::size_t>(peer[0]) << 8) | peer[1];
        return mixed % shards_.size();
    }

    std::vector<std::unique_ptr<Shard>> shards_;
};

}  // namespace cortexgrid
