#pragma once

#include "cortexgrid/Types.hpp"
#include "cortexgrid/core/PeerShardedMap.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace cortexgrid::sync {

struct SyncProgress {
    using Clock = std::chrono::steady_clock;

    NodeId peer_id{};
    std::size_t total_chunks{0};
    std::size_t synced_chunks{0};
    std::size_t failed_chunks{0};
    std::uint64_t bytes_transferred{0};
    Clock::time_point started_at{};

    double percent() const noexcept;
    std::chrono::milliseconds elapsed(Clock::time_point now = Clock::now()) const;
    // Bytes per second since the pass started.
    double throughput(Clock::time_point now = Clock::now()) const;
    bool is_complete() const noexcept { return synced_chunks + failed_chunks >= total_chunks; }
};

// One progress record per active peer sync. Each update touches a single
// record under its shard lock.
class SyncProgressTable {
public:
    void start(const NodeId& peer, std::size_t total_chunks, SyncProgress::Clock::time_point now = SyncProgress::Clock::now());
    void record_synced(const NodeId& peer, std::uint64_t bytes);
    void record_failed(const NodeId& peer);
    // Removes the record and returns its final state.
    std::optional<SyncProgress> complete(const NodeId& peer);
    std::optional<SyncProgress> snapshot(const NodeId& peer) const;
    std::size_t active_count() const { return records_.size(); }

private:
    PeerShardedMap<SyncProgress> records_;
};

}  // namespace cortexgrid::sync
