#include "cortexgrid/sync/SyncProgress.hpp"

namespace cortexgrid::sync {

double SyncProgress::percent() const noexcept {
    if (total_chunks == 0) {
        return 100.0;
    }
    return 100.0 * static_cast<double>(synced_chunks) / static_cast<double>(total_chunks);
}

std::chrono::milliseconds SyncProgress::elapsed(Clock::time_point now) const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - started_at);
}

double SyncProgress::throughput(Clock::time_point now) const {
    const auto seconds = std::chrono::duration<double>(now - started_at).count();
    if (seconds <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(bytes_transferred) / seconds;
}

void SyncProgressTable::start(const NodeId& peer, std::size_t total_chunks, SyncProgress::Clock::time_point now) {
    records_.with(peer, [&](SyncProgress& progress) {
        progress = SyncProgress{};
        progress.peer_id = peer;
        progress.total_chunks = total_chunks;
        progress.started_at = now;
    });
}

void SyncProgressTable::record_synced(const NodeId& peer, std::uint64_t bytes) {
    records_.with_existing(peer, [&](SyncProgress& progress) {
        ++progress.synced_chunks;
        progress.bytes_transferred += bytes;
    });
}

void SyncProgressTable::record_failed(const NodeId& peer) {
    records_.with_existing(peer, [&](SyncProgress& progress) {
        ++progress.failed_chunks;
    });
}

std::optional<SyncProgress> SyncProgressTable::complete(const NodeId& peer) {
    auto final_state = snapshot(peer);
    records_.erase(peer);
    return final_state;
}

std::optional<SyncProgress> SyncProgressTable::snapshot(const NodeId& peer) const {
    std::optional<SyncProgress> copy;
    records_.with_existing(peer, [&](const SyncProgress& progress) {
        copy = progress;
    });
    return copy;
}

}  // namespace cortexgrid::sync
