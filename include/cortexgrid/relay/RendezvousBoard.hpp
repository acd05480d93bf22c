#pragma once

#include "cortexgrid/relay/Beacon.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cortexgrid::relay {

// Bulletin board keyed by recipient key-hash prefix. Recipients poll it for
// beacons that could not reach them directly.
class RendezvousBoard {
public:
    virtual ~RendezvousBoard() = default;

    virtual void put(const RelayBeacon& beacon) = 0;
    virtual std::vector<RelayBeacon> get(const protocol::KeyHashPrefix& prefix) = 0;
};

class InMemoryRendezvousBoard : public RendezvousBoard {
public:
    explicit InMemoryRendezvousBoard(std::chrono::seconds expiry = std::chrono::hours(1),
                                     std::size_t per_prefix_limit = 256);

    void put(const RelayBeacon& beacon) override;
    std::vector<RelayBeacon> get(const protocol::KeyHashPrefix& prefix) override;

    // Drops beacons older than the expiry. Returns how many were removed.
    std::size_t prune(std::uint64_t now_unix);
    std::size_t size() const;

private:
    std::chrono::seconds expiry_;
    std::size_t per_prefix_limit_;
    std::unordered_map<std::string, std::vector<RelayBeacon>> slots_;
    mutable std::mutex mutex_;
};

}  // namespace cortexgrid::relay
