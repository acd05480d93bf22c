#pragma once

#include "cortexgrid/Error.hpp"
#include "cortexgrid/Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cortexgrid::storage {

struct ArtifactRecord {
    ContentHash hash{};
    std::vector<std::uint8_t> data;
    std::chrono::steady_clock::time_point stored_at{};
};

// Content-addressed blob store. Keys are SHA-256 of the data and every put is
// checked against its key.
class ArtifactStore {
public:
    explicit ArtifactStore(std::uint64_t capacity_bytes = 0);

    struct SnapshotEntry {
        ContentHash hash{};
        std::string key;
        std::size_t size{0};
    };

    // ChunkHashMismatch when the data does not hash to the key; StorageFull
    // when the capacity would be exceeded.
    Status put(const ContentHash& hash, std::vector<std::uint8_t> data);
    Result<ContentHash> put(std::vector<std::uint8_t> data);

    std::optional<std::vector<std::uint8_t>> get(const ContentHash& hash) const;
    bool contains(const ContentHash& hash) const;
    bool erase(const ContentHash& hash);

    std::size_t size() const;
    std::uint64_t total_bytes() const;
    std::vector<SnapshotEntry> snapshot() const;

private:
    std::uint64_t capacity_bytes_;
    std::unordered_map<std::string, ArtifactRecord> artifacts_;
    std::uint64_t total_bytes_{0};
    mutable std::mutex mutex_;
};

}  // namespace cortexgrid::storage
