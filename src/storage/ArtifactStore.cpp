#include "cortexgrid/storage/ArtifactStore.hpp"

#include "cortexgrid/crypto/Sha256.hpp"
#include "cortexgrid/daemon/StructuredLogger.hpp"

#include <utility>

namespace cortexgrid::storage {

ArtifactStore::ArtifactStore(std::uint64_t capacity_bytes)
    : capacity_bytes_(capacity_bytes) {}

Status ArtifactStore::put(const ContentHash& hash, std::vector<std::uint8_t> data) {
    const auto key = hash_to_string(hash);
    if (crypto::Sha256::digest(data) != hash) {
        daemon::log_event(daemon::StructuredLogger::Level::Warning,
                          "artifact.hash_mismatch",
                          {{"hash", key}, {"size", std::to_string(data.size())}});
        return make_error(ErrorCode::ChunkHashMismatch, "artifact bytes do not match " + key);
    }

    std::scoped_lock lock(mutex_);
    const auto existing = artifacts_.find(key);
    if (existing != artifacts_.end()) {
        return {};
    }
    if (capacity_bytes_ > 0 && total_bytes_ + data.size() > capacity_bytes_) {
        return make_error(ErrorCode::StorageFull, "artifact store capacity reached");
    }

    ArtifactRecord record{};
    record.hash = hash;
    record.data = std::move(data);
    record.stored_at = std::chrono::steady_clock::now();
    total_bytes_ += record.data.size();
    artifacts_.insert_or_assign(key, std::move(record));
    return {};
}

Result<ContentHash> ArtifactStore::put(std::vector<std::uint8_t> data) {
    const auto hash = crypto::Sha256::digest(data);
    auto status = put(hash, std::move(data));
    if (!status) {
        return status.error();
    }
    return hash;
}

std::optional<std::vector<std::uint8_t>> ArtifactStore::get(const ContentHash& hash) const {
    std::scoped_lock lock(mutex_);
    const auto it = artifacts_.find(hash_to_string(hash));
    if (it == artifacts_.end()) {
        return std::nullopt;
    }
    return it->second.data;
}

bool ArtifactStore::contains(const ContentHash& hash) const {
    std::scoped_lock lock(mutex_);
    return artifacts_.contains(hash_to_string(hash));
}

bool ArtifactStore::erase(const ContentHash& hash) {
    std::scoped_lock lock(mutex_);
    const auto it = artifacts_.find(hash_to_string(hash));
    if (it == artifacts_.end()) {
        return false;
    }
    total_bytes_ -= it->second.data.size();
    artifacts_.erase(it);
    return true;
}

std::size_t ArtifactStore::size() const {
    std::scoped_lock lock(mutex_);
    return artifacts_.size();
}

std::uint64_t ArtifactStore::total_bytes() const {
    std::scoped_lock lock(mutex_);
    return total_bytes_;
}

std::vector<ArtifactStore::SnapshotEntry> ArtifactStore::snapshot() const {
    std::scoped_lock lock(mutex_);
    std::vector<SnapshotEntry> result;
    result.reserve(artifacts_.size());
    for (const auto& [key, record] : artifacts_) {
        result.push_back(SnapshotEntry{record.hash, key, record.data.size()});
    }
    return result;
}

}  // namespace cortexgrid::storage
