#include "cortexgrid/sync/ChunkSyncEngine.hpp"

#include "cortexgrid/daemon/StructuredLogger.hpp"
#include "cortexgrid/sync/Delta.hpp"

#include <utility>

namespace cortexgrid::sync {

namespace {

using daemon::StructuredLogger;
using daemon::log_event;

}  // namespace

SyncSettings SyncSettings::from_config(const Config& config) {
    return SyncSettings{config.sync_max_rerequests};
}

ChunkSyncEngine::ChunkSyncEngine(EventStore& store,
                                 BandwidthThrottle& throttle,
                                 SyncProgressTable& progress,
                                 SendFn send,
                                 SyncSettings settings)
    : store_(store),
      throttle_(throttle),
      progress_(progress),
      send_(std::move(send)),
      settings_(settings) {}

void ChunkSyncEngine::set_completion_handler(CompletionFn handler) {
    std::scoped_lock lock(handler_mutex_);
    on_complete_ = std::move(handler);
}

Status ChunkSyncEngine::begin(const NodeId& peer) {
    if (!passes_.try_insert(peer, Pass{})) {
        return make_error(ErrorCode::UnexpectedMessage, "sync already running for peer");
    }
    if (!send_ || !send_(peer, protocol::make_message(protocol::EventManifestGetPayload{}))) {
        passes_.erase(peer);
        return make_error(ErrorCode::NotConnected, "manifest request could not be sent");
    }
    return {};
}

void ChunkSyncEngine::on_manifest(const NodeId& peer, const protocol::EventManifestPayload& manifest) {
    const auto missing = compute_delta(store_.list_chunk_hashes(), manifest.hashes);
    bool duplicate = false;
    const bool known = passes_.with_existing(peer, [&](Pass& pass) {
        if (pass.manifest_received) {
            duplicate = true;
            return;
        }
        pass.manifest_received = true;
        for (const auto& hash : missing) {
            pass.outstanding.emplace(hash, 0);
        }
        progress_.start(peer, missing.size());
    });
    if (!known || duplicate) {
        log_event(StructuredLogger::Level::Warning,
                  known ? "sync.duplicate_manifest" : "sync.unsolicited_manifest",
                  {{"peer", node_id_to_string(peer)}});
        return;
    }

    log_event(StructuredLogger::Level::Info,
              "sync.delta",
              {{"peer", node_id_to_string(peer)},
               {"advertised", std::to_string(manifest.hashes.size())},
               {"missing", std::to_string(missing.size())}});

    for (const auto& hash : missing) {
        request(peer, hash);
    }
    finish_if_done(peer);
}

void ChunkSyncEngine::on_chunk_put(const NodeId& peer, const protocol::EventChunkPutPayload& put) {
    const auto key = node_id_to_string(peer);
    bool expected = false;
    passes_.with_existing(peer, [&](const Pass& pass) { expected = pass.outstanding.contains(put.hash); });
    if (!expected) {
        log_event(StructuredLogger::Level::Info,
                  "sync.unsolicited_chunk",
                  {{"peer", key}, {"hash", hash_to_string(put.hash)}});
        return;
    }

    std::optional<EventChunk> chunk;
    if (chunk_hash(put.data) == put.hash) {
        chunk = EventChunk::deserialize(put.data);
    }

    if (chunk.has_value()) {
        const auto stored = store_.append(chunk->events()) == AppendResult::Accepted;
        if (!passes_.with_existing(peer, [&](Pass& pass) { pass.outstanding.erase(put.hash); })) {
            return;
        }
        if (stored) {
            progress_.record_synced(peer, put.data.size());
        } else {
            progress_.record_failed(peer);
            log_event(StructuredLogger::Level::Warning,
                      "sync.append_rejected",
                      {{"peer", key}, {"hash", hash_to_string(put.hash)}});
        }
        finish_if_done(peer);
        return;
    }

    bool retry = false;
    std::uint8_t attempts = 0;
    const bool live = passes_.with_existing(peer, [&](Pass& pass) {
        auto& count = pass.outstanding[put.hash];
        attempts = ++count;
        retry = attempts <= settings_.max_rerequests;
        if (!retry) {
            pass.outstanding.erase(put.hash);
        }
    });
    if (!live) {
        return;
    }

    log_event(StructuredLogger::Level::Warning,
              "sync.integrity_mismatch",
              {{"peer", key},
               {"hash", hash_to_string(put.hash)},
               {"attempt", std::to_string(attempts)},
               {"code", to_string(retry ? ErrorCode::ChunkHashMismatch : ErrorCode::PermanentlyFailed)}});

    if (retry) {
        request(peer, put.hash);
        return;
    }
    progress_.record_failed(peer);
    finish_if_done(peer);
}

void ChunkSyncEngine::abandon(const NodeId& peer, ErrorCode reason) {
    const auto pass = passes_.take(peer);
    if (!pass.has_value()) {
        return;
    }
    const auto dropped = pass->outstanding.size();
    for (std::size_t i = 0; i < dropped; ++i) {
        progress_.record_failed(peer);
    }
    progress_.complete(peer);
    log_event(StructuredLogger::Level::Warning,
              "sync.abandoned",
              {{"peer", node_id_to_string(peer)},
               {"outstanding", std::to_string(dropped)},
               {"code", to_string(reason)}});
}

protocol::Message ChunkSyncEngine::serve_manifest() const {
    const auto hashes = store_.list_chunk_hashes();
    protocol::EventManifestPayload manifest{};
    manifest.hashes.assign(hashes.begin(), hashes.end());
    return protocol::make_message(std::move(manifest));
}

protocol::Message ChunkSyncEngine::serve_chunk(const protocol::EventChunkGetPayload& request) {
    auto bytes = store_.read_chunk(request.hash);
    if (!bytes.has_value()) {
        return protocol::make_error_message(ErrorCode::NotFound,
                                            protocol::MessageKind::EventChunkGet,
                                            hash_to_string(request.hash));
    }
    throttle_.acquire(bytes->size());
    return protocol::make_message(protocol::EventChunkPutPayload{request.hash, std::move(*bytes)});
}

bool ChunkSyncEngine::active(const NodeId& peer) const {
    return passes_.with_existing(peer, [](const Pass&) {});
}

std::size_t ChunkSyncEngine::outstanding(const NodeId& peer) const {
    std::size_t count = 0;
    passes_.with_existing(peer, [&](const Pass& pass) { count = pass.outstanding.size(); });
    return count;
}

void ChunkSyncEngine::finish_if_done(const NodeId& peer) {
    const bool done = passes_.erase_if(peer, [](const Pass& pass) {
        return pass.manifest_received && pass.outstanding.empty();
    });
    if (!done) {
        return;
    }

    const auto final_state = progress_.complete(peer);
    if (!final_state.has_value()) {
        return;
    }
    log_event(StructuredLogger::Level::Info,
              "sync.completed",
              {{"peer", node_id_to_string(peer)},
               {"synced", std::to_string(final_state->synced_chunks)},
               {"failed", std::to_string(final_state->failed_chunks)},
               {"bytes", std::to_string(final_state->bytes_transferred)}});

    CompletionFn handler;
    {
        std::scoped_lock lock(handler_mutex_);
        handler = on_complete_;
    }
    if (handler) {
        handler(peer, *final_state);
    }
}

void ChunkSyncEngine::request(const NodeId& peer, const ContentHash& hash) {
    if (send_ && send_(peer, protocol::make_message(protocol::EventChunkGetPayload{hash}))) {
        return;
    }
    abandon(peer, ErrorCode::NotConnected);
}

}  // namespace cortexgrid::sync
