#include "cortexgrid/Error.hpp"

namespace cortexgrid {

ErrorCategory category_of(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::VersionMismatch:
        case ErrorCode::UnknownMessageKind:
        case ErrorCode::Malformed:
        case ErrorCode::UnexpectedMessage:
        case ErrorCode::NotFound:
            return ErrorCategory::Protocol;
        case ErrorCode::InvalidSignature:
        case ErrorCode::InvalidNodeId:
        case ErrorCode::ReplayDetected:
        case ErrorCode::DecryptionFailed:
            return ErrorCategory::Auth;
        case ErrorCode::ChunkHashMismatch:
        case ErrorCode::PermanentlyFailed:
            return ErrorCategory::Integrity;
        case ErrorCode::QueueFull:
        case ErrorCode::NoEligiblePeer:
        case ErrorCode::StorageFull:
            return ErrorCategory::Capacity;
        case ErrorCode::Timeout:
        case ErrorCode::Cancelled:
            return ErrorCategory::Timeout;
        case ErrorCode::ConnectionReset:
        case ErrorCode::NotConnected:
            return ErrorCategory::Network;
    }
    return ErrorCategory::Protocol;
}

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::VersionMismatch:
            return "version_mismatch";
        case ErrorCode::UnknownMessageKind:
            return "unknown_message_kind";
        case ErrorCode::Malformed:
            return "malformed";
        case ErrorCode::UnexpectedMessage:
            return "unexpected_message";
        case ErrorCode::NotFound:
            return "not_found";
        case ErrorCode::InvalidSignature:
            return "invalid_signature";
        case ErrorCode::InvalidNodeId:
            return "invalid_node_id";
        case ErrorCode::ReplayDetected:
            return "replay_detected";
        case ErrorCode::DecryptionFailed:
            return "decryption_failed";
        case ErrorCode::ChunkHashMismatch:
            return "chunk_hash_mismatch";
        case ErrorCode::PermanentlyFailed:
            return "permanently_failed";
        case ErrorCode::QueueFull:
            return "queue_full";
        case ErrorCode::NoEligiblePeer:
            return "no_eligible_peer";
        case ErrorCode::Timeout:
            return "timeout";
        case ErrorCode::Cancelled:
            return "cancelled";
        case ErrorCode::ConnectionReset:
            return "connection_reset";
        case ErrorCode::NotConnected:
            return "not_connected";
        case ErrorCode::StorageFull:
            return "storage_full";
    }
    return "unknown";
}

std::optional<ErrorCode> error_code_from_wire(std::uint32_t code) noexcept {
    if (code > static_cast<std::uint32_t>(ErrorCode::StorageFull)) {
        return std::nullopt;
    }
    return static_cast<ErrorCode>(code);
}

const char* to_string(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::Protocol:
            return "protocol";
        case ErrorCategory::Auth:
            return "auth";
        case ErrorCategory::Integrity:
            return "integrity";
        case ErrorCategory::Capacity:
            return "capacity";
        case ErrorCategory::Timeout:
            return "timeout";
        case ErrorCategory::Network:
            return "network";
    }
    return "protocol";
}

}  // namespace cortexgrid
