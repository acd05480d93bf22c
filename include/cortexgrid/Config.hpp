#pragma once

#include "cortexgrid/Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cortexgrid {

struct Config {
    std::string listen_host{"0.0.0.0"};
    std::uint16_t listen_port{0};
    std::optional<std::string> identity_seed{};
    bool logging_enabled{true};
    // "info", "warning" or "error".
    std::string log_level{"info"};

    std::chrono::seconds handshake_replay_window{std::chrono::minutes(5)};
    std::size_t handshake_nonce_history{100};
    std::chrono::milliseconds handshake_timeout{std::chrono::milliseconds(2000)};
    std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(30)};
    std::uint32_t max_message_size{16u * 1024u * 1024u};

    bool can_relay{true};
    bool can_store{true};
    bool can_compute{false};
    std::uint32_t max_storage_mb{1024};
    std::vector<std::string> skills;

    std::uint8_t relay_default_ttl{7};
    std::uint8_t relay_max_hops{15};
    std::chrono::seconds relay_beacon_expiry{std::chrono::hours(1)};
    std::chrono::seconds relay_identity_rotation{std::chrono::minutes(15)};
    std::size_t relay_dedup_capacity{4096};

    std::size_t sync_events_per_chunk{64};
    std::uint64_t sync_bandwidth_limit{1'000'000};
    std::chrono::milliseconds sync_window{std::chrono::seconds(1)};
    std::uint8_t sync_max_rerequests{2};

    std::size_t task_queue_capacity{1000};
    std::uint8_t task_max_retries{3};
    std::chrono::seconds task_ack_timeout{std::chrono::seconds(60)};

    struct BootstrapPeer {
        std::string host;
        std::uint16_t port{0};
    };

    std::vector<BootstrapPeer> bootstrap_peers;
};

}  
