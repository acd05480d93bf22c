#include "cortexgrid/Config.hpp"
#include "cortexgrid/core/ConfigLoader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace cortexgrid;
using namespace cortexgrid::config;

namespace {

std::filesystem::path write_temp(const std::string& name, const std::string& contents) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << contents;
    return path;
}

std::string error_code_of(const std::string& yaml) {
    try {
        Config config{};
        apply_document(parse_yaml(yaml), config);
    } catch (const ConfigError& error) {
        return error.code;
    }
    return {};
}

void defaults_match_protocol_constants() {
    const Config config{};
    assert(config.handshake_replay_window == std::chrono::seconds(300));
    assert(config.handshake_nonce_history == 100);
    assert(config.handshake_timeout == std::chrono::milliseconds(2000));
    assert(config.heartbeat_interval == std::chrono::seconds(30));
    assert(config.max_message_size == 16u * 1024u * 1024u);
    assert(config.relay_default_ttl == 7);
    assert(config.relay_max_hops == 15);
    assert(config.relay_beacon_expiry == std::chrono::seconds(3600));
    assert(config.relay_identity_rotation == std::chrono::seconds(900));
    assert(config.sync_events_per_chunk == 64);
    assert(config.sync_max_rerequests == 2);
    assert(config.task_max_retries == 3);
    assert(config.task_ack_timeout == std::chrono::seconds(60));
}

void loads_nested_document() {
    const auto path = write_temp("cortexgrid_config_test.yaml",
                                 "# edge node\n"
                                 "node:\n"
                                 "  listen_host: \"127.0.0.1\"\n"
                                 "  listen_port: 7400\n"
                                 "  logging: off\n"
                                 "  log_level: warning\n"
                                 "handshake:\n"
                                 "  replay_window_secs: 120\n"
                                 "  nonce_history: 32\n"
                                 "capabilities:\n"
                                 "  compute: true\n"
                                 "  skills:\n"
                                 "    - vision.detect\n"
                                 "    - 'audio.transcribe'\n"
                                 "relay:\n"
                                 "  default_ttl: 4  # short mesh\n"
                                 "sync:\n"
                                 "  bandwidth_limit: 0\n"
                                 "tasks:\n"
                                 "  ack_timeout_secs: 15\n"
                                 "bootstrap:\n"
                                 "  - seed-1.example.net:7400\n"
                                 "  - 10.0.0.2:7401\n");

    const auto config = load_config(path);
    std::filesystem::remove(path);

    assert(config.listen_host == "127.0.0.1");
    assert(config.listen_port == 7400);
    assert(!config.logging_enabled);
    assert(config.log_level == "warning");
    assert(config.handshake_replay_window == std::chrono::seconds(120));
    assert(config.handshake_nonce_history == 32);
    assert(config.can_compute);
    assert(config.can_relay);
    assert(config.skills.size() == 2);
    assert(config.skills[1] == "audio.transcribe");
    assert(config.relay_default_ttl == 4);
    assert(config.sync_bandwidth_limit == 0);
    assert(config.task_ack_timeout == std::chrono::seconds(15));
    assert(config.bootstrap_peers.size() == 2);
    assert(config.bootstrap_peers[0].host == "seed-1.example.net");
    assert(config.bootstrap_peers[1].port == 7401);
}

void reports_error_codes() {
    bool thrown = false;
    try {
        load_config("/nonexistent/cortexgrid.yaml");
    } catch (const ConfigError& error) {
        thrown = true;
        assert(error.code == "E_CONFIG_NOT_FOUND");
    }
    assert(thrown);

    assert(error_code_of("node:\n   listen_port: 1\n") == "E_CONFIG_PARSE");
    assert(error_code_of("node\n") == "E_CONFIG_PARSE");
    assert(error_code_of("node:\n  listen_port: many\n") == "E_CONFIG_TYPE");
    assert(error_code_of("node:\n  listen_port: 70000\n") == "E_CONFIG_VALUE");
    assert(error_code_of("node:\n  identity_seed: abc\n") == "E_CONFIG_VALUE");
    assert(error_code_of("relay:\n  max_hops: 0\n") == "E_CONFIG_VALUE");
    assert(error_code_of("bootstrap:\n  - nohost\n") == "E_CONFIG_VALUE");
    assert(error_code_of("capabilities:\n  skills: vision\n") == "E_CONFIG_TYPE");
    assert(error_code_of("node:\n  logging: maybe\n") == "E_CONFIG_TYPE");
    assert(error_code_of("node:\n  log_level: verbose\n") == "E_CONFIG_VALUE");
    assert(error_code_of("tasks:\n  max_retries: 5\n").empty());
}

}  // namespace

int main() {
    defaults_match_protocol_constants();
    loads_nested_document();
    reports_error_codes();
    return 0;
}
