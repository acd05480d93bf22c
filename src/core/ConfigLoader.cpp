#include "cortexgrid/core/ConfigLoader.hpp"

#include "cortexgrid/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <limits>
#include <sstream>

namespace cortexgrid::config {

namespace {

std::string trim_left(std::string value) {
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch) {
                    return !std::isspace(ch);
                }));
    return value;
}

std::string trim_right(std::string value) {
    value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char ch) {
                    return !std::isspace(ch);
                }).base(),
                value.end());
    return value;
}

std::string trim_copy(const std::string& value) {
    return trim_right(trim_left(value));
}

std::string unescape_double_quoted(const std::string& inner) {
    std::string out;
    out.reserve(inner.size());
    for (std::size_t i = 0; i < inner.size(); ++i) {
        const char ch = inner[i];
        if (ch != '\\') {
            out.push_back(ch);
            continue;
        }
        if (i + 1 >= inner.size()) {
            throw ConfigError("E_CONFIG_PARSE", "Dangling escape in quoted YAML value");
        }
        const char next = inner[++i];
        switch (next) {
            case 'n':
                out.push_back('\n');
                break;
            case 't':
                out.push_back('\t');
                break;
            case '"':
            case '\\':
                out.push_back(next);
                break;
            default:
                throw ConfigError("E_CONFIG_PARSE", std::string("Unsupported escape \\") + next);
        }
    }
    return out;
}

Value parse_yaml_scalar(const std::string& text) {
    const std::string trimmed = trim_copy(text);
    if (trimmed.empty()) {
        return Value();
    }
    if (trimmed.size() >= 2 && ((trimmed.front() == '"' && trimmed.back() == '"') ||
                                (trimmed.front() == '\'' && trimmed.back() == '\''))) {
        const std::string inner = trimmed.substr(1, trimmed.size() - 2);
        if (trimmed.front() == '\'') {
            return Value(inner);
        }
        return Value(unescape_double_quoted(inner));
    }
    if (trimmed == "true" || trimmed == "True") {
        return Value(true);
    }
    if (trimmed == "false" || trimmed == "False") {
        return Value(false);
    }
    if (trimmed == "null" || trimmed == "~") {
        return Value();
    }
    std::int64_t number{};
    const char* begin = trimmed.data();
    if (*begin == '+') {
        ++begin;
    }
    const auto result = std::from_chars(begin, trimmed.data() + trimmed.size(), number);
    if (result.ec == std::errc{} && result.ptr == trimmed.data() + trimmed.size()) {
        return Value(number);
    }
    return Value(trimmed);
}

std::string strip_comment(const std::string& line) {
    bool in_single = false;
    bool in_double = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (ch == '"' && !in_single) {
            in_double = !in_double;
        } else if (ch == '\'' && !in_double) {
            in_single = !in_single;
        } else if (ch == '#' && !in_single && !in_double) {
            return line.substr(0, i);
        }
    }
    return line;
}

const Value* find_path(const Value& root, const std::vector<std::string>& path) {
    const Value* node = &root;
    for (const auto& segment : path) {
        if (!node->is_object()) {
            return nullptr;
        }
        const auto it = node->object_value.find(segment);
        if (it == node->object_value.end()) {
            return nullptr;
        }
        node = &it->second;
    }
    return node->is_null() ? nullptr : node;
}

std::string join_path(const std::vector<std::string>& path) {
    std::string combined;
    for (std::size_t i = 0; i < path.size(); ++i) {
        combined += path[i];
        if (i + 1 < path.size()) {
            combined += '.';
        }
    }
    return combined;
}

std::optional<std::string> get_string(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_string()) {
        return node->string_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected string at config path " + join_path(path));
}

std::optional<bool> get_bool(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_boolean()) {
        return node->boolean_value;
    }
    if (node->is_string()) {
        std::string lowered = node->string_value;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        if (lowered == "yes" || lowered == "on") {
            return true;
        }
        if (lowered == "no" || lowered == "off") {
            return false;
        }
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected boolean at config path " + join_path(path));
}

std::optional<std::int64_t> get_int64(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_integer()) {
        return node->integer_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected integer at config path " + join_path(path));
}

std::int64_t require_range(std::int64_t value, std::int64_t min, std::int64_t max, const char* key) {
    if (value < min || value > max) {
        throw ConfigError("E_CONFIG_VALUE", std::string(key) + " must be between " + std::to_string(min) +
                                                " and " + std::to_string(max));
    }
    return value;
}

Config::BootstrapPeer parse_bootstrap_entry(const Value& entry) {
    if (!entry.is_string()) {
        throw ConfigError("E_CONFIG_TYPE", "bootstrap entries must be host:port strings");
    }
    const auto colon = entry.string_value.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        throw ConfigError("E_CONFIG_VALUE", "Invalid bootstrap entry: " + entry.string_value);
    }
    std::int64_t port{};
    const auto text = entry.string_value.substr(colon + 1);
    const auto result = std::from_chars(text.data(), text.data() + text.size(), port);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        throw ConfigError("E_CONFIG_VALUE", "Invalid bootstrap port: " + entry.string_value);
    }
    Config::BootstrapPeer peer{};
    peer.host = entry.string_value.substr(0, colon);
    peer.port = static_cast<std::uint16_t>(require_range(port, 1, 65535, "bootstrap port"));
    return peer;
}

}  // namespace

std::map<std::string, Value>& Value::ensure_object() {
    if (type != ValueType::Object) {
        type = ValueType::Object;
        object_value.clear();
        array_value.clear();
        string_value.clear();
    }
    return object_value;
}

std::vector<Value>& Value::ensure_array() {
    if (type != ValueType::Array) {
        type = ValueType::Array;
        array_value.clear();
        object_value.clear();
        string_value.clear();
    }
    return array_value;
}

Value parse_yaml(const std::string& text) {
    Value root = Value::make_object();
    struct Context {
        std::size_t indent;
        Value* node;
    };
    std::vector<Context> stack;
    stack.push_back({0, &root});

    std::istringstream input(text);
    std::string line;
    while (std::getline(input, line)) {
        const std::string trimmed_line = trim_right(strip_comment(trim_right(line)));
        if (trimmed_line.empty()) {
            continue;
        }

        std::size_t indent = 0;
        while (indent < trimmed_line.size() && trimmed_line[indent] == ' ') {
            ++indent;
        }
        if (indent % 2 != 0) {
            throw ConfigError("E_CONFIG_PARSE", "YAML indentation must be multiples of two spaces");
        }
        const std::string content = trim_left(trimmed_line.substr(indent));

        while (!stack.empty() && indent < stack.back().indent) {
            stack.pop_back();
        }
        if (stack.empty()) {
            throw ConfigError("E_CONFIG_PARSE", "Invalid indentation in YAML config");
        }

        Value* current_node = stack.back().node;
        if (content.front() == '-') {
            auto& array = current_node->ensure_array();
            array.push_back(parse_yaml_scalar(content.substr(1)));
            continue;
        }

        const auto colon = content.find(':');
        if (colon == std::string::npos) {
            throw ConfigError("E_CONFIG_PARSE", "Expected ':' in YAML mapping entry");
        }
        const std::string key = trim_copy(content.substr(0, colon));
        const std::string value_part = trim_copy(content.substr(colon + 1));

        auto& object = current_node->ensure_object();
        if (value_part.empty()) {
            Value& child = object[key];
            stack.push_back({indent + 2, &child});
        } else {
            object[key] = parse_yaml_scalar(value_part);
        }
    }

    return root;
}

Value load_document(const std::filesystem::path& path) {
    const std::filesystem::path absolute = std::filesystem::absolute(path);
    std::ifstream input(absolute);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND", "Configuration file not found: " + absolute.string());
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    Value document = parse_yaml(buffer.str());
    if (!document.is_object()) {
        throw ConfigError("E_CONFIG_PARSE", "Configuration root must be a mapping");
    }
    return document;
}

void apply_document(const Value& document, Config& config) {
    if (auto host = get_string(document, {"node", "listen_host"})) {
        config.listen_host = *host;
    }
    if (auto port = get_int64(document, {"node", "listen_port"})) {
        config.listen_port = static_cast<std::uint16_t>(require_range(*port, 0, 65535, "node.listen_port"));
    }
    if (auto seed = get_string(document, {"node", "identity_seed"})) {
        if (seed->size() != 64 || !std::all_of(seed->begin(), seed->end(), [](unsigned char ch) {
                return std::isxdigit(ch) != 0;
            })) {
            throw ConfigError("E_CONFIG_VALUE", "node.identity_seed must be 64 hex characters");
        }
        config.identity_seed = *seed;
    }
    if (auto logging = get_bool(document, {"node", "logging"})) {
        config.logging_enabled = *logging;
    }
    if (auto level = get_string(document, {"node", "log_level"})) {
        if (!daemon::StructuredLogger::parse_level(*level)) {
            throw ConfigError("E_CONFIG_VALUE", "node.log_level must be info, warning or error");
        }
        config.log_level = *level;
    }

    if (auto window = get_int64(document, {"handshake", "replay_window_secs"})) {
        config.handshake_replay_window = std::chrono::seconds(require_range(*window, 1, 86400, "handshake.replay_window_secs"));
    }
    if (auto history = get_int64(document, {"handshake", "nonce_history"})) {
        config.handshake_nonce_history = static_cast<std::size_t>(require_range(*history, 1, 1'000'000, "handshake.nonce_history"));
    }
    if (auto timeout = get_int64(document, {"handshake", "timeout_ms"})) {
        config.handshake_timeout = std::chrono::milliseconds(require_range(*timeout, 1, 600'000, "handshake.timeout_ms"));
    }
    if (auto heartbeat = get_int64(document, {"handshake", "heartbeat_interval_ms"})) {
        config.heartbeat_interval = std::chrono::milliseconds(require_range(*heartbeat, 1, 3'600'000, "handshake.heartbeat_interval_ms"));
    }

    if (auto relay = get_bool(document, {"capabilities", "relay"})) {
        config.can_relay = *relay;
    }
    if (auto store = get_bool(document, {"capabilities", "store"})) {
        config.can_store = *store;
    }
    if (auto compute = get_bool(document, {"capabilities", "compute"})) {
        config.can_compute = *compute;
    }
    if (auto storage = get_int64(document, {"capabilities", "max_storage_mb"})) {
        config.max_storage_mb = static_cast<std::uint32_t>(
            require_range(*storage, 0, std::numeric_limits<std::uint32_t>::max(), "capabilities.max_storage_mb"));
    }
    if (const Value* skills = find_path(document, {"capabilities", "skills"})) {
        if (!skills->is_array()) {
            throw ConfigError("E_CONFIG_TYPE", "Expected array at config path capabilities.skills");
        }
        config.skills.clear();
        for (const auto& skill : skills->array_value) {
            if (!skill.is_string()) {
                throw ConfigError("E_CONFIG_TYPE", "capabilities.skills entries must be strings");
            }
            config.skills.push_back(skill.string_value);
        }
    }

    if (auto ttl = get_int64(document, {"relay", "default_ttl"})) {
        config.relay_default_ttl = static_cast<std::uint8_t>(require_range(*ttl, 0, 255, "relay.default_ttl"));
    }
    if (auto hops = get_int64(document, {"relay", "max_hops"})) {
        config.relay_max_hops = static_cast<std::uint8_t>(require_range(*hops, 1, 255, "relay.max_hops"));
    }
    if (auto expiry = get_int64(document, {"relay", "beacon_expiry_secs"})) {
        config.relay_beacon_expiry = std::chrono::seconds(require_range(*expiry, 1, 7 * 86400, "relay.beacon_expiry_secs"));
    }
    if (auto rotation = get_int64(document, {"relay", "identity_rotation_secs"})) {
        config.relay_identity_rotation = std::chrono::seconds(require_range(*rotation, 1, 86400, "relay.identity_rotation_secs"));
    }

    if (auto per_chunk = get_int64(document, {"sync", "events_per_chunk"})) {
        config.sync_events_per_chunk = static_cast<std::size_t>(require_range(*per_chunk, 1, 1'000'000, "sync.events_per_chunk"));
    }
    if (auto limit = get_int64(document, {"sync", "bandwidth_limit"})) {
        config.sync_bandwidth_limit = static_cast<std::uint64_t>(
            require_range(*limit, 0, std::numeric_limits<std::int64_t>::max(), "sync.bandwidth_limit"));
    }
    if (auto window = get_int64(document, {"sync", "window_ms"})) {
        config.sync_window = std::chrono::milliseconds(require_range(*window, 1, 60'000, "sync.window_ms"));
    }
    if (auto rerequests = get_int64(document, {"sync", "max_rerequests"})) {
        config.sync_max_rerequests = static_cast<std::uint8_t>(require_range(*rerequests, 0, 255, "sync.max_rerequests"));
    }

    if (auto capacity = get_int64(document, {"tasks", "queue_capacity"})) {
        config.task_queue_capacity = static_cast<std::size_t>(require_range(*capacity, 1, 10'000'000, "tasks.queue_capacity"));
    }
    if (auto retries = get_int64(document, {"tasks", "max_retries"})) {
        config.task_max_retries = static_cast<std::uint8_t>(require_range(*retries, 0, 255, "tasks.max_retries"));
    }
    if (auto timeout = get_int64(document, {"tasks", "ack_timeout_secs"})) {
        config.task_ack_timeout = std::chrono::seconds(require_range(*timeout, 1, 86400, "tasks.ack_timeout_secs"));
    }

    if (const Value* bootstrap = find_path(document, {"bootstrap"})) {
        if (!bootstrap->is_array()) {
            throw ConfigError("E_CONFIG_TYPE", "Expected array at config path bootstrap");
        }
        config.bootstrap_peers.clear();
        for (const auto& entry : bootstrap->array_value) {
            config.bootstrap_peers.push_back(parse_bootstrap_entry(entry));
        }
    }
}

Config load_config(const std::filesystem::path& path) {
    Config config{};
    apply_document(load_document(path), config);
    return config;
}

}  // namespace cortexgrid::config
