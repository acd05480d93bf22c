#include "cortexgrid/Types.hpp"

#include <chrono>
#include <iomanip>
#include <optional>
#include <sstream>

namespace cortexgrid {

namespace {
std::string to_hex(const std::uint8_t value) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setw(2) << std::setfill('0') << static_cast<int>(value);
    return oss.str();
}

}  // namespace

std::string bytes_to_hex(const std::uint8_t* data, std::size_t size) {
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out += to_hex(data[i]);
    }
    return out;
}

std::string node_id_to_string(const NodeId& id) {
    return bytes_to_hex(id.data(), id.size());
}

std::string hash_to_string(const ContentHash& hash) {
    return bytes_to_hex(hash.data(), hash.size());
}

std::optional<NodeId> node_id_from_string(const std::string& text) {
    if (text.size() != NodeId{}.size() * 2) {
        return std::nullopt;
    }

    NodeId id{};
    for (std::size_t index = 0; index < id.size(); ++index) {
        const auto offset = index * 2;
        const auto byte_text = text.substr(offset, 2);
        std::istringstream iss(byte_text);
        int value = 0;
        iss >> std::hex >> value;
        if (iss.fail() || value < 0 || value > 0xFF) {
            return std::nullopt;
        }
        id[index] = static_cast<std::uint8_t>(value);
    }
    return id;
}

std::uint64_t unix_seconds_now() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

}  
