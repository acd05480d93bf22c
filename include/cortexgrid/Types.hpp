#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cortexgrid {

using NodeId = std::array<std::uint8_t, 32>;
using ContentHash = std::array<std::uint8_t, 32>;
using SessionId = std::array<std::uint8_t, 32>;
using PublicKey = std::array<std::uint8_t, 32>;
using Signature = std::array<std::uint8_t, 64>;
using Bytes = std::vector<std::uint8_t>;

std::string node_id_to_string(const NodeId& id);
std::string hash_to_string(const ContentHash& hash);
std::optional<NodeId> node_id_from_string(const std::string& text);
std::string bytes_to_hex(const std::uint8_t* data, std::size_t size);

std::uint64_t unix_seconds_now();

}  
