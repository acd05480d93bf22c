#pragma once

#include "cortexgrid/protocol/Message.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

namespace cortexgrid::relay {

struct DeliveredMessage {
    protocol::BeaconNonce nonce{};
    std::vector<std::uint8_t> plaintext;
    std::uint64_t created_at{0};
    std::uint8_t hop_count{0};
};

// Inbox of decrypted beacons waiting for the application.
class BeaconStore {
public:
    explicit BeaconStore(std::size_t capacity = 1024);

    void push(DeliveredMessage message);
    std::vector<DeliveredMessage> drain();
    std::size_t size() const;
    std::size_t dropped() const;

private:
    std::size_t capacity_;
    std::deque<DeliveredMessage> messages_;
    std::size_t dropped_{0};
    mutable std::mutex mutex_;
};

}  // namespace cortexgrid::relay
