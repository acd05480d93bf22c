#include "cortexgrid/network/NonceLedger.hpp"

#include <cassert>
#include <cstdint>

using namespace cortexgrid;
using namespace cortexgrid::network;

namespace {

NodeId make_peer(std::uint8_t seed) {
    NodeId id{};
    for (auto& byte : id) {
        byte = seed++;
    }
    return id;
}

protocol::ChallengeNonce make_nonce(std::uint32_t value) {
    protocol::ChallengeNonce nonce{};
    nonce[0] = static_cast<std::uint8_t>(value & 0xFF);
    nonce[1] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
    return nonce;
}

}  // namespace

int main() {
    NonceLedger ledger(3);
    const auto alice = make_peer(0x10);
    const auto bob = make_peer(0x90);

    assert(ledger.record(alice, make_nonce(1)));
    assert(!ledger.record(alice, make_nonce(1)));
    assert(ledger.record(bob, make_nonce(1)));
    assert(ledger.contains(alice, make_nonce(1)));
    assert(!ledger.contains(bob, make_nonce(2)));

    assert(ledger.record(alice, make_nonce(2)));
    assert(ledger.record(alice, make_nonce(3)));
    assert(ledger.history_size(alice) == 3);

    // The oldest nonce falls out once the per-peer history is full.
    assert(ledger.record(alice, make_nonce(4)));
    assert(ledger.history_size(alice) == 3);
    assert(!ledger.contains(alice, make_nonce(1)));
    assert(ledger.contains(alice, make_nonce(4)));
    assert(ledger.history_size(bob) == 1);

    NonceLedger defaults;
    assert(defaults.capacity() == 100);
    for (std::uint32_t i = 0; i < 150; ++i) {
        assert(defaults.record(alice, make_nonce(i)));
    }
    assert(defaults.history_size(alice) == 100);
    assert(!defaults.record(alice, make_nonce(149)));
    assert(defaults.history_size(make_peer(0x55)) == 0);
    return 0;
}
