#include "cortexgrid/sync/BandwidthThrottle.hpp"
#include "cortexgrid/sync/SyncProgress.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>

using namespace cortexgrid;
using namespace cortexgrid::sync;
using namespace std::chrono_literals;

namespace {

void ceiling_holds_within_window() {
    BandwidthThrottle throttle(1000, 1s);
    const auto t0 = BandwidthThrottle::Clock::now();

    assert(throttle.try_acquire(600, t0));
    assert(throttle.try_acquire(400, t0 + 100ms));
    assert(!throttle.try_acquire(1, t0 + 200ms));
    assert(throttle.bytes_in_window(t0 + 200ms) == 1000);
    assert(throttle.wait_time(1, t0 + 200ms) == 800ms);

    // The first grant rolls out of the window, the second has not.
    assert(throttle.bytes_in_window(t0 + 1000ms) == 400);
    assert(throttle.try_acquire(600, t0 + 1000ms));
    assert(!throttle.try_acquire(100, t0 + 1050ms));
    assert(throttle.try_acquire(100, t0 + 1100ms));
}

void oversize_send_needs_an_empty_window() {
    BandwidthThrottle throttle(100, 1s);
    const auto t0 = BandwidthThrottle::Clock::now();
    assert(throttle.try_acquire(10, t0));
    assert(!throttle.try_acquire(500, t0 + 10ms));
    assert(throttle.wait_time(500, t0 + 10ms) > BandwidthThrottle::Clock::duration::zero());
    assert(throttle.try_acquire(500, t0 + 1000ms));
    assert(throttle.bytes_in_window(t0 + 1000ms) == 500);
}

void zero_ceiling_is_unlimited() {
    BandwidthThrottle throttle;
    const auto t0 = BandwidthThrottle::Clock::now();
    for (int i = 0; i < 100; ++i) {
        assert(throttle.try_acquire(1'000'000, t0));
    }
    assert(throttle.wait_time(1'000'000, t0) == BandwidthThrottle::Clock::duration::zero());

    throttle.set_ceiling(10);
    assert(throttle.ceiling() == 10);
    assert(throttle.try_acquire(10, t0));
    assert(!throttle.try_acquire(1, t0));
}

void acquire_blocks_until_admitted() {
    BandwidthThrottle throttle(100, 50ms);
    throttle.acquire(100);
    const auto before = BandwidthThrottle::Clock::now();
    throttle.acquire(100);
    assert(BandwidthThrottle::Clock::now() - before >= 40ms);
}

void progress_figures() {
    SyncProgress idle{};
    assert(idle.percent() == 100.0);
    assert(idle.is_complete());

    SyncProgressTable table;
    NodeId peer{};
    peer.fill(7);
    const auto t0 = SyncProgress::Clock::now();
    table.start(peer, 4, t0);
    table.record_synced(peer, 2000);
    table.record_failed(peer);
    assert(table.active_count() == 1);

    const auto snapshot = table.snapshot(peer);
    assert(snapshot.has_value());
    assert(snapshot->percent() == 25.0);
    assert(!snapshot->is_complete());
    assert(snapshot->throughput(t0 + 2s) == 1000.0);
    assert(snapshot->elapsed(t0 + 1500ms) == 1500ms);

    const auto final_state = table.complete(peer);
    assert(final_state.has_value());
    assert(final_state->synced_chunks == 1 && final_state->failed_chunks == 1);
    assert(!table.snapshot(peer).has_value());
    assert(table.active_count() == 0);

    table.record_synced(peer, 10);
    assert(!table.snapshot(peer).has_value());
}

}  // namespace

int main() {
    ceiling_holds_within_window();
    oversize_send_needs_an_empty_window();
    zero_ceiling_is_unlimited();
    acquire_blocks_until_admitted();
    progress_figures();
    return 0;
}
