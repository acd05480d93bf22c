#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

namespace cortexgrid::sync {

// Sliding-window byte budget shared by every outbound chunk transfer.
// A ceiling of zero disables throttling. A single send larger than the
// ceiling is admitted once the window is empty.
class BandwidthThrottle {
public:
    using Clock = std::chrono::steady_clock;

    explicit BandwidthThrottle(std::uint64_t bytes_per_window = 0,
                               std::chrono::milliseconds window = std::chrono::seconds(1));

    bool try_acquire(std::size_t bytes, Clock::time_point now = Clock::now());
    // Blocks the caller until the bytes fit in the window.
    void acquire(std::size_t bytes);

    std::uint64_t bytes_in_window(Clock::time_point now = Clock::now());
    // Zero when the bytes would be admitted right now.
    Clock::duration wait_time(std::size_t bytes, Clock::time_point now = Clock::now());

    void set_ceiling(std::uint64_t bytes_per_window);
    std::uint64_t ceiling() const;
    std::chrono::milliseconds window() const noexcept { return window_; }

private:
    struct Grant {
        Clock::time_point at;
        std::uint64_t bytes{0};
    };

    void expire_locked(Clock::time_point now);
    bool admits_locked(std::uint64_t bytes) const;

    std::uint64_t ceiling_;
    std::chrono::milliseconds window_;
    std::deque<Grant> grants_;
    std::uint64_t in_window_{0};
    mutable std::mutex mutex_;
};

}  // namespace cortexgrid::sync
