#include "cortexgrid/sync/BandwidthThrottle.hpp"

#include <thread>

namespace cortexgrid::sync {

BandwidthThrottle::BandwidthThrottle(std::uint64_t bytes_per_window, std::chrono::milliseconds window)
    : ceiling_(bytes_per_window),
      window_(window.count() > 0 ? window : std::chrono::milliseconds(1)) {}

bool BandwidthThrottle::try_acquire(std::size_t bytes, Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    if (ceiling_ == 0) {
        return true;
    }
    expire_locked(now);
    if (!admits_locked(bytes)) {
        return false;
    }
    grants_.push_back(Grant{now, bytes});
    in_window_ += bytes;
    return true;
}

void BandwidthThrottle::acquire(std::size_t bytes) {
    while (!try_acquire(bytes)) {
        const auto wait = wait_time(bytes);
        std::this_thread::sleep_for(wait > Clock::duration::zero() ? wait : Clock::duration(std::chrono::milliseconds(1)));
    }
}

std::uint64_t BandwidthThrottle::bytes_in_window(Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    expire_locked(now);
    return in_window_;
}

BandwidthThrottle::Clock::duration BandwidthThrottle::wait_time(std::size_t bytes, Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    if (ceiling_ == 0) {
        return Clock::duration::zero();
    }
    expire_locked(now);
    if (admits_locked(bytes)) {
        return Clock::duration::zero();
    }

    // Walk the grants oldest first until enough would have rolled out.
    auto remaining = in_window_;
    for (const auto& grant : grants_) {
        remaining -= grant.bytes;
        if (remaining == 0 || remaining + bytes <= ceiling_) {
            return grant.at + window_ - now;
        }
    }
    return Clock::duration::zero();
}

void BandwidthThrottle::set_ceiling(std::uint64_t bytes_per_window) {
    std::scoped_lock lock(mutex_);
    ceiling_ = bytes_per_window;
}

std::uint64_t BandwidthThrottle::ceiling() const {
    std::scoped_lock lock(mutex_);
    return ceiling_;
}

void BandwidthThrottle::expire_locked(Clock::time_point now) {
    while (!grants_.empty() && now - grants_.front().at >= window_) {
        in_window_ -= grants_.front().bytes;
        grants_.pop_front();
    }
}

bool BandwidthThrottle::admits_locked(std::uint64_t bytes) const {
    return in_window_ == 0 || in_window_ + bytes <= ceiling_;
}

}  // namespace cortexgrid::sync
