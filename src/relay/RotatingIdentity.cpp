#include "cortexgrid/relay/RotatingIdentity.hpp"

#include "cortexgrid/daemon/StructuredLogger.hpp"
#include "cortexgrid/relay/Beacon.hpp"

namespace cortexgrid::relay {

RotatingIdentity::RotatingIdentity(std::chrono::seconds rotation_interval, Clock::time_point now)
    : rotation_interval_(rotation_interval.count() > 0 ? rotation_interval : std::chrono::seconds(1)),
      current_(make_epoch()),
      rotated_at_(now) {}

RotatingIdentity::Epoch RotatingIdentity::make_epoch() {
    auto keys = network::EphemeralKeyPair::generate();
    const auto hash = key_hash_prefix(keys.public_key());
    return Epoch{std::move(keys), hash};
}

bool RotatingIdentity::maybe_rotate(Clock::time_point now) {
    {
        std::scoped_lock lock(mutex_);
        if (now - rotated_at_ < rotation_interval_) {
            return false;
        }
    }
    rotate(now);
    return true;
}

void RotatingIdentity::rotate(Clock::time_point now) {
    auto next = make_epoch();
    std::scoped_lock lock(mutex_);
    previous_ = std::move(current_);
    current_ = std::move(next);
    rotated_at_ = now;
    daemon::log_event(daemon::StructuredLogger::Level::Info,
                      "relay.identity_rotated",
                      {{"prefix", prefix_to_string(current_.hash)}});
}

PublicKey RotatingIdentity::public_key() const {
    std::scoped_lock lock(mutex_);
    return current_.keys.public_key();
}

protocol::KeyHashPrefix RotatingIdentity::key_hash() const {
    std::scoped_lock lock(mutex_);
    return current_.hash;
}

bool RotatingIdentity::matches(const protocol::KeyHashPrefix& prefix) const {
    std::scoped_lock lock(mutex_);
    return current_.hash == prefix || (previous_.has_value() && previous_->hash == prefix);
}

std::vector<network::EphemeralKeyPair> RotatingIdentity::keys_for(const protocol::KeyHashPrefix& prefix) const {
    std::scoped_lock lock(mutex_);
    std::vector<network::EphemeralKeyPair> keys;
    if (current_.hash == prefix) {
        keys.push_back(current_.keys);
    }
    if (previous_.has_value() && previous_->hash == prefix) {
        keys.push_back(previous_->keys);
    }
    return keys;
}

std::vector<protocol::KeyHashPrefix> RotatingIdentity::active_prefixes() const {
    std::scoped_lock lock(mutex_);
    std::vector<protocol::KeyHashPrefix> prefixes{current_.hash};
    if (previous_.has_value()) {
        prefixes.push_back(previous_->hash);
    }
    return prefixes;
}

}  // namespace cortexgrid::relay
