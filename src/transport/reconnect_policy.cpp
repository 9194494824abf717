#include "lanmap/transport/reconnect_policy.hpp"

#include <algorithm>

namespace lanmap::transport {

ReconnectPolicy::ReconnectPolicy(int max_attempts,
                                 std::chrono::milliseconds initial_delay,
                                 std::chrono::milliseconds max_delay)
    : max_attempts_(std::max(0, max_attempts)),
      initial_delay_(std::max(initial_delay, std::chrono::milliseconds{0})),
      max_delay_(std::max(max_delay, initial_delay_)) {}

std::optional<std::chrono::milliseconds> ReconnectPolicy::next_delay() {
    if (exhausted()) {
        return std::nullopt;
    }
    ++attempts_;

    auto delay = initial_delay_;
    for (int i = 1; i < attempts_ && delay < max_delay_; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_delay_);
}

}  // namespace lanmap::transport
