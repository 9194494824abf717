#pragma once

#include <chrono>
#include <optional>

namespace lanmap::transport {

/**
 * @brief Bounded exponential backoff for the push connection.
 *
 * The n-th call to next_delay() yields initial_delay * 2^(n-1), capped at
 * max_delay. Once max_attempts delays were handed out it yields nullopt until
 * reset() is called.
 */
class ReconnectPolicy {
public:
    ReconnectPolicy(int max_attempts,
                    std::chrono::milliseconds initial_delay,
                    std::chrono::milliseconds max_delay);

    std::optional<std::chrono::milliseconds> next_delay();
    void reset() noexcept { attempts_ = 0; }

    int attempts() const noexcept { return attempts_; }
    int max_attempts() const noexcept { return max_attempts_; }
    bool exhausted() const noexcept { return attempts_ >= max_attempts_; }

private:
    int max_attempts_;
    std::chrono::milliseconds initial_delay_;
    std::chrono::milliseconds max_delay_;
    int attempts_{0};
};

}  // namespace lanmap::transport
