#include "lanmap/transport/reconnect_policy.hpp"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using lanmap::transport::ReconnectPolicy;
using std::chrono::milliseconds;

namespace {

std::vector<long long> drain(ReconnectPolicy& policy) {
    std::vector<long long> delays;
    while (auto delay = policy.next_delay()) {
        delays.push_back(delay->count());
    }
    return delays;
}

}  // namespace

TEST_CASE("Backoff doubles until the attempt budget is spent", "[transport]") {
    ReconnectPolicy policy(5, milliseconds(1000), milliseconds(16000));

    CHECK(drain(policy) == std::vector<long long>{1000, 2000, 4000, 8000, 16000});
    CHECK(policy.exhausted());
    CHECK(policy.attempts() == 5);
    CHECK_FALSE(policy.next_delay());
    CHECK(policy.attempts() == 5);
}

TEST_CASE("Backoff is capped at the maximum delay", "[transport]") {
    ReconnectPolicy policy(6, milliseconds(1000), milliseconds(5000));
    CHECK(drain(policy) == std::vector<long long>{1000, 2000, 4000, 5000, 5000, 5000});
}

TEST_CASE("Reset restores the full budget", "[transport]") {
    ReconnectPolicy policy(2, milliseconds(250), milliseconds(1000));
    REQUIRE(policy.next_delay() == milliseconds(250));
    REQUIRE(policy.next_delay() == milliseconds(500));
    REQUIRE_FALSE(policy.next_delay());

    policy.reset();
    CHECK_FALSE(policy.exhausted());
    CHECK(policy.next_delay() == milliseconds(250));
}

TEST_CASE("A zero attempt budget never retries", "[transport]") {
    ReconnectPolicy policy(0, milliseconds(1000), milliseconds(2000));
    CHECK(policy.exhausted());
    CHECK_FALSE(policy.next_delay());
}
