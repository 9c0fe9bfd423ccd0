#include "sdcp/session/Backoff.hpp"

#include "support/TestAssert.hpp"

using namespace sdcp::session;
using namespace std::chrono_literals;

static void testCeilings() {
    BackoffConfig config;
    config.base = 1000ms;
    config.cap = 30000ms;
    Backoff backoff(config, 7);

    ASSERT_EQ(backoff.ceiling(0).count(), 1000, "attempt 0");
    ASSERT_EQ(backoff.ceiling(1).count(), 2000, "attempt 1");
    ASSERT_EQ(backoff.ceiling(4).count(), 16000, "attempt 4");
    ASSERT_EQ(backoff.ceiling(5).count(), 30000, "capped");
    ASSERT_EQ(backoff.ceiling(200).count(), 30000, "large attempts stay capped");

    auto previous = backoff.ceiling(0);
    for (std::size_t attempt = 1; attempt < 64; ++attempt) {
        const auto current = backoff.ceiling(attempt);
        ASSERT_TRUE(current >= previous, "ceilings never decrease");
        ASSERT_TRUE(current <= config.cap, "ceilings bounded by cap");
        previous = current;
    }
}

static void testJitterRange() {
    BackoffConfig config;
    config.base = 100ms;
    config.cap = 800ms;
    Backoff backoff(config, 11);

    bool sawBelowCeiling = false;
    for (std::size_t attempt = 0; attempt < 6; ++attempt) {
        for (int i = 0; i < 200; ++i) {
            const auto delay = backoff.delay(attempt);
            ASSERT_TRUE(delay.count() >= 0, "delay non-negative");
            ASSERT_TRUE(delay <= backoff.ceiling(attempt), "delay within ceiling");
            sawBelowCeiling = sawBelowCeiling || delay < backoff.ceiling(attempt);
        }
    }
    ASSERT_TRUE(sawBelowCeiling, "jitter spreads delays");
}

static void testWithoutJitter() {
    BackoffConfig config;
    config.base = 250ms;
    config.cap = 1000ms;
    config.jitter = false;
    Backoff backoff(config, 3);
    ASSERT_EQ(backoff.delay(0).count(), 250, "exact base");
    ASSERT_EQ(backoff.delay(1).count(), 500, "exact doubling");
    ASSERT_EQ(backoff.delay(9).count(), 1000, "exact cap");
}

int main() {
    testCeilings();
    testJitterRange();
    testWithoutJitter();
    return reportResult("Backoff");
}
