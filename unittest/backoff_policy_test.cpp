// ============================================================================
// BACKOFF POLICY UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <vaultstream/core/connector/backoff_policy.hpp>
#include <limits>

using namespace VaultStream;
using std::chrono::milliseconds;

TEST(BackoffPolicy, DoublesFromInitialDelay) {
    BackoffPolicy policy(milliseconds(1000), milliseconds(30000));
    EXPECT_EQ(policy.nextDelay(0), milliseconds(1000));
    EXPECT_EQ(policy.nextDelay(1), milliseconds(2000));
    EXPECT_EQ(policy.nextDelay(2), milliseconds(4000));
    EXPECT_EQ(policy.nextDelay(3), milliseconds(8000));
    EXPECT_EQ(policy.nextDelay(4), milliseconds(16000));
    EXPECT_EQ(policy.nextDelay(5), milliseconds(30000));
}

TEST(BackoffPolicy, NeverExceedsMaxAndIsMonotonic) {
    BackoffPolicy policy(milliseconds(250), milliseconds(7000));
    milliseconds previous{0};
    for (uint32_t attempt = 0; attempt < 200; ++attempt) {
        auto delay = policy.nextDelay(attempt);
        EXPECT_LE(delay, milliseconds(7000)) << "attempt " << attempt;
        EXPECT_GE(delay, previous) << "attempt " << attempt;
        previous = delay;
    }
    EXPECT_EQ(previous, milliseconds(7000));
}

TEST(BackoffPolicy, HugeAttemptSaturates) {
    BackoffPolicy policy(milliseconds(1000), milliseconds(30000));
    EXPECT_EQ(policy.nextDelay(std::numeric_limits<uint32_t>::max()), milliseconds(30000));
}

TEST(BackoffPolicy, InitialAboveMaxIsClamped) {
    BackoffPolicy policy(milliseconds(5000), milliseconds(2000));
    EXPECT_EQ(policy.nextDelay(0), milliseconds(2000));
    EXPECT_EQ(policy.nextDelay(10), milliseconds(2000));
}

TEST(BackoffPolicy, IsDeterministic) {
    BackoffPolicy a(milliseconds(100), milliseconds(10000));
    BackoffPolicy b(milliseconds(100), milliseconds(10000));
    for (uint32_t attempt = 0; attempt < 20; ++attempt) {
        EXPECT_EQ(a.nextDelay(attempt), b.nextDelay(attempt));
    }
}
