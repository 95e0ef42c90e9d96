#include "streamdrop/retry_policy.hpp"

#include <gtest/gtest.h>

namespace streamdrop {
namespace {

using std::chrono::milliseconds;

TEST(RetryPolicyTest, UnboundedByDefault) {
    RetryPolicy policy;
    EXPECT_TRUE(policy.allowsRetry(1));
    EXPECT_TRUE(policy.allowsRetry(100000));
}

TEST(RetryPolicyTest, StopsAtMaxAttempts) {
    RetryPolicy policy;
    policy.max_attempts = 3;
    EXPECT_TRUE(policy.allowsRetry(1));
    EXPECT_TRUE(policy.allowsRetry(2));
    EXPECT_FALSE(policy.allowsRetry(3));
}

TEST(RetryPolicyTest, BacksOffExponentiallyUpToCap) {
    RetryPolicy policy;
    policy.initial_delay = milliseconds(100);
    policy.max_delay = milliseconds(1000);

    EXPECT_EQ(policy.delayFor(0), milliseconds(0));
    EXPECT_EQ(policy.delayFor(1), milliseconds(100));
    EXPECT_EQ(policy.delayFor(2), milliseconds(200));
    EXPECT_EQ(policy.delayFor(4), milliseconds(800));
    EXPECT_EQ(policy.delayFor(5), milliseconds(1000));
    EXPECT_EQ(policy.delayFor(4000), milliseconds(1000));
}

} // namespace
} // namespace streamdrop
