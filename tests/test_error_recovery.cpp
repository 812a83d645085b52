// EN: Unit tests for RetryContext - exponential requeue backoff, jitter bounds and attempt bookkeeping
// FR: Tests unitaires de RetryContext - backoff exponentiel de remise en file, bornes du jitter et suivi des tentatives

#include <gtest/gtest.h>
#include "infrastructure/system/error_recovery.hpp"

using namespace PRR;
using namespace std::chrono_literals;

class ErrorRecoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.max_attempts = 0;
        config_.initial_delay = 10ms;
        config_.max_delay = 50ms;
        config_.backoff_multiplier = 2.0;
        config_.enable_jitter = false;
    }

    RetryConfig config_;
};

TEST_F(ErrorRecoveryTest, DefaultConfiguration) {
    RetryConfig defaults;
    EXPECT_EQ(defaults.max_attempts, 0u);
    EXPECT_EQ(defaults.initial_delay, 100ms);
    EXPECT_EQ(defaults.max_delay, 30000ms);
    EXPECT_DOUBLE_EQ(defaults.backoff_multiplier, 2.0);
    EXPECT_DOUBLE_EQ(defaults.jitter_factor, 0.1);
    EXPECT_TRUE(defaults.enable_jitter);
}

TEST_F(ErrorRecoveryTest, NoDelayBeforeFirstFailure) {
    RetryContext context("default/pr", config_);

    EXPECT_EQ(context.getNextDelay(), 0ms);
    EXPECT_EQ(context.getCurrentAttempt(), 0u);
    EXPECT_EQ(context.getOperationName(), "default/pr");
}

TEST_F(ErrorRecoveryTest, DelayGrowsExponentiallyUpToTheCap) {
    RetryContext context("default/pr", config_);

    EXPECT_EQ(context.recordAttempt("conflict"), 10ms);
    EXPECT_EQ(context.recordAttempt("conflict"), 20ms);
    EXPECT_EQ(context.recordAttempt("conflict"), 40ms);
    // EN: 80ms is capped to max_delay.
    // FR: 80ms est plafonné à max_delay.
    EXPECT_EQ(context.recordAttempt("conflict"), 50ms);
    EXPECT_EQ(context.recordAttempt("conflict"), 50ms);
}

TEST_F(ErrorRecoveryTest, AttemptsAreRecorded) {
    RetryContext context("default/pr", config_);
    context.recordAttempt("first");
    context.recordAttempt("second");

    const auto& attempts = context.getAttempts();
    ASSERT_EQ(attempts.size(), 2u);
    EXPECT_EQ(attempts[0].attempt_number, 1u);
    EXPECT_EQ(attempts[0].error_message, "first");
    EXPECT_EQ(attempts[0].delay, 10ms);
    EXPECT_EQ(attempts[1].attempt_number, 2u);
    EXPECT_EQ(attempts[1].error_message, "second");
    EXPECT_EQ(attempts[1].delay, 20ms);
}

TEST_F(ErrorRecoveryTest, ResetStartsOver) {
    RetryContext context("default/pr", config_);
    context.recordAttempt("a");
    context.recordAttempt("b");

    context.reset();

    EXPECT_EQ(context.getCurrentAttempt(), 0u);
    EXPECT_TRUE(context.getAttempts().empty());
    EXPECT_EQ(context.recordAttempt("c"), 10ms);
}

TEST_F(ErrorRecoveryTest, UnlimitedAttemptsAlwaysRetry) {
    RetryContext context("default/pr", config_);
    for (int i = 0; i < 20; ++i) {
        context.recordAttempt("boom");
    }
    EXPECT_TRUE(context.canRetry());
}

TEST_F(ErrorRecoveryTest, MaxAttemptsStopsRetrying) {
    config_.max_attempts = 2;
    RetryContext context("default/pr", config_);

    EXPECT_TRUE(context.canRetry());
    context.recordAttempt("one");
    EXPECT_TRUE(context.canRetry());
    context.recordAttempt("two");
    EXPECT_FALSE(context.canRetry());
}

TEST_F(ErrorRecoveryTest, JitterStaysWithinFactor) {
    config_.enable_jitter = true;
    config_.jitter_factor = 0.1;
    config_.initial_delay = 1000ms;
    config_.max_delay = 1000ms;

    // EN: Every jittered delay stays within +/-10% of the base delay.
    // FR: Chaque délai avec jitter reste dans +/-10% du délai de base.
    for (int i = 0; i < 50; ++i) {
        RetryContext context("jitter", config_);
        auto delay = context.recordAttempt("x");
        EXPECT_GE(delay, 900ms);
        EXPECT_LE(delay, 1100ms);
    }
}

TEST_F(ErrorRecoveryTest, ZeroJitterFactorKeepsBaseDelay) {
    config_.enable_jitter = true;
    config_.jitter_factor = 0.0;
    RetryContext context("jitter", config_);

    EXPECT_EQ(context.recordAttempt("x"), 10ms);
}

TEST_F(ErrorRecoveryTest, RequeueConfigRetriesForever) {
    RetryConfig config = ErrorRecoveryUtils::createRequeueRetryConfig(250ms, 5000ms, 3.0);

    EXPECT_EQ(config.max_attempts, 0u);
    EXPECT_EQ(config.initial_delay, 250ms);
    EXPECT_EQ(config.max_delay, 5000ms);
    EXPECT_DOUBLE_EQ(config.backoff_multiplier, 3.0);
    EXPECT_TRUE(config.enable_jitter);
}

TEST_F(ErrorRecoveryTest, FormatDelay) {
    EXPECT_EQ(ErrorRecoveryUtils::formatDelay(0ms), "0ms");
    EXPECT_EQ(ErrorRecoveryUtils::formatDelay(250ms), "250ms");
    EXPECT_EQ(ErrorRecoveryUtils::formatDelay(1000ms), "1.0s");
    EXPECT_EQ(ErrorRecoveryUtils::formatDelay(3500ms), "3.5s");
}
