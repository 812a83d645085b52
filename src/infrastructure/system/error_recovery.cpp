// EN: Error Recovery implementation for the PipelineRun reconciler - exponential backoff with jitter
// FR: Implémentation Error Recovery pour le réconciliateur PipelineRun - backoff exponentiel avec jitter

#include "infrastructure/system/error_recovery.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace PRR {

RetryContext::RetryContext(const std::string& operation_name, const RetryConfig& config)
    : config_(config), operation_name_(operation_name), jitter_generator_(std::random_device{}()) {
}

std::chrono::milliseconds RetryContext::recordAttempt(const std::string& error_message) {
    RetryAttempt attempt;
    attempt.attempt_number = ++current_attempt_;
    attempt.timestamp = std::chrono::system_clock::now();
    attempt.error_message = error_message;
    attempt.delay = getNextDelay();

    attempts_.push_back(attempt);
    return attempt.delay;
}

bool RetryContext::canRetry() const {
    return config_.max_attempts == 0 || current_attempt_ < config_.max_attempts;
}

std::chrono::milliseconds RetryContext::getNextDelay() const {
    if (current_attempt_ == 0) {
        return std::chrono::milliseconds{0};
    }

    // EN: Calculate exponential backoff delay, capped to max_delay.
    // FR: Calcule le délai de backoff exponentiel, plafonné à max_delay.
    double delay_ms = config_.initial_delay.count() *
                      std::pow(config_.backoff_multiplier, static_cast<double>(current_attempt_ - 1));
    delay_ms = std::min(delay_ms, static_cast<double>(config_.max_delay.count()));

    auto base_delay = std::chrono::milliseconds(static_cast<long long>(delay_ms));
    if (config_.enable_jitter) {
        return calculateDelayWithJitter(base_delay);
    }
    return base_delay;
}

std::chrono::milliseconds RetryContext::calculateDelayWithJitter(std::chrono::milliseconds base_delay) const {
    if (config_.jitter_factor <= 0.0) {
        return base_delay;
    }

    double jitter_range = base_delay.count() * config_.jitter_factor;
    std::uniform_real_distribution<double> jitter_dist(-jitter_range, jitter_range);
    double jittered_delay = std::max(0.0, base_delay.count() + jitter_dist(jitter_generator_));

    return std::chrono::milliseconds(static_cast<long long>(jittered_delay));
}

void RetryContext::reset() {
    current_attempt_ = 0;
    attempts_.clear();
}

namespace ErrorRecoveryUtils {

RetryConfig createRequeueRetryConfig(std::chrono::milliseconds initial_delay,
                                     std::chrono::milliseconds max_delay,
                                     double multiplier) {
    RetryConfig config;
    config.max_attempts = 0;
    config.initial_delay = initial_delay;
    config.max_delay = max_delay;
    config.backoff_multiplier = multiplier;
    config.jitter_factor = 0.1;
    config.enable_jitter = true;
    return config;
}

std::string formatDelay(std::chrono::milliseconds delay) {
    std::ostringstream oss;
    if (delay.count() < 1000) {
        oss << delay.count() << "ms";
    } else {
        oss << std::fixed << std::setprecision(1) << (delay.count() / 1000.0) << "s";
    }
    return oss.str();
}

} // namespace ErrorRecoveryUtils

} // namespace PRR
