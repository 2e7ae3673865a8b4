#ifndef VERTOPAL_API_RETRY_POLICY_HPP
#define VERTOPAL_API_RETRY_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>

namespace vertopal::api {

/**
 * Configuration for retry behavior
 */
struct retry_config {
    int max_attempts = 5;                           // total attempts, including the first one
    std::chrono::milliseconds base_delay{1000};
    double exponential_base = 2.0;
    std::chrono::milliseconds max_delay{300000};
};

/**
 * Exponential backoff for transport failures.
 *
 * Attempts are numbered from 1. After a failed attempt n the caller waits
 * base_delay * exponential_base^n before the next one, so with the defaults
 * the waits are 2s, 4s, 8s...
 */
class retry_policy {
public:
    explicit retry_policy(const retry_config& config = {}) : config_(config) {
        config_.max_attempts = std::max(config_.max_attempts, 1);
    }

    std::chrono::milliseconds delay(int attempt) const {
        double delay_ms = static_cast<double>(config_.base_delay.count()) *
                          std::pow(config_.exponential_base, static_cast<double>(attempt));
        delay_ms = std::min(delay_ms, static_cast<double>(config_.max_delay.count()));
        return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
    }

    // true when another attempt may follow the failed attempt
    bool should_retry(int attempt) const {
        return attempt < config_.max_attempts;
    }

    int max_attempts() const { return config_.max_attempts; }

    const retry_config& config() const { return config_; }

private:
    retry_config config_;
};

}

#endif
