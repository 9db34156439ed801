// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file retry_policy.h
 * @brief Retry and backoff policy for idempotent remote operations
 */

#ifndef KCENON_WEBHDFS_TRANSPORT_RETRY_POLICY_H
#define KCENON_WEBHDFS_TRANSPORT_RETRY_POLICY_H

#include <chrono>
#include <cstddef>

namespace kcenon::webhdfs {

/**
 * @brief Retry policy configuration
 *
 * One attempt is a full sweep over the endpoint list. Only idempotent
 * operations get more than one attempt.
 */
struct retry_policy {
    /// Maximum number of sweeps over the endpoint list
    std::size_t max_attempts = 3;

    /// Delay before the second sweep
    std::chrono::milliseconds initial_delay{500};

    /// Upper bound for any single delay
    std::chrono::milliseconds max_delay{10000};

    /// Multiplier for exponential backoff
    double backoff_multiplier = 2.0;

    /// Scale each delay by a random factor in [0.5, 1.5)
    bool use_jitter = true;

    /**
     * @brief Policy that never sleeps (tests and interactive use)
     */
    [[nodiscard]] static auto immediate(std::size_t attempts = 3) -> retry_policy {
        retry_policy policy;
        policy.max_attempts = attempts;
        policy.initial_delay = std::chrono::milliseconds(0);
        policy.max_delay = std::chrono::milliseconds(0);
        policy.use_jitter = false;
        return policy;
    }
};

/**
 * @brief Compute the delay to wait after a failed attempt
 * @param policy Retry policy
 * @param attempt One-based number of the attempt that just failed
 */
[[nodiscard]] auto calculate_retry_delay(const retry_policy& policy,
                                         std::size_t attempt) -> std::chrono::milliseconds;

}  // namespace kcenon::webhdfs

#endif  // KCENON_WEBHDFS_TRANSPORT_RETRY_POLICY_H
