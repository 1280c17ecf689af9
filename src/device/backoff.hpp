/*
 * backoff.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Exponential reconnect backoff

**************************************************/

#ifndef FIRETV_DEVICE_BACKOFF_HPP
#define FIRETV_DEVICE_BACKOFF_HPP

#include <algorithm>
#include <chrono>

namespace firetv::device {

struct BackoffPolicy {
    std::chrono::milliseconds initial{1000};
    std::chrono::milliseconds max{60000};
    double multiplier{2.0};
};

/**
 * @brief Delay sequence initial, initial*m, initial*m^2, ... capped at max
 *
 * The sequence never decreases until reset().
 */
class ReconnectBackoff {
public:
    explicit ReconnectBackoff(BackoffPolicy policy = {})
        : policy_(policy) {
        policy_.initial = std::max(policy_.initial, std::chrono::milliseconds(1));
        policy_.max = std::max(policy_.max, policy_.initial);
        policy_.multiplier = std::max(policy_.multiplier, 1.0);
        current_ = policy_.initial;
    }

    /**
     * @brief Delay before the next attempt; advances the sequence
     */
    auto next() -> std::chrono::milliseconds {
        auto delay = current_;
        ++attempts_;
        auto grown = static_cast<double>(current_.count()) * policy_.multiplier;
        auto cap = static_cast<double>(policy_.max.count());
        current_ = std::chrono::milliseconds(
            static_cast<std::chrono::milliseconds::rep>(std::min(grown, cap)));
        return delay;
    }

    void reset() noexcept {
        current_ = policy_.initial;
        attempts_ = 0;
    }

    [[nodiscard]] auto attempts() const noexcept -> int { return attempts_; }

private:
    BackoffPolicy policy_;
    std::chrono::milliseconds current_;
    int attempts_{0};
};

}  // namespace firetv::device

#endif  // FIRETV_DEVICE_BACKOFF_HPP
