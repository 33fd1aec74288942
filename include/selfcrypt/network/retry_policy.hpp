#pragma once

#include "selfcrypt/core/result.hpp"
#include <chrono>
#include <cstdint>

namespace selfcrypt::network {

// Bounded exponential backoff
struct RetryPolicy {
    std::uint32_t max_attempts = 5;
    std::chrono::milliseconds initial_backoff{50};
    std::chrono::milliseconds max_backoff{2000};
    double backoff_multiplier = 2.0;
    
    // Up to this fraction of the delay is added at random so that parallel
    // requests failing together do not retry in lockstep
    double jitter_ratio = 0.25;
    
    // Delay after the given failed attempt (1-based), without jitter
    std::chrono::milliseconds base_delay(std::uint32_t failed_attempt) const;
    std::chrono::milliseconds delay_for_attempt(std::uint32_t failed_attempt) const;
    
    bool is_retryable(const core::Result& result) const;
    
    bool validate() const;
};

}
