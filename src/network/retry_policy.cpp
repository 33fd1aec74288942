#include "selfcrypt/network/retry_policy.hpp"
#include "selfcrypt/crypto/random.hpp"
#include <algorithm>
#include <cmath>

namespace selfcrypt::network {

std::chrono::milliseconds RetryPolicy::base_delay(std::uint32_t failed_attempt) const {
    if (failed_attempt == 0) {
        return std::chrono::milliseconds(0);
    }
    
    double delay = static_cast<double>(initial_backoff.count()) *
                   std::pow(backoff_multiplier, static_cast<double>(failed_attempt - 1));
    delay = std::min(delay, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds(static_cast<long long>(delay));
}

std::chrono::milliseconds RetryPolicy::delay_for_attempt(std::uint32_t failed_attempt) const {
    auto delay = base_delay(failed_attempt);
    
    auto jitter_bound = static_cast<std::uint32_t>(static_cast<double>(delay.count()) * jitter_ratio);
    if (jitter_bound > 0) {
        delay += std::chrono::milliseconds(crypto::SecureRandom::generate_uniform(jitter_bound + 1));
    }
    
    return std::min(delay, max_backoff);
}

bool RetryPolicy::is_retryable(const core::Result& result) const {
    // Not-found is retried too: a fresh chunk may not have reached every replica yet
    return result.is_transient() || result.error == core::ErrorCode::NOT_FOUND;
}

bool RetryPolicy::validate() const {
    return max_attempts > 0 &&
           initial_backoff.count() >= 0 &&
           max_backoff >= initial_backoff &&
           backoff_multiplier >= 1.0 &&
           jitter_ratio >= 0.0 && jitter_ratio <= 1.0;
}

}
