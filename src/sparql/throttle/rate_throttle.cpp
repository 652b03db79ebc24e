#include "rate_throttle.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <mutex>

using namespace std::chrono;

namespace sparql::throttle {
    milliseconds exponential_backoff(int exponent, milliseconds cap) {
        const int clamped = std::clamp(exponent, 0, MAX_BACKOFF_EXPONENT);
        return std::min(milliseconds(seconds{1L << clamped}), cap);
    }

    RateThrottle::RateThrottle(ThrottlePolicy policy, utils::IClock& clock) : policy_(policy), clock_(clock) {}

    milliseconds RateThrottle::gap_for(int consecutive_hits) const {
        if (consecutive_hits <= 0) {
            return policy_.min_interval_;
        }
        return exponential_backoff(consecutive_hits, policy_.max_backoff_);
    }

    milliseconds RateThrottle::before_call(const std::string& endpoint_class) {
        milliseconds wait{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const ThrottleState& state = states_[endpoint_class];
            if (state.last_call_at_) {
                const auto since_last = duration_cast<milliseconds>(clock_.now() - *state.last_call_at_);
                wait = std::max(gap_for(state.consecutive_rate_limit_hits_) - since_last, milliseconds{0});
            }
            if (state.consecutive_rate_limit_hits_ > 0 && wait.count() > 0) {
                spdlog::info("throttle[{}]: backing off {} ms after {} rate-limit hit(s)", endpoint_class, wait.count(),
                             state.consecutive_rate_limit_hits_);
            }
        }

        clock_.sleep_for(wait);

        std::lock_guard<std::mutex> lock(mutex_);
        states_[endpoint_class].last_call_at_ = clock_.now();
        return wait;
    }

    void RateThrottle::on_result(const std::string& endpoint_class, bool was_rate_limited) {
        std::lock_guard<std::mutex> lock(mutex_);
        ThrottleState& state = states_[endpoint_class];
        if (was_rate_limited) {
            state.consecutive_rate_limit_hits_ = std::min(state.consecutive_rate_limit_hits_ + 1, policy_.max_consecutive_hits_);
            spdlog::warn("throttle[{}]: rate limited, consecutive hits now {}", endpoint_class, state.consecutive_rate_limit_hits_);
        } else {
            state.consecutive_rate_limit_hits_ = 0;
        }
    }

    ThrottleState RateThrottle::state(const std::string& endpoint_class) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = states_.find(endpoint_class);
        return it == states_.end() ? ThrottleState{} : it->second;
    }

    milliseconds RateThrottle::current_gap(const std::string& endpoint_class) const {
        return gap_for(state(endpoint_class).consecutive_rate_limit_hits_);
    }
}  // namespace sparql::throttle
