#ifndef SPARQL_GUARD_RATE_THROTTLE_HPP
#define SPARQL_GUARD_RATE_THROTTLE_HPP

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "../../utils/clock.hpp"

namespace sparql::throttle {
    const long MIN_INTERVAL_MS = 1'000;
    const long MAX_BACKOFF_MS = 32'000;
    const int MAX_CONSECUTIVE_HITS = 6;
    // 2^30 s still fits a milliseconds count; any larger exponent is clamped.
    const int MAX_BACKOFF_EXPONENT = 30;

    // min(2^exponent seconds, cap) for exponent >= 0.
    [[nodiscard]] std::chrono::milliseconds exponential_backoff(int exponent, std::chrono::milliseconds cap);

    struct ThrottlePolicy {
        std::chrono::milliseconds min_interval_{MIN_INTERVAL_MS};
        std::chrono::milliseconds max_backoff_{MAX_BACKOFF_MS};
        // caps the exponent, not the wait
        int max_consecutive_hits_ = MAX_CONSECUTIVE_HITS;
    };

    struct ThrottleState {
        std::optional<std::chrono::steady_clock::time_point> last_call_at_;
        int consecutive_rate_limit_hits_ = 0;
    };

    // Paces calls per endpoint class. The state for a class is read and
    // written under a lock, but the wait happens unlocked: two callers that
    // enter together can compute the same slot and fire back to back.
    class RateThrottle {
       public:
        RateThrottle(ThrottlePolicy policy, utils::IClock& clock);

        ~RateThrottle() = default;
        RateThrottle(const RateThrottle&) = delete;
        RateThrottle& operator=(const RateThrottle&) = delete;
        RateThrottle(RateThrottle&&) = delete;
        RateThrottle& operator=(RateThrottle&&) = delete;

        // Sleeps until the class may be called again, then stamps the call.
        // Returns how long it slept.
        std::chrono::milliseconds before_call(const std::string& endpoint_class);
        void on_result(const std::string& endpoint_class, bool was_rate_limited);

        [[nodiscard]] ThrottleState state(const std::string& endpoint_class) const;
        [[nodiscard]] std::chrono::milliseconds current_gap(const std::string& endpoint_class) const;

       private:
        [[nodiscard]] std::chrono::milliseconds gap_for(int consecutive_hits) const;

        ThrottlePolicy policy_;
        utils::IClock& clock_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, ThrottleState> states_;
    };
}  // namespace sparql::throttle

#endif
