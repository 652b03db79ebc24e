#ifndef SPARQL_GUARD_TTL_CACHE_HPP
#define SPARQL_GUARD_TTL_CACHE_HPP

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "../../utils/clock.hpp"

namespace http::cache {

    struct TtlCachePolicy {
        bool enable_caching_ = true;
        std::chrono::seconds ttl_{300};
    };

    // Process-lifetime key/value memory with per-entry expiry. Expired
    // entries are dropped when they are looked up; there is no sweeper and
    // no size bound. Values are stored and returned by copy.
    template <typename T>
    class TtlCache {
       public:
        TtlCache(TtlCachePolicy policy, const utils::IClock& clock) : policy_(policy), clock_(&clock) {}

        ~TtlCache() = default;
        TtlCache(const TtlCache&) = delete;
        TtlCache& operator=(const TtlCache&) = delete;
        TtlCache(TtlCache&&) = delete;
        TtlCache& operator=(TtlCache&&) = delete;

        [[nodiscard]] std::optional<T> get(const std::string& key) {
            if (!policy_.enable_caching_) {
                return std::nullopt;
            }

            std::lock_guard<std::mutex> lock(mutex_);
            auto it = store_.find(key);
            if (it == store_.end()) {
                return std::nullopt;
            }

            if (clock_->now() - it->second.stored_at_ > policy_.ttl_) {
                store_.erase(it);
                return std::nullopt;
            }

            return it->second.value_;
        }

        void set(const std::string& key, T value) {
            if (!policy_.enable_caching_) {
                return;
            }

            std::lock_guard<std::mutex> lock(mutex_);
            store_.insert_or_assign(key, Entry{.value_ = std::move(value), .stored_at_ = clock_->now()});
        }

        [[nodiscard]] size_t size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return store_.size();
        }

        [[nodiscard]] const TtlCachePolicy& policy() const { return policy_; }

       private:
        struct Entry {
            T value_;
            std::chrono::steady_clock::time_point stored_at_;
        };

        TtlCachePolicy policy_;
        const utils::IClock* clock_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, Entry> store_;
    };

}  // namespace http::cache

#endif
