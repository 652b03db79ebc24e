#ifndef SPARQL_GUARD_EXECUTION_CONTEXT_HPP
#define SPARQL_GUARD_EXECUTION_CONTEXT_HPP

#include <chrono>

#include "../grounding/interface.hpp"
#include "../http/cache/ttl_cache.hpp"
#include "../sparql/model/execution_result.hpp"
#include "../sparql/repair/orchestrator.hpp"
#include "../sparql/throttle/rate_throttle.hpp"
#include "../utils/clock.hpp"

namespace service {
    const long ENTITY_CACHE_TTL_S = 600;
    const long PROPERTY_CACHE_TTL_S = 600;
    const long SCHEMA_CACHE_TTL_S = 900;
    const long QUERY_CACHE_TTL_S = 300;

    struct CachePolicies {
        http::cache::TtlCachePolicy entity_{.ttl_ = std::chrono::seconds(ENTITY_CACHE_TTL_S)};
        http::cache::TtlCachePolicy property_{.ttl_ = std::chrono::seconds(PROPERTY_CACHE_TTL_S)};
        http::cache::TtlCachePolicy schema_{.ttl_ = std::chrono::seconds(SCHEMA_CACHE_TTL_S)};
        http::cache::TtlCachePolicy query_{.ttl_ = std::chrono::seconds(QUERY_CACHE_TTL_S)};

        void set_enabled(bool enabled) {
            entity_.enable_caching_ = enabled;
            property_.enable_caching_ = enabled;
            schema_.enable_caching_ = enabled;
            query_.enable_caching_ = enabled;
        }
    };

    // The only state shared between concurrent requests. Each pool and the
    // throttle guard themselves.
    class ExecutionContext {
       public:
        ExecutionContext(utils::IClock& clock, const CachePolicies& caches, const sparql::throttle::ThrottlePolicy& throttle);

        ~ExecutionContext() = default;
        ExecutionContext(const ExecutionContext&) = delete;
        ExecutionContext& operator=(const ExecutionContext&) = delete;
        ExecutionContext(ExecutionContext&&) = delete;
        ExecutionContext& operator=(ExecutionContext&&) = delete;

        [[nodiscard]] utils::IClock& clock() { return clock_; }
        [[nodiscard]] sparql::throttle::RateThrottle& throttle() { return throttle_; }

        [[nodiscard]] http::cache::TtlCache<grounding::GroundingLookup>& entity_cache() { return entity_cache_; }
        [[nodiscard]] http::cache::TtlCache<grounding::GroundingLookup>& property_cache() { return property_cache_; }
        [[nodiscard]] http::cache::TtlCache<grounding::SchemaContext>& schema_cache() { return schema_cache_; }
        [[nodiscard]] http::cache::TtlCache<sparql::model::ExecutionResult>& query_cache() { return query_cache_; }

        [[nodiscard]] sparql::repair::RepairContext repair_context();

       private:
        utils::IClock& clock_;
        sparql::throttle::RateThrottle throttle_;

        http::cache::TtlCache<grounding::GroundingLookup> entity_cache_;
        http::cache::TtlCache<grounding::GroundingLookup> property_cache_;
        http::cache::TtlCache<grounding::SchemaContext> schema_cache_;
        http::cache::TtlCache<sparql::model::ExecutionResult> query_cache_;
    };
}  // namespace service

#endif
