#include "execution_context.hpp"

namespace service {
    ExecutionContext::ExecutionContext(utils::IClock& clock, const CachePolicies& caches, const sparql::throttle::ThrottlePolicy& throttle)
        : clock_(clock),
          throttle_(throttle, clock),
          entity_cache_(caches.entity_, clock),
          property_cache_(caches.property_, clock),
          schema_cache_(caches.schema_, clock),
          query_cache_(caches.query_, clock) {}

    sparql::repair::RepairContext ExecutionContext::repair_context() {
        return sparql::repair::RepairContext{.clock_ = clock_, .throttle_ = throttle_, .results_ = query_cache_};
    }
}  // namespace service
