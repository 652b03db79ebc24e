#ifndef SPARQL_GUARD_ORCHESTRATOR_HPP
#define SPARQL_GUARD_ORCHESTRATOR_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "../../http/cache/ttl_cache.hpp"
#include "../../utils/clock.hpp"
#include "../endpoint/endpoint_registry.hpp"
#include "../errors/error_classifier.hpp"
#include "../lint/linter.hpp"
#include "../model/execution_result.hpp"
#include "../model/query.hpp"
#include "../query/rewritable_query.hpp"
#include "../throttle/rate_throttle.hpp"
#include "../transport/interface.hpp"

namespace sparql::repair {
    const int MAX_REPAIRS = 2;
    const long DRY_RUN_TIMEOUT_CAP_MS = 15'000;
    const long RATE_LIMIT_BACKOFF_CAP_MS = 16'000;
    // Longer queries fail as SYNTAX before any stage runs.
    const size_t MAX_QUERY_BYTES = 100'000;

    struct RepairPolicy {
        int max_repairs_ = MAX_REPAIRS;
        std::chrono::milliseconds dry_run_timeout_cap_{DRY_RUN_TIMEOUT_CAP_MS};
        std::chrono::milliseconds rate_limit_backoff_cap_{RATE_LIMIT_BACKOFF_CAP_MS};
        size_t max_query_bytes_ = MAX_QUERY_BYTES;
    };

    enum class Stage { LINT, CACHE_CHECK, DRY_RUN, EXECUTE, SUCCESS, FAILED };

    [[nodiscard]] const char* to_string(Stage stage);

    struct RepairAction {
        enum class Kind { STRIP_LABEL_SERVICE, HALVE_LIMIT, RATE_LIMIT_BACKOFF };

        int attempt_;
        Kind kind_;
        sparql::errors::ErrorCode trigger_;
        std::string description_;
    };

    // Shared, process-wide pieces every run touches.
    struct RepairContext {
        utils::IClock& clock_;
        sparql::throttle::RateThrottle& throttle_;
        http::cache::TtlCache<sparql::model::ExecutionResult>& results_;
    };

    // lint -> cache check -> dry run -> execute with bounded repair.
    // run() always returns a well-formed result and never throws for
    // failures of the query or the endpoint.
    class Orchestrator {
       public:
        Orchestrator(RepairContext context, const sparql::endpoint::EndpointRegistry& registry, sparql::transport::ISparqlTransport& transport,
                     RepairPolicy policy = {}, sparql::lint::LintOptions lint_defaults = {});

        [[nodiscard]] sparql::model::ExecutionResult run(const sparql::model::Query& query, const sparql::model::GroundingSets& grounding,
                                                         std::chrono::milliseconds timeout_budget, long limit_cap);

        // Single throttled round trip with no lint, cache or repair.
        sparql::transport::TransportResult execute_throttled(const sparql::endpoint::EndpointClass& endpoint, const std::string& query,
                                                             std::chrono::milliseconds timeout);

       private:
        struct Run {
            sparql::endpoint::EndpointClass endpoint_;
            const sparql::model::GroundingSets& grounding_;
            std::chrono::milliseconds timeout_budget_;
            long limit_cap_;
            std::chrono::steady_clock::time_point started_at_;

            Stage stage_ = Stage::LINT;
            std::string source_text_;
            std::string cache_key_;
            std::optional<sparql::query::RewritableQuery> current_;
            int attempt_ = 0;
            std::vector<RepairAction> repairs_;
            sparql::model::ExecutionResult result_;
        };

        Stage lint_stage(Run& run) const;
        Stage cache_stage(Run& run) const;
        Stage dry_run_stage(Run& run);
        Stage execute_stage(Run& run);
        std::optional<RepairAction> plan_repair(Run& run, sparql::errors::ErrorCode code) const;

        sparql::model::ExecutionResult finish(Run& run) const;
        static Stage fail(Run& run, sparql::errors::ErrorCode code, std::string message, std::string hint);

        RepairContext context_;
        const sparql::endpoint::EndpointRegistry& registry_;
        sparql::transport::ISparqlTransport& transport_;
        RepairPolicy policy_;
        sparql::lint::LintOptions lint_defaults_;
    };
}  // namespace sparql::repair

#endif
