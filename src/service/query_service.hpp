#ifndef SPARQL_GUARD_QUERY_SERVICE_HPP
#define SPARQL_GUARD_QUERY_SERVICE_HPP

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../grounding/interface.hpp"
#include "../http/client/interface.hpp"
#include "../sparql/endpoint/endpoint_registry.hpp"
#include "../sparql/errors/error_classifier.hpp"
#include "../sparql/lint/linter.hpp"
#include "../sparql/model/execution_result.hpp"
#include "../sparql/repair/orchestrator.hpp"
#include "../sparql/throttle/rate_throttle.hpp"
#include "../sparql/transport/interface.hpp"
#include "../utils/clock.hpp"
#include "execution_context.hpp"

namespace service {
    const long MIN_TIMEOUT_MS = 5'000;
    const long MAX_TIMEOUT_MS = 60'000;
    const long DEFAULT_TIMEOUT_MS = 30'000;
    const long MIN_LIMIT_CAP = 1;
    const long MAX_LIMIT_CAP = 500;
    const int MIN_K = 1;
    const int MAX_K = 20;
    const int DEFAULT_K = 5;
    const long PING_TIMEOUT_MS = 10'000;

    struct QueryRequest {
        std::string endpoint_class_;
        std::string query_;
        long timeout_ms_ = DEFAULT_TIMEOUT_MS;
        long limit_cap_ = sparql::lint::DEFAULT_LIMIT_CAP;
        std::vector<std::string> entity_ids_;
        std::vector<std::string> property_ids_;
    };

    struct PingResult {
        std::string endpoint_class_;
        std::string endpoint_url_;
        bool ok_ = false;
        std::string detail_;
        long elapsed_ms_ = 0;
    };

    struct ServicePolicies {
        CachePolicies caches_;
        sparql::throttle::ThrottlePolicy throttle_;
        sparql::repair::RepairPolicy repair_;
        sparql::lint::LintOptions lint_;
    };

    class QueryServiceBuilder;

    // Entry point for every operation. Safe to call from several threads;
    // failures always come back as result objects.
    class QueryService {
       public:
        // Minted only by QueryServiceBuilder.
        class BuildKey {
           private:
            friend class QueryServiceBuilder;
            BuildKey() = default;
        };

        QueryService(BuildKey key, std::unique_ptr<utils::IClock> clock, sparql::endpoint::EndpointRegistry registry,
                     std::unique_ptr<sparql::transport::ISparqlTransport> transport, std::unique_ptr<grounding::IGroundingProvider> grounding,
                     const ServicePolicies& policies);

        ~QueryService() = default;
        QueryService(const QueryService&) = delete;
        QueryService& operator=(const QueryService&) = delete;
        QueryService(QueryService&&) = delete;
        QueryService& operator=(QueryService&&) = delete;

        sparql::model::ExecutionResult execute_query(const QueryRequest& request);

        grounding::GroundingLookup lookup_entities(const std::string& text, int k = DEFAULT_K);
        grounding::GroundingLookup lookup_properties(const std::string& text, int k = DEFAULT_K);
        grounding::SchemaContext schema_context(const std::vector<std::string>& entity_ids, const std::vector<std::string>& property_ids,
                                                int budget_tokens);

        [[nodiscard]] sparql::errors::Classification normalize_error(const std::string& raw_message) const;

        PingResult ping(const std::string& endpoint_class);

        [[nodiscard]] const sparql::endpoint::EndpointRegistry& endpoints() const { return registry_; }
        [[nodiscard]] ExecutionContext& context() { return context_; }

       private:
        grounding::GroundingLookup lookup(const std::string& text, int k, grounding::SearchKind kind,
                                          http::cache::TtlCache<grounding::GroundingLookup>& cache);

        std::unique_ptr<utils::IClock> clock_;
        sparql::endpoint::EndpointRegistry registry_;
        std::unique_ptr<sparql::transport::ISparqlTransport> transport_;
        std::unique_ptr<grounding::IGroundingProvider> grounding_;
        ExecutionContext context_;
        sparql::repair::Orchestrator orchestrator_;
    };

    class QueryServiceBuilder {
       public:
        QueryServiceBuilder& with_http_client_factory(http::client::HttpClientFactory http_client_factory);
        QueryServiceBuilder& with_transport(std::unique_ptr<sparql::transport::ISparqlTransport> transport);
        QueryServiceBuilder& with_endpoint(sparql::endpoint::EndpointClass endpoint_class);
        QueryServiceBuilder& with_grounding_api(std::string api_url);
        QueryServiceBuilder& with_grounding_provider(std::unique_ptr<grounding::IGroundingProvider> provider);
        QueryServiceBuilder& with_clock(std::unique_ptr<utils::IClock> clock);
        QueryServiceBuilder& with_policies(const ServicePolicies& policies);
        QueryServiceBuilder& validate();
        std::unique_ptr<QueryService> build();

       private:
        http::client::HttpClientFactory http_client_factory_;
        std::unique_ptr<sparql::transport::ISparqlTransport> transport_;
        sparql::endpoint::EndpointRegistry registry_;
        std::string grounding_api_url_;
        std::unique_ptr<grounding::IGroundingProvider> grounding_;
        std::unique_ptr<utils::IClock> clock_;
        ServicePolicies policies_;
    };

    [[nodiscard]] nlohmann::json to_json(const sparql::errors::Classification& classification);
    [[nodiscard]] nlohmann::json to_json(const PingResult& ping);
}  // namespace service

#endif
