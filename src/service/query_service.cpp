#include "query_service.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

#include "../grounding/schema_context.hpp"
#include "../grounding/wikidata_provider.hpp"
#include "../http/cache/cache_key.hpp"
#include "../sparql/transport/sparql_executor.hpp"
#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"

namespace service {

    //
    // QueryServiceBuilder implementation
    //

    QueryServiceBuilder& QueryServiceBuilder::with_http_client_factory(http::client::HttpClientFactory http_client_factory) {
        http_client_factory_ = std::move(http_client_factory);
        return *this;
    }

    QueryServiceBuilder& QueryServiceBuilder::with_transport(std::unique_ptr<sparql::transport::ISparqlTransport> transport) {
        transport_ = std::move(transport);
        return *this;
    }

    QueryServiceBuilder& QueryServiceBuilder::with_endpoint(sparql::endpoint::EndpointClass endpoint_class) {
        registry_.add(std::move(endpoint_class));
        return *this;
    }

    QueryServiceBuilder& QueryServiceBuilder::with_grounding_api(std::string api_url) {
        grounding_api_url_ = std::move(api_url);
        return *this;
    }

    QueryServiceBuilder& QueryServiceBuilder::with_grounding_provider(std::unique_ptr<grounding::IGroundingProvider> provider) {
        grounding_ = std::move(provider);
        return *this;
    }

    QueryServiceBuilder& QueryServiceBuilder::with_clock(std::unique_ptr<utils::IClock> clock) {
        clock_ = std::move(clock);
        return *this;
    }

    QueryServiceBuilder& QueryServiceBuilder::with_policies(const ServicePolicies& policies) {
        policies_ = policies;
        return *this;
    }

    QueryServiceBuilder& QueryServiceBuilder::validate() {
        if (transport_ == nullptr && http_client_factory_ == nullptr) {
            throw std::runtime_error("HTTP client is required");
        }
        if (registry_.names().empty()) {
            throw std::runtime_error("At least one endpoint class is required");
        }
        if (grounding_ == nullptr && !grounding_api_url_.empty() && http_client_factory_ == nullptr) {
            throw std::runtime_error("Grounding API needs an HTTP client");
        }
        if (policies_.repair_.max_repairs_ < 0) {
            throw std::runtime_error("Repair budget cannot be negative");
        }
        if (policies_.throttle_.max_consecutive_hits_ < 0 || policies_.throttle_.max_consecutive_hits_ > sparql::throttle::MAX_BACKOFF_EXPONENT) {
            throw std::runtime_error("Throttle hit cap must be between 0 and " + std::to_string(sparql::throttle::MAX_BACKOFF_EXPONENT));
        }
        if (policies_.repair_.max_query_bytes_ == 0) {
            throw std::runtime_error("Maximum query length must be positive");
        }
        return *this;
    }

    std::unique_ptr<QueryService> QueryServiceBuilder::build() {
        if (transport_ == nullptr) {
            transport_ = std::make_unique<sparql::transport::SparqlExecutor>(http_client_factory_);
        }
        if (grounding_ == nullptr && !grounding_api_url_.empty()) {
            grounding_ = std::make_unique<grounding::WikidataGroundingProvider>(grounding_api_url_, http_client_factory_);
        }
        if (clock_ == nullptr) {
            clock_ = std::make_unique<utils::SystemClock>();
        }

        return std::make_unique<QueryService>(QueryService::BuildKey{}, std::move(clock_), std::move(registry_), std::move(transport_),
                                              std::move(grounding_), policies_);
    }

    //
    // QueryService implementation
    //

    QueryService::QueryService(BuildKey /*key*/, std::unique_ptr<utils::IClock> clock, sparql::endpoint::EndpointRegistry registry,
                               std::unique_ptr<sparql::transport::ISparqlTransport> transport, std::unique_ptr<grounding::IGroundingProvider> grounding,
                               const ServicePolicies& policies)
        : clock_(std::move(clock)),
          registry_(std::move(registry)),
          transport_(std::move(transport)),
          grounding_(std::move(grounding)),
          context_(*clock_, policies.caches_, policies.throttle_),
          orchestrator_(context_.repair_context(), registry_, *transport_, policies.repair_, policies.lint_) {}

    sparql::model::ExecutionResult QueryService::execute_query(const QueryRequest& request) {
        const long timeout_ms = std::clamp(request.timeout_ms_, MIN_TIMEOUT_MS, MAX_TIMEOUT_MS);
        const long limit_cap = std::clamp(request.limit_cap_, MIN_LIMIT_CAP, MAX_LIMIT_CAP);

        sparql::model::GroundingSets grounding_sets{
            .entity_ids_ = std::set<std::string>(request.entity_ids_.begin(), request.entity_ids_.end()),
            .property_ids_ = std::set<std::string>(request.property_ids_.begin(), request.property_ids_.end()),
        };

        return orchestrator_.run(sparql::model::Query{.endpoint_class_ = request.endpoint_class_, .text_ = request.query_}, grounding_sets,
                                 std::chrono::milliseconds(timeout_ms), limit_cap);
    }

    grounding::GroundingLookup QueryService::lookup_entities(const std::string& text, int k) {
        return lookup(text, k, grounding::SearchKind::ITEM, context_.entity_cache());
    }

    grounding::GroundingLookup QueryService::lookup_properties(const std::string& text, int k) {
        return lookup(text, k, grounding::SearchKind::PROPERTY, context_.property_cache());
    }

    grounding::GroundingLookup QueryService::lookup(const std::string& text, int k, grounding::SearchKind kind,
                                                    http::cache::TtlCache<grounding::GroundingLookup>& cache) {
        const std::string search = string_utils::trim(text);
        if (search.empty()) {
            return grounding::GroundingLookup{.error_ = grounding::GroundingError{.message_ = "Provide search text."}};
        }
        if (grounding_ == nullptr) {
            return grounding::GroundingLookup{.query_ = search, .error_ = grounding::GroundingError{.message_ = "No grounding provider configured."}};
        }

        const int clamped_k = std::clamp(k, MIN_K, MAX_K);
        const std::string key = http::cache::make_key({grounding::to_string(kind), string_utils::to_lower(search), std::to_string(clamped_k)});

        if (auto cached = cache.get(key)) {
            spdlog::info("{} search for '{}' served from cache", grounding::to_string(kind), search);
            return *cached;
        }

        auto result = grounding_->search(search, kind, clamped_k);
        if (result.ok()) {
            cache.set(key, result);
        }
        return result;
    }

    grounding::SchemaContext QueryService::schema_context(const std::vector<std::string>& entity_ids, const std::vector<std::string>& property_ids,
                                                          int budget_tokens) {
        std::vector<std::string> all_ids = entity_ids;
        all_ids.insert(all_ids.end(), property_ids.begin(), property_ids.end());

        if (all_ids.empty()) {
            return grounding::SchemaContext{.error_ = grounding::GroundingError{.message_ = "Provide at least one entity_id or property_id."}};
        }
        if (grounding_ == nullptr) {
            return grounding::SchemaContext{.error_ = grounding::GroundingError{.message_ = "No grounding provider configured."}};
        }

        std::vector<std::string> sorted_ids = all_ids;
        std::ranges::sort(sorted_ids);
        const std::string ids = string_utils::join(sorted_ids, "|");
        const std::string budget = std::to_string(budget_tokens);
        const std::string key = http::cache::make_key({"schema", ids, budget});

        if (auto cached = context_.schema_cache().get(key)) {
            return *cached;
        }

        auto batch = grounding_->fetch_entities(all_ids);
        if (batch.records_.empty() && batch.error_) {
            return grounding::SchemaContext{.error_ = batch.error_};
        }

        auto schema = grounding::render_schema_context(entity_ids, property_ids, batch.records_, budget_tokens);
        // A partial fetch would pin "?" labels for the whole TTL.
        if (!batch.error_) {
            context_.schema_cache().set(key, schema);
        }
        return schema;
    }

    sparql::errors::Classification QueryService::normalize_error(const std::string& raw_message) const { return sparql::errors::classify(raw_message); }

    PingResult QueryService::ping(const std::string& endpoint_class) {
        PingResult out{.endpoint_class_ = endpoint_class};

        auto endpoint = registry_.find(endpoint_class);
        if (!endpoint) {
            out.detail_ = "Unknown endpoint class '" + endpoint_class + "'.";
            return out;
        }

        out.endpoint_url_ = endpoint->sparql_url_;
        const auto started_at = clock_->now();
        auto result = orchestrator_.execute_throttled(*endpoint, constants::PING_QUERY, std::chrono::milliseconds(PING_TIMEOUT_MS));
        out.elapsed_ms_ = utils::elapsed_ms(*clock_, started_at);
        out.ok_ = result.ok();
        out.detail_ = result.ok() ? "Connected successfully." : result.error_->message();
        return out;
    }

    nlohmann::json to_json(const sparql::errors::Classification& classification) {
        return {{"code", sparql::errors::to_string(classification.code_)}, {"hint", classification.hint_}};
    }

    nlohmann::json to_json(const PingResult& ping) {
        return {
            {"endpoint_class", ping.endpoint_class_}, {"endpoint", ping.endpoint_url_}, {"ok", ping.ok_},
            {"detail", ping.detail_},                 {"elapsed_ms", ping.elapsed_ms_},
        };
    }
}  // namespace service
