#ifndef SPARQL_GUARD_WIKIDATA_PROVIDER_HPP
#define SPARQL_GUARD_WIKIDATA_PROVIDER_HPP

#include <map>
#include <string>
#include <vector>

#include "../http/client/interface.hpp"
#include "../http/model/model.hpp"
#include "interface.hpp"

namespace grounding {
    const long SEARCH_TIMEOUT_MS = 15'000;
    const long ENTITIES_TIMEOUT_MS = 20'000;
    // wbgetentities refuses more ids than this per call.
    const size_t ENTITIES_BATCH_SIZE = 50;

    // MediaWiki API client for wbsearchentities and wbgetentities.
    class WikidataGroundingProvider : public IGroundingProvider {
       public:
        WikidataGroundingProvider(std::string api_url, http::client::HttpClientFactory http_client_factory);

        GroundingLookup search(const std::string& text, SearchKind kind, int k) override;
        EntityBatch fetch_entities(const std::vector<std::string>& ids) override;

        [[nodiscard]] static http::model::Request build_search_request(const std::string& api_url, const std::string& text, SearchKind kind, int k);
        [[nodiscard]] static std::vector<Candidate> parse_search(const http::model::Response& resp);

        [[nodiscard]] static http::model::Request build_entities_request(const std::string& api_url, const std::vector<std::string>& ids);
        [[nodiscard]] static std::map<std::string, EntityRecord> parse_entities(const http::model::Response& resp);

       private:
        http::model::Response perform(const http::model::Request& req) const;

        std::string api_url_;
        http::client::HttpClientFactory http_client_factory_;
    };
}  // namespace grounding

#endif
