#include "wikidata_provider.hpp"

#include <simdjson.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "../http/error/http_error.hpp"
#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"
#include "schema_context.hpp"

using namespace simdjson;

namespace grounding {
    namespace {
        template <typename T>
        std::string string_or(T&& value, const char* fallback = "") {
            std::string_view out;
            if (value.get_string().get(out) != SUCCESS) {
                return fallback;
            }
            return std::string(out);
        }

        // MediaWiki reports API errors with HTTP 200 and an `error` object.
        [[noreturn]] void throw_api_error(ondemand::document& doc, const http::model::Response& resp, const char* missing) {
            std::string info = string_or(doc["error"]["info"]);
            throw http::http_error::HttpError(resp.status_, resp.effective_url_, resp.body_,
                                              info.empty() ? std::string("Response has no '") + missing + "' member" : "Wikidata API error: " + info);
        }

        http::model::Request base_request(const std::string& api_url, const char* action, long total_ms) {
            http::model::Request req;
            req.url_ = api_url;
            req.method_ = http::model::Method::GET;
            req.fields_ = {{"action", action}, {"format", constants::FORMAT_JSON}};
            req.headers_ = {std::string("Accept: ") + constants::APPLICATION_JSON};
            req.timeouts_.total_ms_ = total_ms;
            return req;
        }

        GroundingError to_grounding_error(const std::exception& e) {
            if (const auto* http_error = dynamic_cast<const http::http_error::HttpError*>(&e)) {
                return GroundingError{
                    .status_ = http_error->status_,
                    .message_ = http_error->body_preview_.empty() ? string_utils::sanitize_utf8(http_error->what()) : http_error->body_preview_};
            }
            return GroundingError{.status_ = 0,
                                  .message_ = string_utils::truncate(string_utils::sanitize_utf8(e.what()), http::http_error::ERROR_MESSAGE_LENGTH)};
        }
    }  // namespace

    WikidataGroundingProvider::WikidataGroundingProvider(std::string api_url, http::client::HttpClientFactory http_client_factory)
        : api_url_(std::move(api_url)), http_client_factory_(std::move(http_client_factory)) {}

    http::model::Request WikidataGroundingProvider::build_search_request(const std::string& api_url, const std::string& text, SearchKind kind, int k) {
        http::model::Request req = base_request(api_url, "wbsearchentities", SEARCH_TIMEOUT_MS);
        req.fields_.emplace_back("language", "en");
        req.fields_.emplace_back("search", text);
        req.fields_.emplace_back("limit", std::to_string(k));
        req.fields_.emplace_back("type", to_string(kind));
        return req;
    }

    std::vector<Candidate> WikidataGroundingProvider::parse_search(const http::model::Response& resp) {
        std::vector<Candidate> out;

        try {
            ondemand::parser parser;
            padded_string json(resp.body_);
            ondemand::document doc = parser.iterate(json);

            auto search = doc["search"].get_array();
            if (search.error() != SUCCESS) {
                throw_api_error(doc, resp, "search");
            }

            for (auto item : search.value()) {
                out.push_back(Candidate{
                    .id_ = string_or(item["id"]),
                    .label_ = string_or(item["label"]),
                    .description_ = string_or(item["description"]),
                    .concept_uri_ = string_or(item["concepturi"]),
                });
            }
        } catch (const simdjson_error& e) {
            throw http::http_error::HttpError(resp.status_, resp.effective_url_, resp.body_,
                                              "Failed to parse JSON response: " + std::string(e.what()));
        }

        return out;
    }

    http::model::Request WikidataGroundingProvider::build_entities_request(const std::string& api_url, const std::vector<std::string>& ids) {
        http::model::Request req = base_request(api_url, "wbgetentities", ENTITIES_TIMEOUT_MS);
        req.fields_.emplace_back("ids", string_utils::join(ids, "|"));
        req.fields_.emplace_back("props", "labels|descriptions|datatype|claims");
        req.fields_.emplace_back("languages", "en");
        return req;
    }

    std::map<std::string, EntityRecord> WikidataGroundingProvider::parse_entities(const http::model::Response& resp) {
        std::map<std::string, EntityRecord> out;

        try {
            ondemand::parser parser;
            padded_string json(resp.body_);
            ondemand::document doc = parser.iterate(json);

            auto entities = doc["entities"].get_object();
            if (entities.error() != SUCCESS) {
                throw_api_error(doc, resp, "entities");
            }

            for (auto field : entities.value()) {
                std::string id(std::string_view(field.unescaped_key()));
                ondemand::object entity = field.value().get_object();

                EntityRecord record{.id_ = id};
                record.label_ = string_or(entity["labels"]["en"]["value"], "?");
                record.description_ = string_or(entity["descriptions"]["en"]["value"]);
                record.datatype_ = string_or(entity["datatype"]);

                auto instance_of = entity["claims"]["P31"].get_array();
                if (instance_of.error() == SUCCESS) {
                    for (auto claim : instance_of.value()) {
                        if (record.instance_of_.size() >= MAX_INSTANCE_OF) {
                            break;
                        }
                        std::string target = string_or(claim["mainsnak"]["datavalue"]["value"]["id"]);
                        if (!target.empty()) {
                            record.instance_of_.push_back(std::move(target));
                        }
                    }
                }

                out.insert_or_assign(id, std::move(record));
            }
        } catch (const simdjson_error& e) {
            throw http::http_error::HttpError(resp.status_, resp.effective_url_, resp.body_,
                                              "Failed to parse JSON response: " + std::string(e.what()));
        }

        return out;
    }

    GroundingLookup WikidataGroundingProvider::search(const std::string& text, SearchKind kind, int k) {
        GroundingLookup lookup{.query_ = text};

        try {
            lookup.candidates_ = parse_search(perform(build_search_request(api_url_, text, kind, k)));
        } catch (const std::exception& e) {
            spdlog::warn("{} search for '{}' failed: {}", to_string(kind), text, e.what());
            lookup.error_ = to_grounding_error(e);
        }

        return lookup;
    }

    EntityBatch WikidataGroundingProvider::fetch_entities(const std::vector<std::string>& ids) {
        EntityBatch batch;

        for (size_t begin = 0; begin < ids.size(); begin += ENTITIES_BATCH_SIZE) {
            const size_t end = std::min(ids.size(), begin + ENTITIES_BATCH_SIZE);
            const std::vector<std::string> chunk(ids.begin() + long(begin), ids.begin() + long(end));

            try {
                auto records = parse_entities(perform(build_entities_request(api_url_, chunk)));
                batch.records_.merge(records);
            } catch (const std::exception& e) {
                spdlog::warn("wbgetentities for {} ids failed: {}", chunk.size(), e.what());
                batch.error_ = to_grounding_error(e);
            }
        }

        return batch;
    }

    http::model::Response WikidataGroundingProvider::perform(const http::model::Request& req) const {
        auto client = http_client_factory_();
        if (client == nullptr) {
            throw std::runtime_error("HTTP client unavailable");
        }

        http::model::Response resp = client->perform(req);
        if (resp.status_ >= constants::HTTP_ERROR_LOWER_BOUNDARY) {
            throw http::http_error::HttpError(resp.status_, resp.effective_url_, resp.body_,
                                              "HTTP request failed with status " + std::to_string(resp.status_));
        }
        return resp;
    }
}  // namespace grounding
