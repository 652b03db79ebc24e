#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "../src/grounding/schema_context.hpp"
#include "../src/grounding/wikidata_provider.hpp"
#include "../src/http/error/http_error.hpp"
#include "fakes.hpp"

using grounding::SearchKind;
using grounding::WikidataGroundingProvider;

namespace {
    const std::string API_URL = "https://www.wikidata.org/w/api.php";

    std::string field(const http::model::Request& req, const std::string& name) {
        auto it = std::ranges::find_if(req.fields_, [&name](const http::model::Field& f) { return f.first == name; });
        return it == req.fields_.end() ? std::string() : it->second;
    }

    http::model::Response json_response(std::string body, long status = 200) {
        return http::model::Response{.status_ = status, .body_ = std::move(body), .effective_url_ = API_URL, .content_type_ = "application/json"};
    }

    const char* const SEARCH_BODY = R"({
        "searchinfo": {"search": "douglas adams"},
        "search": [
            {"id": "Q42", "label": "Douglas Adams", "description": "English science fiction writer",
             "concepturi": "http://www.wikidata.org/entity/Q42"},
            {"id": "Q28421831", "label": "Douglas Adams"}
        ],
        "success": 1
    })";

    const char* const ENTITIES_BODY = R"({
        "entities": {
            "Q42": {
                "id": "Q42",
                "labels": {"en": {"language": "en", "value": "Douglas Adams"}},
                "descriptions": {"en": {"language": "en", "value": "English writer and humorist"}},
                "claims": {"P31": [
                    {"mainsnak": {"datavalue": {"value": {"id": "Q5"}}}},
                    {"mainsnak": {"snaktype": "novalue"}}
                ]}
            },
            "P31": {
                "id": "P31",
                "datatype": "wikibase-item",
                "labels": {"en": {"language": "en", "value": "instance of"}},
                "descriptions": {},
                "claims": {}
            },
            "Q7": {"id": "Q7", "labels": {}, "descriptions": {}}
        },
        "success": 1
    })";
}  // namespace

TEST(wikidata_provider, search_request_shape) {
    auto req = WikidataGroundingProvider::build_search_request(API_URL, "instance of", SearchKind::PROPERTY, 7);

    EXPECT_EQ(req.url_, API_URL);
    EXPECT_EQ(req.method_, http::model::Method::GET);
    EXPECT_EQ(field(req, "action"), "wbsearchentities");
    EXPECT_EQ(field(req, "format"), "json");
    EXPECT_EQ(field(req, "language"), "en");
    EXPECT_EQ(field(req, "search"), "instance of");
    EXPECT_EQ(field(req, "limit"), "7");
    EXPECT_EQ(field(req, "type"), "property");
    EXPECT_EQ(req.timeouts_.total_ms_, grounding::SEARCH_TIMEOUT_MS);
}

TEST(wikidata_provider, parses_search_candidates) {
    auto candidates = WikidataGroundingProvider::parse_search(json_response(SEARCH_BODY));

    ASSERT_EQ(candidates.size(), 2U);
    EXPECT_EQ(candidates[0].id_, "Q42");
    EXPECT_EQ(candidates[0].description_, "English science fiction writer");
    EXPECT_EQ(candidates[0].concept_uri_, "http://www.wikidata.org/entity/Q42");
    EXPECT_EQ(candidates[1].id_, "Q28421831");
    EXPECT_TRUE(candidates[1].description_.empty());
}

TEST(wikidata_provider, api_error_object_becomes_http_error) {
    auto resp = json_response(R"({"error": {"code": "badvalue", "info": "Unrecognized value for parameter \"type\""}})");

    EXPECT_THROW(WikidataGroundingProvider::parse_search(resp), http::http_error::HttpError);
}

TEST(wikidata_provider, malformed_json_becomes_http_error) {
    EXPECT_THROW(WikidataGroundingProvider::parse_search(json_response("<html>")), http::http_error::HttpError);
}

TEST(wikidata_provider, parses_entity_records) {
    auto records = WikidataGroundingProvider::parse_entities(json_response(ENTITIES_BODY));

    ASSERT_EQ(records.size(), 3U);

    const auto& adams = records.at("Q42");
    EXPECT_EQ(adams.label_, "Douglas Adams");
    EXPECT_EQ(adams.description_, "English writer and humorist");
    ASSERT_EQ(adams.instance_of_.size(), 1U);
    EXPECT_EQ(adams.instance_of_[0], "Q5");

    const auto& instance_of = records.at("P31");
    EXPECT_EQ(instance_of.datatype_, "wikibase-item");
    EXPECT_TRUE(instance_of.description_.empty());

    EXPECT_EQ(records.at("Q7").label_, "?");
}

TEST(wikidata_provider, search_reports_http_failures_without_throwing) {
    auto script = std::make_shared<fakes::HttpScript>();
    script->respond(503, "maxlag", "text/plain");
    WikidataGroundingProvider provider(API_URL, fakes::factory_for(script));

    auto lookup = provider.search("adams", SearchKind::ITEM, 5);

    ASSERT_FALSE(lookup.ok());
    EXPECT_EQ(lookup.query_, "adams");
    EXPECT_EQ(lookup.error_->status_, 503);
    EXPECT_TRUE(lookup.candidates_.empty());
}

TEST(wikidata_provider, latin1_error_preview_is_made_valid_utf8) {
    auto script = std::make_shared<fakes::HttpScript>();
    script->respond(503, "Serveur indisponible, r\xe9" "essayez", "text/plain");
    WikidataGroundingProvider provider(API_URL, fakes::factory_for(script));

    auto lookup = provider.search("adams", SearchKind::ITEM, 5);

    ASSERT_FALSE(lookup.ok());
    EXPECT_EQ(lookup.error_->message_, "Serveur indisponible, r\xEF\xBF\xBD" "essayez");
    EXPECT_NO_THROW({ (void)grounding::to_json(lookup).dump(); });
}

TEST(wikidata_provider, search_reports_transport_failures) {
    auto script = std::make_shared<fakes::HttpScript>();
    script->fail_transport("Could not resolve host");
    WikidataGroundingProvider provider(API_URL, fakes::factory_for(script));

    auto lookup = provider.search("adams", SearchKind::ITEM, 5);

    ASSERT_FALSE(lookup.ok());
    EXPECT_EQ(lookup.error_->status_, 0);
    EXPECT_EQ(lookup.error_->message_, "Could not resolve host");
}

TEST(wikidata_provider, search_success_goes_through_client) {
    auto script = std::make_shared<fakes::HttpScript>();
    script->respond(200, SEARCH_BODY, "application/json");
    WikidataGroundingProvider provider(API_URL, fakes::factory_for(script));

    auto lookup = provider.search("douglas adams", SearchKind::ITEM, 2);

    ASSERT_TRUE(lookup.ok());
    EXPECT_EQ(lookup.candidates_.size(), 2U);
    ASSERT_EQ(script->request_count(), 1U);
    EXPECT_EQ(field(script->requests_[0], "type"), "item");
}

TEST(wikidata_provider, fetch_entities_batches_large_id_lists) {
    auto script = std::make_shared<fakes::HttpScript>();
    script->respond(200, ENTITIES_BODY, "application/json");
    script->respond(200, R"({"entities": {"Q99": {"id": "Q99", "labels": {"en": {"value": "ninety-nine"}}}}})", "application/json");
    WikidataGroundingProvider provider(API_URL, fakes::factory_for(script));

    std::vector<std::string> ids;
    for (int i = 1; i <= 60; ++i) {
        ids.push_back("Q" + std::to_string(i));
    }

    auto batch = provider.fetch_entities(ids);

    EXPECT_FALSE(batch.error_.has_value());
    ASSERT_EQ(script->request_count(), 2U);
    EXPECT_EQ(field(script->requests_[0], "ids").rfind("Q1|Q2|", 0), 0U);
    EXPECT_EQ(field(script->requests_[1], "ids").rfind("Q51|", 0), 0U);
    EXPECT_EQ(field(script->requests_[0], "props"), "labels|descriptions|datatype|claims");
    EXPECT_EQ(batch.records_.size(), 4U);
    EXPECT_EQ(batch.records_.at("Q99").label_, "ninety-nine");
}

TEST(wikidata_provider, failed_chunk_keeps_other_records) {
    auto script = std::make_shared<fakes::HttpScript>();
    script->respond(200, ENTITIES_BODY, "application/json");
    script->respond(502, "Bad Gateway", "text/html");
    WikidataGroundingProvider provider(API_URL, fakes::factory_for(script));

    std::vector<std::string> ids(51, "Q42");
    auto batch = provider.fetch_entities(ids);

    ASSERT_TRUE(batch.error_.has_value());
    EXPECT_EQ(batch.error_->status_, 502);
    EXPECT_TRUE(batch.records_.contains("Q42"));
}

TEST(schema_context, renders_entities_then_properties) {
    std::map<std::string, grounding::EntityRecord> records{
        {"Q42", {.id_ = "Q42", .label_ = "Douglas Adams", .description_ = "English writer", .instance_of_ = {"Q5", "Q36180"}}},
        {"P50", {.id_ = "P50", .label_ = "author", .description_ = "main creator of a work", .datatype_ = "wikibase-item"}},
    };

    auto schema = grounding::render_schema_context({"Q42"}, {"P50"}, records, grounding::DEFAULT_BUDGET_TOKENS);

    EXPECT_EQ(schema.text_,
              "  Q42: Douglas Adams - English writer  [instance of: Q5, Q36180]\n"
              "  P50: author  (datatype: wikibase-item) - main creator of a work");
    EXPECT_EQ(schema.entity_count_, 1U);
    EXPECT_EQ(schema.property_count_, 1U);
    EXPECT_FALSE(schema.error_.has_value());
}

TEST(schema_context, missing_records_render_as_unknown) {
    auto schema = grounding::render_schema_context({"Q404"}, {}, {}, 100);

    EXPECT_EQ(schema.text_, "  Q404: ?");
}

TEST(schema_context, long_descriptions_are_truncated) {
    std::map<std::string, grounding::EntityRecord> records{{"Q1", {.id_ = "Q1", .label_ = "universe", .description_ = std::string(400, 'd')}}};

    auto schema = grounding::render_schema_context({"Q1"}, {}, records, 1000);

    EXPECT_EQ(schema.text_, "  Q1: universe - " + std::string(grounding::DESCRIPTION_LENGTH, 'd'));
}

TEST(schema_context, stops_when_budget_is_spent) {
    std::vector<std::string> ids;
    for (int i = 0; i < 40; ++i) {
        ids.push_back("Q" + std::to_string(1000 + i));
    }

    // 2 tokens = 8 chars; the first line alone is longer than that.
    auto schema = grounding::render_schema_context(ids, {"P31"}, {}, 2);

    EXPECT_EQ(schema.text_, "  Q1000: ?");
    EXPECT_EQ(schema.entity_count_, 40U);
    EXPECT_EQ(schema.property_count_, 1U);
}

TEST(grounding_json, lookup_and_error_shapes) {
    grounding::GroundingLookup ok{.query_ = "adams",
                                  .candidates_ = {{.id_ = "P50", .label_ = "author", .description_ = "creator"}}};
    grounding::GroundingLookup failed{.query_ = "adams", .error_ = grounding::GroundingError{.status_ = 503, .message_ = "down"}};

    auto ok_json = grounding::to_json(ok);
    auto failed_json = grounding::to_json(failed);

    EXPECT_EQ(ok_json["query"].get<std::string>(), "adams");
    ASSERT_EQ(ok_json["candidates"].size(), 1U);
    EXPECT_FALSE(ok_json["candidates"][0].contains("concepturi"));
    EXPECT_EQ(failed_json["error"]["status_code"].get<long>(), 503);
    EXPECT_EQ(failed_json["error"]["message"].get<std::string>(), "down");
    EXPECT_FALSE(failed_json.contains("candidates"));
}

TEST(grounding_json, schema_shape) {
    grounding::SchemaContext schema{.text_ = "  Q1: universe", .entity_count_ = 1, .property_count_ = 0};

    auto j = grounding::to_json(schema);

    EXPECT_EQ(j["schema"].get<std::string>(), "  Q1: universe");
    EXPECT_EQ(j["entity_count"].get<size_t>(), 1U);
    EXPECT_EQ(j["property_count"].get<size_t>(), 0U);
}
