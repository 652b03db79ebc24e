#include <nlohmann/json.hpp>

#include "interface.hpp"

namespace grounding {
    const char* to_string(SearchKind kind) {
        switch (kind) {
            case SearchKind::ITEM:
                return "item";
            case SearchKind::PROPERTY:
                return "property";
        }
        return "item";
    }

    nlohmann::json to_json(const GroundingError& error) { return {{"status_code", error.status_}, {"message", error.message_}}; }

    nlohmann::json to_json(const GroundingLookup& lookup) {
        nlohmann::json j;
        if (lookup.error_) {
            j["error"] = to_json(*lookup.error_);
            return j;
        }

        j["query"] = lookup.query_;
        j["candidates"] = nlohmann::json::array();
        for (const auto& candidate : lookup.candidates_) {
            nlohmann::json c = {{"id", candidate.id_}, {"label", candidate.label_}, {"description", candidate.description_}};
            if (!candidate.concept_uri_.empty()) {
                c["concepturi"] = candidate.concept_uri_;
            }
            j["candidates"].push_back(std::move(c));
        }
        return j;
    }

    nlohmann::json to_json(const SchemaContext& context) {
        nlohmann::json j;
        if (context.error_) {
            j["error"] = to_json(*context.error_);
            return j;
        }

        j["schema"] = context.text_;
        j["entity_count"] = context.entity_count_;
        j["property_count"] = context.property_count_;
        return j;
    }
}  // namespace grounding
