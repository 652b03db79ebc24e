#ifndef SPARQL_GUARD_GROUNDING_INTERFACE_HPP
#define SPARQL_GUARD_GROUNDING_INTERFACE_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace grounding {
    enum class SearchKind { ITEM, PROPERTY };

    [[nodiscard]] const char* to_string(SearchKind kind);

    struct Candidate {
        std::string id_;
        std::string label_;
        std::string description_;
        // Empty for properties.
        std::string concept_uri_;
    };

    struct GroundingError {
        long status_ = 0;
        std::string message_;
    };

    struct GroundingLookup {
        std::string query_;
        std::vector<Candidate> candidates_;
        std::optional<GroundingError> error_;

        [[nodiscard]] bool ok() const { return !error_.has_value(); }
    };

    struct EntityRecord {
        std::string id_;
        std::string label_;
        std::string description_;
        // Properties only.
        std::string datatype_;
        // First few `instance of` targets, items only.
        std::vector<std::string> instance_of_;
    };

    struct EntityBatch {
        std::map<std::string, EntityRecord> records_;
        // Last failed chunk, if any. Records from other chunks are kept.
        std::optional<GroundingError> error_;
    };

    struct SchemaContext {
        std::string text_;
        size_t entity_count_ = 0;
        size_t property_count_ = 0;
        std::optional<GroundingError> error_;
    };

    // Black-box label search and metadata source. Implementations never
    // throw; failures are reported through error_.
    class IGroundingProvider {
       public:
        IGroundingProvider() = default;
        virtual ~IGroundingProvider() = default;
        IGroundingProvider(const IGroundingProvider&) = delete;
        IGroundingProvider& operator=(const IGroundingProvider&) = delete;
        IGroundingProvider(IGroundingProvider&&) = delete;
        IGroundingProvider& operator=(IGroundingProvider&&) = delete;

        virtual GroundingLookup search(const std::string& text, SearchKind kind, int k) = 0;
        virtual EntityBatch fetch_entities(const std::vector<std::string>& ids) = 0;
    };

    [[nodiscard]] nlohmann::json to_json(const GroundingError& error);
    [[nodiscard]] nlohmann::json to_json(const GroundingLookup& lookup);
    [[nodiscard]] nlohmann::json to_json(const SchemaContext& context);
}  // namespace grounding

#endif
