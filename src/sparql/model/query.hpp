#ifndef SPARQL_GUARD_QUERY_HPP
#define SPARQL_GUARD_QUERY_HPP

#include <set>
#include <string>

namespace sparql::model {
    struct Query {
        std::string endpoint_class_;
        std::string text_;
    };

    // Identifiers the caller already validated with the grounding lookups.
    struct GroundingSets {
        std::set<std::string> entity_ids_;
        std::set<std::string> property_ids_;
    };
}  // namespace sparql::model

#endif
