#ifndef SPARQL_GUARD_SCHEMA_CONTEXT_HPP
#define SPARQL_GUARD_SCHEMA_CONTEXT_HPP

#include <map>
#include <string>
#include <vector>

#include "interface.hpp"

namespace grounding {
    const int DEFAULT_BUDGET_TOKENS = 2000;
    // Rough ratio used to turn a token budget into characters.
    const int CHARS_PER_TOKEN = 4;
    const size_t DESCRIPTION_LENGTH = 120;
    const size_t MAX_INSTANCE_OF = 3;

    // One line per id, entities first, until the budget runs out. Ids with
    // no record render with label "?".
    [[nodiscard]] SchemaContext render_schema_context(const std::vector<std::string>& entity_ids, const std::vector<std::string>& property_ids,
                                                      const std::map<std::string, EntityRecord>& records, int budget_tokens);
}  // namespace grounding

#endif
