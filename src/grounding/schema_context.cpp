#include "schema_context.hpp"

#include <string>

#include "../utils/string_utils.hpp"

namespace grounding {
    namespace {
        const EntityRecord& record_for(const std::map<std::string, EntityRecord>& records, const std::string& id) {
            static const EntityRecord MISSING{.label_ = "?"};
            auto it = records.find(id);
            return it == records.end() ? MISSING : it->second;
        }

        std::string entity_line(const std::string& id, const EntityRecord& record) {
            std::string line = "  " + id + ": " + record.label_;
            if (!record.description_.empty()) {
                line += " - " + string_utils::truncate(record.description_, DESCRIPTION_LENGTH);
            }
            if (!record.instance_of_.empty()) {
                line += "  [instance of: " + string_utils::join(record.instance_of_, ", ") + "]";
            }
            return line;
        }

        std::string property_line(const std::string& id, const EntityRecord& record) {
            std::string line = "  " + id + ": " + record.label_;
            if (!record.datatype_.empty()) {
                line += "  (datatype: " + record.datatype_ + ")";
            }
            if (!record.description_.empty()) {
                line += " - " + string_utils::truncate(record.description_, DESCRIPTION_LENGTH);
            }
            return line;
        }
    }  // namespace

    SchemaContext render_schema_context(const std::vector<std::string>& entity_ids, const std::vector<std::string>& property_ids,
                                        const std::map<std::string, EntityRecord>& records, int budget_tokens) {
        long char_budget = long(budget_tokens) * CHARS_PER_TOKEN;
        std::vector<std::string> lines;

        for (const auto& id : entity_ids) {
            if (char_budget <= 0) {
                break;
            }
            lines.push_back(entity_line(id, record_for(records, id)));
            char_budget -= long(lines.back().size());
        }

        for (const auto& id : property_ids) {
            if (char_budget <= 0) {
                break;
            }
            lines.push_back(property_line(id, record_for(records, id)));
            char_budget -= long(lines.back().size());
        }

        return SchemaContext{
            .text_ = string_utils::join(lines, "\n"),
            .entity_count_ = entity_ids.size(),
            .property_count_ = property_ids.size(),
        };
    }
}  // namespace grounding
