#include "execution_result.hpp"

#include <nlohmann/json.hpp>

namespace sparql::model {
    nlohmann::json to_json(const ExecutionResult& result) {
        nlohmann::json j;
        j["ok"] = result.ok_;

        if (result.ok_) {
            j["rows"] = result.rows_;
            j["row_count"] = result.row_count_;
            if (result.boolean_) {
                j["boolean"] = *result.boolean_;
            }
            if (!result.advisory_.empty()) {
                j["warning"] = result.advisory_;
            }
        } else {
            j["error_message"] = result.error_message_;
            j["hint"] = result.hint_;
        }

        if (result.error_code_) {
            j["error_code"] = sparql::errors::to_string(*result.error_code_);
        }
        if (!result.lint_errors_.empty()) {
            j["lint_errors"] = result.lint_errors_;
        }

        j["repairs"] = result.repairs_applied_;
        j["lint_warnings"] = result.warnings_;
        j["from_cache"] = result.from_cache_;
        j["stats"] = {
            {"elapsed_ms", result.stats_.elapsed_ms_},
            {"row_count", result.row_count_},
            {"attempts", result.stats_.attempts_},
        };
        return j;
    }
}  // namespace sparql::model
