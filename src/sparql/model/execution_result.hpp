#ifndef SPARQL_GUARD_EXECUTION_RESULT_HPP
#define SPARQL_GUARD_EXECUTION_RESULT_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../errors/error_classifier.hpp"

namespace sparql::model {
    // variable -> plain value
    using Row = std::map<std::string, std::string>;

    struct ExecutionStats {
        long elapsed_ms_ = 0;
        int attempts_ = 0;
    };

    struct ExecutionResult {
        bool ok_ = false;

        std::vector<Row> rows_;
        size_t row_count_ = 0;
        // ASK queries answer with a boolean instead of rows.
        std::optional<bool> boolean_;

        // Set on failure. On success only EMPTY is ever set.
        std::optional<sparql::errors::ErrorCode> error_code_;
        std::string error_message_;
        std::string hint_;
        std::string advisory_;

        std::vector<std::string> repairs_applied_;
        std::vector<std::string> warnings_;
        std::vector<std::string> lint_errors_;

        bool from_cache_ = false;
        ExecutionStats stats_;

        [[nodiscard]] bool is_empty_success() const { return ok_ && error_code_ == sparql::errors::ErrorCode::EMPTY; }
    };

    [[nodiscard]] nlohmann::json to_json(const ExecutionResult& result);
}  // namespace sparql::model

#endif
