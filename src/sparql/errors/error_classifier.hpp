#ifndef SPARQL_GUARD_ERROR_CLASSIFIER_HPP
#define SPARQL_GUARD_ERROR_CLASSIFIER_HPP

#include <optional>
#include <string>
#include <string_view>

namespace sparql::errors {
    enum class ErrorCode { SYNTAX, TIMEOUT, RATE_LIMIT, EMPTY, ENDPOINT_ERROR, LINTER_BLOCK, UNKNOWN };

    struct Classification {
        ErrorCode code_;
        std::string hint_;
    };

    [[nodiscard]] const char* to_string(ErrorCode code);
    [[nodiscard]] std::optional<ErrorCode> from_string(std::string_view name);

    // One-line meaning of the code, suitable for a tool description.
    [[nodiscard]] const char* describe(ErrorCode code);

    // Total: every input maps to exactly one code. Never throws.
    [[nodiscard]] Classification classify(std::string_view raw_message);

    // Only TIMEOUT and RATE_LIMIT can be fixed by retrying inside one request.
    [[nodiscard]] bool is_auto_repairable(ErrorCode code);
}  // namespace sparql::errors

#endif
