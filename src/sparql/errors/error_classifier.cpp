#include "error_classifier.hpp"

#include <array>
#include <string>
#include <string_view>

#include "../../utils/string_utils.hpp"

namespace sparql::errors {
    namespace {
        constexpr size_t UNKNOWN_HINT_MESSAGE_LENGTH = 200;

        constexpr std::array<std::string_view, 4> SYNTAX_KEYWORDS = {"parse error", "syntax", "malformed", "lexical error"};
        constexpr std::array<std::string_view, 4> TIMEOUT_KEYWORDS = {"timeout", "timed out", "deadline", "too long"};
        constexpr std::array<std::string_view, 5> RATE_LIMIT_KEYWORDS = {"429", "rate limit", "rate-limit", "too many requests", "throttl"};
        constexpr std::array<std::string_view, 7> ENDPOINT_ERROR_KEYWORDS = {
            "500", "502", "503", "504", "internal server error", "bad gateway", "service unavailable"};

        template <size_t N>
        bool contains_any(std::string_view haystack, const std::array<std::string_view, N>& needles) {
            for (const auto needle : needles) {
                if (haystack.find(needle) != std::string_view::npos) {
                    return true;
                }
            }
            return false;
        }
    }  // namespace

    const char* to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::SYNTAX:
                return "SYNTAX";
            case ErrorCode::TIMEOUT:
                return "TIMEOUT";
            case ErrorCode::RATE_LIMIT:
                return "RATE_LIMIT";
            case ErrorCode::EMPTY:
                return "EMPTY";
            case ErrorCode::ENDPOINT_ERROR:
                return "ENDPOINT_ERROR";
            case ErrorCode::LINTER_BLOCK:
                return "LINTER_BLOCK";
            case ErrorCode::UNKNOWN:
                return "UNKNOWN";
        }
        return "UNKNOWN";
    }

    std::optional<ErrorCode> from_string(std::string_view name) {
        for (const auto code : {ErrorCode::SYNTAX, ErrorCode::TIMEOUT, ErrorCode::RATE_LIMIT, ErrorCode::EMPTY, ErrorCode::ENDPOINT_ERROR,
                                ErrorCode::LINTER_BLOCK, ErrorCode::UNKNOWN}) {
            if (name == to_string(code)) {
                return code;
            }
        }
        return std::nullopt;
    }

    const char* describe(ErrorCode code) {
        switch (code) {
            case ErrorCode::SYNTAX:
                return "Query has a syntax error";
            case ErrorCode::TIMEOUT:
                return "Query execution timed out";
            case ErrorCode::RATE_LIMIT:
                return "Endpoint rate-limited the request (HTTP 429)";
            case ErrorCode::EMPTY:
                return "Query returned zero results";
            case ErrorCode::ENDPOINT_ERROR:
                return "Endpoint returned an HTTP error";
            case ErrorCode::LINTER_BLOCK:
                return "Query was blocked by the safety linter";
            case ErrorCode::UNKNOWN:
                return "Unclassified error";
        }
        return "Unclassified error";
    }

    Classification classify(std::string_view raw_message) {
        const std::string msg = string_utils::to_lower(raw_message);

        if (contains_any(msg, SYNTAX_KEYWORDS)) {
            return {.code_ = ErrorCode::SYNTAX, .hint_ = "Fix the SPARQL syntax and retry."};
        }

        if (contains_any(msg, TIMEOUT_KEYWORDS)) {
            return {.code_ = ErrorCode::TIMEOUT, .hint_ = "Simplify the query or reduce LIMIT."};
        }

        if (contains_any(msg, RATE_LIMIT_KEYWORDS)) {
            return {.code_ = ErrorCode::RATE_LIMIT, .hint_ = "Wait a moment before retrying."};
        }

        if (contains_any(msg, ENDPOINT_ERROR_KEYWORDS)) {
            return {.code_ = ErrorCode::ENDPOINT_ERROR, .hint_ = "The endpoint may be down; retry later."};
        }

        return {.code_ = ErrorCode::UNKNOWN, .hint_ = "Unexpected error: " + string_utils::truncate(raw_message, UNKNOWN_HINT_MESSAGE_LENGTH)};
    }

    bool is_auto_repairable(ErrorCode code) { return code == ErrorCode::TIMEOUT || code == ErrorCode::RATE_LIMIT; }
}  // namespace sparql::errors
