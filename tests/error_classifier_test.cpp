#include <gtest/gtest.h>

#include <string>

#include "../src/sparql/errors/error_classifier.hpp"

using sparql::errors::classify;
using sparql::errors::ErrorCode;

TEST(error_classifier, maps_keywords_to_codes) {
    EXPECT_EQ(classify("Parse error: Encountered \" \"}\" \"} \"\" at line 3").code_, ErrorCode::SYNTAX);
    EXPECT_EQ(classify("Lexical error at line 1").code_, ErrorCode::SYNTAX);
    EXPECT_EQ(classify("HTTP 500: java.util.concurrent.TimeoutException").code_, ErrorCode::TIMEOUT);
    EXPECT_EQ(classify("Operation timed out after 30001 milliseconds").code_, ErrorCode::TIMEOUT);
    EXPECT_EQ(classify("HTTP 429: Too Many Requests").code_, ErrorCode::RATE_LIMIT);
    EXPECT_EQ(classify("You are being throttled").code_, ErrorCode::RATE_LIMIT);
    EXPECT_EQ(classify("HTTP 502: Bad Gateway").code_, ErrorCode::ENDPOINT_ERROR);
    EXPECT_EQ(classify("Service Unavailable").code_, ErrorCode::ENDPOINT_ERROR);
}

TEST(error_classifier, syntax_wins_over_later_categories) {
    EXPECT_EQ(classify("HTTP 500: malformed query, request took too long").code_, ErrorCode::SYNTAX);
    EXPECT_EQ(classify("HTTP 429 while waiting: timeout").code_, ErrorCode::TIMEOUT);
}

TEST(error_classifier, unknown_carries_truncated_message) {
    const std::string raw(500, 'x');

    auto classification = classify(raw);

    EXPECT_EQ(classification.code_, ErrorCode::UNKNOWN);
    EXPECT_EQ(classification.hint_, "Unexpected error: " + std::string(200, 'x'));
}

TEST(error_classifier, is_total_on_empty_input) {
    EXPECT_EQ(classify("").code_, ErrorCode::UNKNOWN);
    EXPECT_FALSE(classify("connection refused").hint_.empty());
}

TEST(error_classifier, names_round_trip) {
    for (auto code : {ErrorCode::SYNTAX, ErrorCode::TIMEOUT, ErrorCode::RATE_LIMIT, ErrorCode::EMPTY, ErrorCode::ENDPOINT_ERROR,
                      ErrorCode::LINTER_BLOCK, ErrorCode::UNKNOWN}) {
        auto parsed = sparql::errors::from_string(sparql::errors::to_string(code));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, code);
        EXPECT_NE(std::string(sparql::errors::describe(code)), "");
    }
    EXPECT_FALSE(sparql::errors::from_string("NOPE").has_value());
}

TEST(error_classifier, only_timeout_and_rate_limit_are_repairable) {
    EXPECT_TRUE(sparql::errors::is_auto_repairable(ErrorCode::TIMEOUT));
    EXPECT_TRUE(sparql::errors::is_auto_repairable(ErrorCode::RATE_LIMIT));
    EXPECT_FALSE(sparql::errors::is_auto_repairable(ErrorCode::SYNTAX));
    EXPECT_FALSE(sparql::errors::is_auto_repairable(ErrorCode::ENDPOINT_ERROR));
}
