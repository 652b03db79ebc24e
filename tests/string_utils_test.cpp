#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../src/utils/string_utils.hpp"

TEST(string_utils, trim_and_lower) {
    EXPECT_EQ(string_utils::trim("  \tSELECT ?x \n"), "SELECT ?x");
    EXPECT_EQ(string_utils::trim("   "), "");
    EXPECT_EQ(string_utils::to_lower("Too Many Requests"), "too many requests");
}

TEST(string_utils, collapse_whitespace) {
    EXPECT_EQ(string_utils::collapse_whitespace("  SELECT\n\t?x   WHERE {}\n"), "SELECT ?x WHERE {}");
    EXPECT_EQ(string_utils::collapse_whitespace(""), "");
}

TEST(string_utils, truncate_respects_utf8) {
    EXPECT_EQ(string_utils::truncate("abcdef", 3), "abc");
    EXPECT_EQ(string_utils::truncate("abc", 10), "abc");
    // "é" is two bytes; cutting after its first byte backs off to before it.
    EXPECT_EQ(string_utils::truncate("ab\xC3\xA9z", 3), "ab");
}

TEST(string_utils, join_and_split) {
    EXPECT_EQ(string_utils::join({"Q1", "Q2", "Q3"}, "|"), "Q1|Q2|Q3");
    EXPECT_EQ(string_utils::join({}, ", "), "");

    auto ids = string_utils::split_comma_delimited_string(" Q42 ,Q5,, P31 ");
    EXPECT_EQ(ids, (std::vector<std::string>{"Q42", "Q5", "P31"}));
}

TEST(string_utils, write_to_string_appends) {
    std::string body = "ab";
    const char chunk[] = "cdef";

    EXPECT_EQ(string_utils::write_to_string(chunk, 1, 4, &body), 4U);
    EXPECT_EQ(body, "abcdef");
}

TEST(string_utils, sanitize_utf8_keeps_valid_text) {
    const std::string text = "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80 plain";

    EXPECT_EQ(string_utils::sanitize_utf8(text), text);
    EXPECT_EQ(string_utils::sanitize_utf8(""), "");
}

TEST(string_utils, sanitize_utf8_replaces_ill_formed_bytes) {
    // Latin-1 "é" is the lone byte 0xE9.
    EXPECT_EQ(string_utils::sanitize_utf8("r\xE9sum\xE9"), "r\xEF\xBF\xBDsum\xEF\xBF\xBD");
    EXPECT_EQ(string_utils::sanitize_utf8("a\x80" "b"), "a\xEF\xBF\xBD" "b");
    EXPECT_EQ(string_utils::sanitize_utf8("\xE2\x82"), "\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(string_utils, sanitize_utf8_rejects_overlong_and_surrogate_forms) {
    EXPECT_EQ(string_utils::sanitize_utf8("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(string_utils::sanitize_utf8("\xED\xA0\x80"), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(string_utils::sanitize_utf8("\xF4\x90\x80\x80"), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}
