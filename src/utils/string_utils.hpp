#ifndef SPARQL_GUARD_STRING_UTILS_HPP
#define SPARQL_GUARD_STRING_UTILS_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    std::string trim(std::string s);

    std::string to_lower(std::string_view sv);

    // Collapses every whitespace run to a single space and trims both ends.
    std::string collapse_whitespace(std::string_view sv);

    // Byte-truncates; never splits inside a UTF-8 sequence.
    std::string truncate(std::string_view sv, size_t max_bytes);

    // Replaces every byte that does not start a well-formed UTF-8 sequence
    // with U+FFFD. Valid input comes back unchanged.
    std::string sanitize_utf8(std::string_view sv);

    std::string join(const std::vector<std::string>& parts, std::string_view separator);

    std::vector<std::string> split_comma_delimited_string(std::string_view sv);
}  // namespace string_utils

#endif
