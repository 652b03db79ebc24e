#ifndef SPARQL_GUARD_CACHE_KEY_HPP
#define SPARQL_GUARD_CACHE_KEY_HPP

#include <initializer_list>
#include <string>
#include <string_view>

namespace http::cache {
    // Deterministic within a process. Parts are joined with '|' before hashing.
    [[nodiscard]] std::string make_key(std::initializer_list<std::string_view> parts);

    // "SELECT ?x  WHERE" and "SELECT ?x\nWHERE" normalize to the same text.
    [[nodiscard]] std::string normalize_query(std::string_view query);
}  // namespace http::cache

#endif
