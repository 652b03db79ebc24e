#ifndef SPARQL_GUARD_SPARQL_TEXT_HPP
#define SPARQL_GUARD_SPARQL_TEXT_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace sparql::query {
    struct Span {
        size_t offset_ = 0;
        size_t length_ = 0;

        [[nodiscard]] size_t end() const { return offset_ + length_; }
    };

    struct LimitClause {
        Span digits_;
        long value_ = 0;
    };

    // Scanning primitives. A word char is [A-Za-z0-9_] and a space is any of
    // " \t\n\v\f\r". Scans are iterative; no input length can exhaust the
    // stack.
    [[nodiscard]] bool is_word_char(char c);
    [[nodiscard]] bool is_space(char c);
    [[nodiscard]] size_t skip_spaces(std::string_view text, size_t pos);
    [[nodiscard]] bool at_word_start(std::string_view text, size_t pos);
    [[nodiscard]] bool at_word_end(std::string_view text, size_t pos);

    // Case-insensitive match of `keyword` at `pos`. No boundary checks.
    [[nodiscard]] bool keyword_at(std::string_view text, size_t pos, std::string_view keyword);

    // Replaces the contents of every string literal ("...", '...', """...""",
    // '''...''') with spaces. Quotes and all other bytes stay where they are,
    // so offsets found in the masked text are valid in the original.
    [[nodiscard]] std::string mask_string_literals(std::string_view query);

    // First `LIMIT <digits>` in already-masked text. Values too large for a
    // long saturate to LONG_MAX.
    [[nodiscard]] std::optional<LimitClause> find_limit(std::string_view masked);

    // `SERVICE wikibase:label { ... }` including an optional trailing '.'.
    [[nodiscard]] std::optional<Span> find_label_service(std::string_view masked);

    [[nodiscard]] size_t count_service_clauses(std::string_view masked);
    [[nodiscard]] size_t count_label_service_clauses(std::string_view masked);

    // CONSTRUCT and DESCRIBE do not produce SPARQL JSON results.
    [[nodiscard]] bool is_graph_producing_form(std::string_view masked);
}  // namespace sparql::query

#endif
