#include "sparql_text.hpp"

#include <cctype>
#include <charconv>
#include <climits>
#include <string>

namespace sparql::query {
    namespace {
        constexpr std::string_view SERVICE_KEYWORD = "SERVICE";
        constexpr std::string_view LABEL_SERVICE_IRI = "wikibase:label";

        // Masks from `start` (just past the opening delimiter) up to the
        // closing delimiter and returns the index just past it.
        size_t mask_until(std::string& out, size_t start, std::string_view delimiter, bool allow_escapes) {
            size_t i = start;
            while (i < out.size()) {
                if (allow_escapes && out[i] == '\\' && i + 1 < out.size()) {
                    out[i] = ' ';
                    out[i + 1] = ' ';
                    i += 2;
                    continue;
                }
                if (out.compare(i, delimiter.size(), delimiter) == 0) {
                    return i + delimiter.size();
                }
                out[i] = ' ';
                ++i;
            }
            return i;
        }

        // `SERVICE <spaces> wikibase:label` at `pos`; returns the index just
        // past the IRI.
        std::optional<size_t> label_service_at(std::string_view text, size_t pos) {
            if (!keyword_at(text, pos, SERVICE_KEYWORD)) {
                return std::nullopt;
            }
            const size_t keyword_end = pos + SERVICE_KEYWORD.size();
            const size_t after_spaces = skip_spaces(text, keyword_end);
            if (after_spaces == keyword_end || !keyword_at(text, after_spaces, LABEL_SERVICE_IRI)) {
                return std::nullopt;
            }
            return after_spaces + LABEL_SERVICE_IRI.size();
        }
    }  // namespace

    bool is_word_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; }

    bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r'; }

    size_t skip_spaces(std::string_view text, size_t pos) {
        while (pos < text.size() && is_space(text[pos])) {
            ++pos;
        }
        return pos;
    }

    bool at_word_start(std::string_view text, size_t pos) { return pos == 0 || !is_word_char(text[pos - 1]); }

    bool at_word_end(std::string_view text, size_t pos) { return pos >= text.size() || !is_word_char(text[pos]); }

    bool keyword_at(std::string_view text, size_t pos, std::string_view keyword) {
        if (pos > text.size() || text.size() - pos < keyword.size()) {
            return false;
        }
        for (size_t k = 0; k < keyword.size(); ++k) {
            if (std::tolower(static_cast<unsigned char>(text[pos + k])) != std::tolower(static_cast<unsigned char>(keyword[k]))) {
                return false;
            }
        }
        return true;
    }

    std::string mask_string_literals(std::string_view query) {
        std::string out(query);
        size_t i = 0;
        while (i < out.size()) {
            const char c = out[i];
            if (c != '"' && c != '\'') {
                ++i;
                continue;
            }

            const std::string triple(3, c);
            if (out.compare(i, 3, triple) == 0) {
                i = mask_until(out, i + 3, triple, true);
            } else {
                i = mask_until(out, i + 1, c == '"' ? "\"" : "'", true);
            }
        }
        return out;
    }

    std::optional<LimitClause> find_limit(std::string_view masked) {
        constexpr std::string_view LIMIT_KEYWORD = "LIMIT";

        for (size_t pos = 0; pos < masked.size(); ++pos) {
            if (!at_word_start(masked, pos) || !keyword_at(masked, pos, LIMIT_KEYWORD)) {
                continue;
            }

            const size_t keyword_end = pos + LIMIT_KEYWORD.size();
            const size_t digits_start = skip_spaces(masked, keyword_end);
            size_t digits_end = digits_start;
            while (digits_end < masked.size() && std::isdigit(static_cast<unsigned char>(masked[digits_end])) != 0) {
                ++digits_end;
            }
            if (digits_start == keyword_end || digits_end == digits_start) {
                continue;
            }

            LimitClause clause;
            clause.digits_ = Span{.offset_ = digits_start, .length_ = digits_end - digits_start};

            const char* first = masked.data() + digits_start;
            const char* last = masked.data() + digits_end;
            const auto [ptr, ec] = std::from_chars(first, last, clause.value_);
            if (ec == std::errc::result_out_of_range) {
                clause.value_ = LONG_MAX;
            } else if (ec != std::errc{} || ptr != last) {
                return std::nullopt;
            }
            return clause;
        }
        return std::nullopt;
    }

    std::optional<Span> find_label_service(std::string_view masked) {
        for (size_t pos = 0; pos < masked.size(); ++pos) {
            const auto iri_end = label_service_at(masked, pos);
            if (!iri_end) {
                continue;
            }

            const size_t open = skip_spaces(masked, *iri_end);
            if (open >= masked.size() || masked[open] != '{') {
                continue;
            }
            const size_t close = masked.find('}', open + 1);
            if (close == std::string_view::npos) {
                continue;
            }

            size_t end = skip_spaces(masked, close + 1);
            if (end < masked.size() && masked[end] == '.') {
                ++end;
            }
            return Span{.offset_ = pos, .length_ = end - pos};
        }
        return std::nullopt;
    }

    size_t count_service_clauses(std::string_view masked) {
        size_t count = 0;
        for (size_t pos = 0; pos < masked.size(); ++pos) {
            if (at_word_start(masked, pos) && keyword_at(masked, pos, SERVICE_KEYWORD) && at_word_end(masked, pos + SERVICE_KEYWORD.size())) {
                ++count;
                pos += SERVICE_KEYWORD.size() - 1;
            }
        }
        return count;
    }

    size_t count_label_service_clauses(std::string_view masked) {
        size_t count = 0;
        size_t pos = 0;
        while (pos < masked.size()) {
            if (const auto iri_end = label_service_at(masked, pos)) {
                ++count;
                pos = *iri_end;
            } else {
                ++pos;
            }
        }
        return count;
    }

    bool is_graph_producing_form(std::string_view masked) {
        for (const std::string_view keyword : {std::string_view("CONSTRUCT"), std::string_view("DESCRIBE")}) {
            for (size_t pos = 0; pos < masked.size(); ++pos) {
                if (at_word_start(masked, pos) && keyword_at(masked, pos, keyword) && at_word_end(masked, pos + keyword.size())) {
                    return true;
                }
            }
        }
        return false;
    }
}  // namespace sparql::query
