#include "linter.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <initializer_list>
#include <regex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "../../utils/string_utils.hpp"
#include "../query/rewritable_query.hpp"
#include "../query/sparql_text.hpp"

namespace sparql::lint {
    namespace {
        using sparql::query::at_word_end;
        using sparql::query::at_word_start;
        using sparql::query::is_space;
        using sparql::query::is_word_char;
        using sparql::query::keyword_at;
        using sparql::query::skip_spaces;

        // FROM NAMED, FROM <iri> or GRAPH followed by a variable or an IRI.
        bool has_blocked_scope(std::string_view text) {
            constexpr std::string_view FROM = "FROM";
            constexpr std::string_view NAMED = "NAMED";
            constexpr std::string_view GRAPH = "GRAPH";

            for (size_t pos = 0; pos < text.size(); ++pos) {
                if (!at_word_start(text, pos)) {
                    continue;
                }

                if (keyword_at(text, pos, FROM)) {
                    const size_t keyword_end = pos + FROM.size();
                    const size_t next = skip_spaces(text, keyword_end);
                    if (next == keyword_end || next >= text.size()) {
                        continue;
                    }
                    if (text[next] == '<' || (keyword_at(text, next, NAMED) && at_word_end(text, next + NAMED.size()))) {
                        return true;
                    }
                } else if (keyword_at(text, pos, GRAPH)) {
                    const size_t keyword_end = pos + GRAPH.size();
                    const size_t next = skip_spaces(text, keyword_end);
                    if (next != keyword_end && next < text.size() && (text[next] == '?' || text[next] == '$' || text[next] == '<')) {
                        return true;
                    }
                }
            }
            return false;
        }

        // `*` or `+` right after a word char, '>' or ')' is how a path
        // modifier looks. COUNT(*) is safe: there the '*' follows '('.
        const std::regex& unbounded_path_regex() {
            static const std::regex re(R"([\w>)][*+])", std::regex::ECMAScript);
            return re;
        }

        // Collects `<prefix>:<letter><digits>` tokens for any of `prefixes`,
        // keeping `<letter><digits>`. The token must stand alone as a word.
        std::set<std::string> collect_ids(std::string_view text, std::initializer_list<std::string_view> prefixes, char letter) {
            std::set<std::string> ids;
            for (size_t pos = 0; pos < text.size(); ++pos) {
                if (!at_word_start(text, pos)) {
                    continue;
                }

                for (const std::string_view prefix : prefixes) {
                    const size_t colon = pos + prefix.size();
                    if (text.compare(pos, prefix.size(), prefix) != 0 || colon + 1 >= text.size() || text[colon] != ':' ||
                        text[colon + 1] != letter) {
                        continue;
                    }

                    const size_t id_start = colon + 1;
                    size_t id_end = id_start + 1;
                    while (id_end < text.size() && std::isdigit(static_cast<unsigned char>(text[id_end])) != 0) {
                        ++id_end;
                    }
                    if (id_end > id_start + 1 && at_word_end(text, id_end)) {
                        ids.emplace(text.substr(id_start, id_end - id_start));
                    }
                    pos = id_end - 1;
                    break;
                }
            }
            return ids;
        }

        std::set<std::string> collect_entity_ids(std::string_view text) { return collect_ids(text, {"wd"}, 'Q'); }

        std::set<std::string> collect_property_ids(std::string_view text) { return collect_ids(text, {"wdt", "ps", "pq", "p"}, 'P'); }

        // Rough triple pattern count: non-overlapping `?var term term` runs.
        size_t count_triple_patterns(std::string_view text) {
            const auto run_end = [&text](size_t i, bool (*pred)(char)) {
                while (i < text.size() && pred(text[i])) {
                    ++i;
                }
                return i;
            };
            const auto non_space = [](char c) { return !is_space(c); };

            size_t count = 0;
            size_t pos = 0;
            while (pos < text.size()) {
                if (text[pos] != '?') {
                    ++pos;
                    continue;
                }

                size_t i = run_end(pos + 1, is_word_char);
                bool matched = i > pos + 1;
                for (int term = 0; matched && term < 2; ++term) {
                    const size_t spaces_end = skip_spaces(text, i);
                    const size_t term_end = run_end(spaces_end, non_space);
                    matched = spaces_end > i && term_end > spaces_end;
                    i = term_end;
                }

                if (matched) {
                    ++count;
                    pos = i;
                } else {
                    ++pos;
                }
            }
            return count;
        }

        std::string join_ids(const std::set<std::string>& ids) { return string_utils::join(std::vector<std::string>(ids.begin(), ids.end()), ", "); }

        struct IdKind {
            const char* name_;
            const char* title_;
            const char* lookup_;
        };

        constexpr IdKind ENTITY_KIND{.name_ = "entity", .title_ = "Entity", .lookup_ = "entity search"};
        constexpr IdKind PROPERTY_KIND{.name_ = "property", .title_ = "Property", .lookup_ = "property search"};

        void check_grounding(const std::set<std::string>& used, const std::set<std::string>& allowed, const IdKind& kind,
                             std::vector<std::string>& errors) {
            if (used.empty()) {
                return;
            }

            if (allowed.empty()) {
                errors.push_back(std::string("Query references ") + kind.name_ + " IDs (" + join_ids(used) + ") but no grounded " + kind.name_ +
                                 " list was provided. Run " + kind.lookup_ + " first and pass the results.");
                return;
            }

            std::set<std::string> ungrounded;
            for (const auto& id : used) {
                if (!allowed.contains(id)) {
                    ungrounded.insert(id);
                }
            }

            if (!ungrounded.empty()) {
                errors.push_back(std::string(kind.title_) + " IDs not from grounding lookups: " + join_ids(ungrounded) + ". Run " + kind.lookup_ +
                                 " first.");
            }
        }
    }  // namespace

    LintResult lint(const std::string& query, const sparql::model::GroundingSets& grounding, const LintOptions& options) {
        LintResult result;

        // ---- limit enforcement ----
        sparql::query::RewritableQuery rewritable(query);
        if (!rewritable.limit()) {
            rewritable = rewritable.with_limit(options.limit_cap_);
            result.warnings_.push_back("Injected LIMIT " + std::to_string(options.limit_cap_) + " (was missing).");
        } else if (*rewritable.limit() > options.limit_cap_) {
            result.warnings_.push_back("Capped LIMIT from " + std::to_string(*rewritable.limit()) + " to " + std::to_string(options.limit_cap_) + ".");
            rewritable = rewritable.with_limit(options.limit_cap_);
        }
        result.query_ = rewritable.render();

        const std::string masked = sparql::query::mask_string_literals(result.query_);

        // ---- blocked scope constructs ----
        if (has_blocked_scope(masked)) {
            result.errors_.emplace_back("Query uses FROM / FROM NAMED / GRAPH; these are blocked.");
        }

        // ---- unbounded traversal ----
        if (std::regex_search(masked, unbounded_path_regex())) {
            result.errors_.emplace_back(
                "Query uses an unbounded property path (* or +). "
                "Use a fixed-length path instead (e.g. wdt:P31/wdt:P279 instead of wdt:P279*).");
        }

        // ---- capability allow-list ----
        const size_t label_services = sparql::query::count_label_service_clauses(masked);
        if (sparql::query::count_service_clauses(masked) > label_services) {
            result.errors_.emplace_back("Only SERVICE wikibase:label is allowed. Other SERVICE clauses are blocked.");
        }

        const long effective_limit = rewritable.limit().value_or(options.limit_cap_);
        if (label_services > 0 && effective_limit > options.label_service_limit_) {
            result.warnings_.push_back("SERVICE wikibase:label with LIMIT " + std::to_string(effective_limit) +
                                       " may cause timeouts. Consider removing it or reducing LIMIT to <= " +
                                       std::to_string(options.label_service_limit_) + ".");
        }

        // ---- mandatory grounding ----
        if (options.requires_grounding_) {
            check_grounding(collect_entity_ids(masked), grounding.entity_ids_, ENTITY_KIND, result.errors_);
            check_grounding(collect_property_ids(masked), grounding.property_ids_, PROPERTY_KIND, result.errors_);
        }

        // ---- complexity ----
        const size_t triples = count_triple_patterns(masked);
        if (triples > options.max_triples_) {
            result.warnings_.push_back("Query has ~" + std::to_string(triples) + " triple patterns (soft limit " + std::to_string(options.max_triples_) +
                                       "). Consider simplifying if it times out.");
        }

        result.ok_ = result.errors_.empty();
        if (!result.ok_) {
            spdlog::debug("lint blocked query with {} error(s): {}", result.errors_.size(), string_utils::join(result.errors_, " | "));
        }
        return result;
    }
}  // namespace sparql::lint
