#ifndef SPARQL_GUARD_LINTER_HPP
#define SPARQL_GUARD_LINTER_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "../model/query.hpp"

namespace sparql::lint {
    const long DEFAULT_LIMIT_CAP = 200;
    const size_t DEFAULT_MAX_TRIPLES = 12;
    const long DEFAULT_LABEL_SERVICE_LIMIT = 50;

    struct LintOptions {
        long limit_cap_ = DEFAULT_LIMIT_CAP;
        size_t max_triples_ = DEFAULT_MAX_TRIPLES;
        bool requires_grounding_ = true;
        // Label service plus a limit above this draws a warning.
        long label_service_limit_ = DEFAULT_LABEL_SERVICE_LIMIT;
    };

    struct LintResult {
        bool ok_ = false;
        std::string query_;
        std::vector<std::string> warnings_;
        std::vector<std::string> errors_;
    };

    // Structural pattern checks, not a parser. Known to misfire on
    // arithmetic such as `?a*2` and to miss paths hidden behind prefixes or
    // IRIs it cannot see through.
    [[nodiscard]] LintResult lint(const std::string& query, const sparql::model::GroundingSets& grounding, const LintOptions& options);
}  // namespace sparql::lint

#endif
