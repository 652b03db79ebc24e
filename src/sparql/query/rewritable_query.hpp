#ifndef SPARQL_GUARD_REWRITABLE_QUERY_HPP
#define SPARQL_GUARD_REWRITABLE_QUERY_HPP

#include <optional>
#include <string>

#include "sparql_text.hpp"

namespace sparql::query {
    // Query text plus the two things the pipeline is allowed to change: the
    // LIMIT value and the presence of the label-service clause. Spans always
    // refer to the untouched source text, so rewrites compose without
    // shifting each other's offsets; render() applies them in one pass.
    class RewritableQuery {
       public:
        explicit RewritableQuery(std::string text);

        [[nodiscard]] const std::string& source() const { return source_; }
        [[nodiscard]] std::optional<long> limit() const { return limit_; }
        [[nodiscard]] bool has_label_service() const { return label_span_.has_value() && label_present_; }

        // Appends `LIMIT n` when the source has none.
        [[nodiscard]] RewritableQuery with_limit(long limit) const;
        [[nodiscard]] RewritableQuery without_label_service() const;

        [[nodiscard]] std::string render() const;

       private:
        std::string source_;

        std::optional<LimitClause> limit_clause_;
        std::optional<long> limit_;

        std::optional<Span> label_span_;
        bool label_present_ = false;
    };
}  // namespace sparql::query

#endif
