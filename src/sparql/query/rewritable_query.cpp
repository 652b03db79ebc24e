#include "rewritable_query.hpp"

#include <cctype>
#include <string>
#include <utility>

#include "../../utils/string_utils.hpp"
#include "sparql_text.hpp"

namespace sparql::query {
    namespace {
        void strip_trailing_terminators(std::string& text) {
            while (!text.empty() && (std::isspace(static_cast<unsigned char>(text.back())) != 0 || text.back() == ';')) {
                text.pop_back();
            }
        }
    }  // namespace

    RewritableQuery::RewritableQuery(std::string text) : source_(std::move(text)) {
        std::string masked = mask_string_literals(source_);

        label_span_ = find_label_service(masked);
        label_present_ = label_span_.has_value();

        // a LIMIT inside the label block is not the query's limit
        if (label_span_) {
            masked.replace(label_span_->offset_, label_span_->length_, label_span_->length_, ' ');
        }

        limit_clause_ = find_limit(masked);
        if (limit_clause_) {
            limit_ = limit_clause_->value_;
        }
    }

    RewritableQuery RewritableQuery::with_limit(long limit) const {
        RewritableQuery copy = *this;
        copy.limit_ = limit;
        return copy;
    }

    RewritableQuery RewritableQuery::without_label_service() const {
        RewritableQuery copy = *this;
        copy.label_present_ = false;
        return copy;
    }

    std::string RewritableQuery::render() const {
        const bool drop_label = label_span_.has_value() && !label_present_;
        const bool replace_limit = limit_clause_.has_value() && limit_ != limit_clause_->value_;
        const bool append_limit = !limit_clause_.has_value() && limit_.has_value();

        std::string out;
        out.reserve(source_.size() + 16);

        size_t cursor = 0;
        auto copy_until = [&](size_t offset) {
            if (offset > cursor) {
                out.append(source_, cursor, offset - cursor);
                cursor = offset;
            }
        };

        // label span and limit digits never overlap (see constructor)
        const bool label_first = drop_label && (!replace_limit || label_span_->offset_ < limit_clause_->digits_.offset_);

        if (label_first) {
            copy_until(label_span_->offset_);
            cursor = label_span_->end();
        }
        if (replace_limit) {
            copy_until(limit_clause_->digits_.offset_);
            out += std::to_string(*limit_);
            cursor = limit_clause_->digits_.end();
        }
        if (drop_label && !label_first) {
            copy_until(label_span_->offset_);
            cursor = label_span_->end();
        }
        copy_until(source_.size());

        if (drop_label) {
            out = string_utils::trim(std::move(out));
        }

        if (append_limit) {
            strip_trailing_terminators(out);
            out += "\nLIMIT " + std::to_string(*limit_);
        }

        return out;
    }
}  // namespace sparql::query
