#include "orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <utility>

#include "../../http/cache/cache_key.hpp"
#include "../../utils/string_utils.hpp"
#include "../query/sparql_text.hpp"

namespace sparql::repair {
    namespace {
        const size_t DRY_RUN_MESSAGE_LENGTH = 300;
        const size_t FINAL_MESSAGE_LENGTH = 500;

        const char* const EMPTY_RESULT_ADVISORY = "Query returned zero results. Check entity/property IDs or try broadening the query.";
    }  // namespace

    const char* to_string(Stage stage) {
        switch (stage) {
            case Stage::LINT:
                return "LINT";
            case Stage::CACHE_CHECK:
                return "CACHE_CHECK";
            case Stage::DRY_RUN:
                return "DRY_RUN";
            case Stage::EXECUTE:
                return "EXECUTE";
            case Stage::SUCCESS:
                return "SUCCESS";
            case Stage::FAILED:
                return "FAILED";
        }
        return "FAILED";
    }

    Orchestrator::Orchestrator(RepairContext context, const sparql::endpoint::EndpointRegistry& registry,
                               sparql::transport::ISparqlTransport& transport, RepairPolicy policy, sparql::lint::LintOptions lint_defaults)
        : context_(context), registry_(registry), transport_(transport), policy_(policy), lint_defaults_(lint_defaults) {}

    sparql::model::ExecutionResult Orchestrator::run(const sparql::model::Query& query, const sparql::model::GroundingSets& grounding,
                                                     std::chrono::milliseconds timeout_budget, long limit_cap) {
        auto endpoint = registry_.find(query.endpoint_class_);

        Run run{
            .endpoint_ = endpoint.value_or(sparql::endpoint::EndpointClass{.name_ = query.endpoint_class_}),
            .grounding_ = grounding,
            .timeout_budget_ = timeout_budget,
            .limit_cap_ = limit_cap,
            .started_at_ = context_.clock_.now(),
            .source_text_ = string_utils::trim(query.text_),
        };

        if (!endpoint) {
            run.stage_ = fail(run, sparql::errors::ErrorCode::UNKNOWN, "Unknown endpoint class '" + query.endpoint_class_ + "'.",
                              "Use one of: " + string_utils::join(registry_.names(), ", ") + ".");
        } else if (run.source_text_.empty()) {
            run.stage_ = fail(run, sparql::errors::ErrorCode::SYNTAX, "Empty query.", "Provide a SELECT or ASK query.");
        } else if (run.source_text_.size() > policy_.max_query_bytes_) {
            run.stage_ = fail(run, sparql::errors::ErrorCode::SYNTAX,
                              "Query is " + std::to_string(run.source_text_.size()) + " bytes; the maximum is " +
                                  std::to_string(policy_.max_query_bytes_) + ".",
                              "Shorten the query. Long VALUES lists are better split across several queries.");
        } else if (sparql::query::is_graph_producing_form(sparql::query::mask_string_literals(run.source_text_))) {
            run.stage_ = fail(run, sparql::errors::ErrorCode::SYNTAX, "Only SELECT or ASK queries are supported.",
                              "Rewrite the query as a SELECT or ASK query.");
        }

        while (run.stage_ != Stage::SUCCESS && run.stage_ != Stage::FAILED) {
            switch (run.stage_) {
                case Stage::LINT:
                    run.stage_ = lint_stage(run);
                    break;
                case Stage::CACHE_CHECK:
                    run.stage_ = cache_stage(run);
                    break;
                case Stage::DRY_RUN:
                    run.stage_ = dry_run_stage(run);
                    break;
                case Stage::EXECUTE:
                    run.stage_ = execute_stage(run);
                    break;
                case Stage::SUCCESS:
                case Stage::FAILED:
                    break;
            }
        }

        return finish(run);
    }

    sparql::transport::TransportResult Orchestrator::execute_throttled(const sparql::endpoint::EndpointClass& endpoint, const std::string& query,
                                                                       std::chrono::milliseconds timeout) {
        context_.throttle_.before_call(endpoint.name_);
        auto result = transport_.execute(endpoint.sparql_url_, query, timeout);
        bool rate_limited = result.error_.has_value() && result.error_->is_rate_limited();
        if (rate_limited) {
            spdlog::warn("{} answered 429, backing off", endpoint.name_);
        }
        context_.throttle_.on_result(endpoint.name_, rate_limited);
        return result;
    }

    Stage Orchestrator::lint_stage(Run& run) const {
        sparql::lint::LintOptions options = lint_defaults_;
        options.limit_cap_ = run.limit_cap_;
        options.requires_grounding_ = run.endpoint_.requires_grounding_;

        auto lint = sparql::lint::lint(run.source_text_, run.grounding_, options);
        run.result_.warnings_ = lint.warnings_;

        if (!lint.ok_) {
            run.result_.lint_errors_ = lint.errors_;
            return fail(run, sparql::errors::ErrorCode::LINTER_BLOCK, string_utils::join(lint.errors_, "; "),
                        sparql::errors::describe(sparql::errors::ErrorCode::LINTER_BLOCK));
        }

        run.cache_key_ = http::cache::make_key({run.endpoint_.name_, http::cache::normalize_query(lint.query_)});
        run.current_.emplace(std::move(lint.query_));
        return Stage::CACHE_CHECK;
    }

    Stage Orchestrator::cache_stage(Run& run) const {
        auto cached = context_.results_.get(run.cache_key_);
        if (!cached) {
            return Stage::DRY_RUN;
        }

        spdlog::info("{} result served from cache", run.endpoint_.name_);
        run.result_ = std::move(*cached);
        run.result_.from_cache_ = true;
        return Stage::SUCCESS;
    }

    Stage Orchestrator::dry_run_stage(Run& run) {
        std::string dry_query = run.current_->with_limit(1).render();
        auto timeout = std::min(run.timeout_budget_, policy_.dry_run_timeout_cap_);

        auto response = execute_throttled(run.endpoint_, dry_query, timeout);
        if (response.ok()) {
            return Stage::EXECUTE;
        }

        const std::string raw = string_utils::sanitize_utf8(response.error_->message());
        auto classification = sparql::errors::classify(raw);
        return fail(run, classification.code_, "Dry-run failed: " + string_utils::truncate(raw, DRY_RUN_MESSAGE_LENGTH), classification.hint_);
    }

    Stage Orchestrator::execute_stage(Run& run) {
        auto response = execute_throttled(run.endpoint_, run.current_->render(), run.timeout_budget_);
        run.result_.stats_.attempts_ = run.attempt_ + 1;

        if (response.ok()) {
            run.result_.rows_ = std::move(response.results_->rows_);
            run.result_.boolean_ = response.results_->boolean_;
            return Stage::SUCCESS;
        }

        const std::string raw = string_utils::sanitize_utf8(response.error_->message());
        auto classification = sparql::errors::classify(raw);

        std::optional<RepairAction> repair;
        if (run.attempt_ < policy_.max_repairs_) {
            repair = plan_repair(run, classification.code_);
        }

        if (!repair) {
            return fail(run, classification.code_, string_utils::truncate(raw, FINAL_MESSAGE_LENGTH), classification.hint_);
        }

        spdlog::info("{} repair: {}", run.endpoint_.name_, repair->description_);
        run.result_.repairs_applied_.push_back(repair->description_);
        run.repairs_.push_back(std::move(*repair));
        ++run.attempt_;
        return Stage::EXECUTE;
    }

    std::optional<RepairAction> Orchestrator::plan_repair(Run& run, sparql::errors::ErrorCode code) const {
        const int attempt_number = run.attempt_ + 1;
        const std::string prefix = "Attempt " + std::to_string(attempt_number) + ": " + sparql::errors::to_string(code) + " - ";

        switch (code) {
            case sparql::errors::ErrorCode::TIMEOUT: {
                if (run.current_->has_label_service()) {
                    run.current_ = run.current_->without_label_service();
                    return RepairAction{.attempt_ = attempt_number,
                                        .kind_ = RepairAction::Kind::STRIP_LABEL_SERVICE,
                                        .trigger_ = code,
                                        .description_ = prefix + "removed SERVICE wikibase:label"};
                }

                auto limit = run.current_->limit();
                if (!limit) {
                    return std::nullopt;
                }

                long halved = std::max(1L, *limit / 2);
                run.current_ = run.current_->with_limit(halved);
                return RepairAction{.attempt_ = attempt_number,
                                    .kind_ = RepairAction::Kind::HALVE_LIMIT,
                                    .trigger_ = code,
                                    .description_ = prefix + "halved LIMIT to " + std::to_string(halved)};
            }
            case sparql::errors::ErrorCode::RATE_LIMIT: {
                auto wait = sparql::throttle::exponential_backoff(attempt_number, policy_.rate_limit_backoff_cap_);
                context_.clock_.sleep_for(wait);
                return RepairAction{.attempt_ = attempt_number,
                                    .kind_ = RepairAction::Kind::RATE_LIMIT_BACKOFF,
                                    .trigger_ = code,
                                    .description_ = prefix + "waited " + std::to_string(wait.count() / 1000) + "s before retry"};
            }
            default:
                return std::nullopt;
        }
    }

    sparql::model::ExecutionResult Orchestrator::finish(Run& run) const {
        auto& result = run.result_;
        result.stats_.elapsed_ms_ = utils::elapsed_ms(context_.clock_, run.started_at_);

        if (run.stage_ == Stage::FAILED) {
            result.ok_ = false;
            return result;
        }

        if (result.from_cache_) {
            result.stats_.attempts_ = 0;
            return result;
        }

        result.ok_ = true;
        result.row_count_ = result.rows_.size();
        if (result.rows_.empty() && !result.boolean_.has_value()) {
            result.error_code_ = sparql::errors::ErrorCode::EMPTY;
            result.advisory_ = EMPTY_RESULT_ADVISORY;
        }

        // Keyed on the linted query, so a repaired run still serves the
        // next identical request.
        context_.results_.set(run.cache_key_, result);
        return result;
    }

    Stage Orchestrator::fail(Run& run, sparql::errors::ErrorCode code, std::string message, std::string hint) {
        run.result_.ok_ = false;
        run.result_.error_code_ = code;
        run.result_.error_message_ = std::move(message);
        run.result_.hint_ = std::move(hint);
        return Stage::FAILED;
    }
}  // namespace sparql::repair
