#ifndef SPARQL_GUARD_TESTS_FAKES_HPP
#define SPARQL_GUARD_TESTS_FAKES_HPP

#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../src/grounding/interface.hpp"
#include "../src/http/client/interface.hpp"
#include "../src/http/model/model.hpp"
#include "../src/sparql/transport/interface.hpp"
#include "../src/utils/clock.hpp"

namespace fakes {
    // Time only moves when someone sleeps or the test advances it.
    class FakeClock : public utils::IClock {
       public:
        [[nodiscard]] std::chrono::steady_clock::time_point now() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            return now_;
        }

        void sleep_for(std::chrono::milliseconds duration) override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (duration.count() > 0) {
                sleeps_.push_back(duration);
                now_ += duration;
            }
        }

        void advance(std::chrono::milliseconds duration) {
            std::lock_guard<std::mutex> lock(mutex_);
            now_ += duration;
        }

        [[nodiscard]] std::vector<std::chrono::milliseconds> sleeps() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return sleeps_;
        }

       private:
        mutable std::mutex mutex_;
        std::chrono::steady_clock::time_point now_{std::chrono::hours(1)};
        std::vector<std::chrono::milliseconds> sleeps_;
    };

    // Scripted responses shared by every client a factory hands out.
    struct HttpScript {
        struct Step {
            http::model::Response response_;
            // Non-empty: perform() throws this instead of answering.
            std::string transport_failure_;
        };

        std::mutex mutex_;
        std::deque<Step> steps_;
        std::vector<http::model::Request> requests_;
        http::model::Response fallback_{.status_ = 500, .body_ = "no scripted response"};

        void respond(long status, std::string body, std::string content_type = "application/sparql-results+json") {
            std::lock_guard<std::mutex> lock(mutex_);
            steps_.push_back(Step{.response_ = {.status_ = status, .body_ = std::move(body), .content_type_ = std::move(content_type)}});
        }

        void fail_transport(std::string message) {
            std::lock_guard<std::mutex> lock(mutex_);
            steps_.push_back(Step{.transport_failure_ = std::move(message)});
        }

        size_t request_count() {
            std::lock_guard<std::mutex> lock(mutex_);
            return requests_.size();
        }
    };

    class FakeHttpClient : public http::client::IHttpClient {
       public:
        explicit FakeHttpClient(std::shared_ptr<HttpScript> script) : script_(std::move(script)) {}

        http::model::Response perform(const http::model::Request& req) override {
            std::lock_guard<std::mutex> lock(script_->mutex_);
            script_->requests_.push_back(req);
            if (script_->steps_.empty()) {
                return script_->fallback_;
            }

            HttpScript::Step step = std::move(script_->steps_.front());
            script_->steps_.pop_front();
            if (!step.transport_failure_.empty()) {
                throw std::runtime_error(step.transport_failure_);
            }
            step.response_.effective_url_ = req.url_;
            return step.response_;
        }

       private:
        std::shared_ptr<HttpScript> script_;
    };

    inline http::client::HttpClientFactory factory_for(const std::shared_ptr<HttpScript>& script) {
        return [script]() { return std::make_unique<FakeHttpClient>(script); };
    }

    class FakeTransport : public sparql::transport::ISparqlTransport {
       public:
        struct Call {
            std::string url_;
            std::string query_;
            std::chrono::milliseconds timeout_;
        };

        sparql::transport::TransportResult execute(const std::string& endpoint_url, const std::string& query,
                                                   std::chrono::milliseconds timeout) override {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(Call{.url_ = endpoint_url, .query_ = query, .timeout_ = timeout});
            if (script_.empty()) {
                return success(std::vector<sparql::model::Row>{sparql::model::Row{{"x", "1"}}});
            }
            auto next = std::move(script_.front());
            script_.pop_front();
            return next;
        }

        void push(sparql::transport::TransportResult result) {
            std::lock_guard<std::mutex> lock(mutex_);
            script_.push_back(std::move(result));
        }

        void push_rows(std::vector<sparql::model::Row> rows) { push(success(std::move(rows))); }

        void push_error(long status, std::string body) {
            push(sparql::transport::TransportResult{.error_ = sparql::transport::TransportError{.status_ = status, .body_ = std::move(body)}});
        }

        [[nodiscard]] std::vector<Call> calls() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return calls_;
        }

        static sparql::transport::TransportResult success(std::vector<sparql::model::Row> rows) {
            return sparql::transport::TransportResult{.results_ = sparql::transport::SparqlResults{.rows_ = std::move(rows)}, .shapes_tried_ = 1};
        }

       private:
        mutable std::mutex mutex_;
        std::deque<sparql::transport::TransportResult> script_;
        std::vector<Call> calls_;
    };

    class FakeGroundingProvider : public grounding::IGroundingProvider {
       public:
        grounding::GroundingLookup search(const std::string& text, grounding::SearchKind kind, int k) override {
            ++search_calls_;
            last_kind_ = kind;
            last_k_ = k;
            if (fail_next_search_) {
                fail_next_search_ = false;
                return grounding::GroundingLookup{.query_ = text, .error_ = grounding::GroundingError{.status_ = 503, .message_ = "unavailable"}};
            }
            return grounding::GroundingLookup{.query_ = text, .candidates_ = {{.id_ = "Q42", .label_ = "Douglas Adams", .description_ = "writer"}}};
        }

        grounding::EntityBatch fetch_entities(const std::vector<std::string>& ids) override {
            ++fetch_calls_;
            grounding::EntityBatch batch;
            for (const auto& id : ids) {
                if (records_.contains(id)) {
                    batch.records_.emplace(id, records_.at(id));
                }
            }
            batch.error_ = fetch_error_;
            return batch;
        }

        std::map<std::string, grounding::EntityRecord> records_;
        std::optional<grounding::GroundingError> fetch_error_;
        bool fail_next_search_ = false;
        int search_calls_ = 0;
        int fetch_calls_ = 0;
        grounding::SearchKind last_kind_ = grounding::SearchKind::ITEM;
        int last_k_ = 0;
    };
}  // namespace fakes

#endif
