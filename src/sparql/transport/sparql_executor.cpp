#include "sparql_executor.hpp"

#include <simdjson.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "../../http/client/curl_easy.hpp"
#include "../../http/error/http_error.hpp"
#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

using namespace simdjson;

namespace sparql::transport {
    namespace {
        constexpr size_t UNPARSEABLE_BODY_PREVIEW = 300;

        const char* method_name(http::model::Method method) { return method == http::model::Method::POST ? "POST" : "GET"; }
    }  // namespace

    bool TransportError::is_rate_limited() const { return status_ == static_cast<long>(http::client::HttpStatusCode::TOO_MANY_REQUESTS); }

    std::string TransportError::message() const {
        if (status_ <= 0) {
            return body_;
        }
        return "HTTP " + std::to_string(status_) + ": " + body_;
    }

    SparqlExecutor::SparqlExecutor(http::client::HttpClientFactory http_client_factory) : http_client_factory_(std::move(http_client_factory)) {}

    http::model::Request SparqlExecutor::build_request(const std::string& endpoint_url, const std::string& query, const RequestShape& shape,
                                                       std::chrono::milliseconds timeout) {
        http::model::Request req;
        req.url_ = endpoint_url;
        req.method_ = shape.method_;
        req.fields_.emplace_back("query", query);
        if (shape.with_format_) {
            req.fields_.emplace_back("format", constants::FORMAT_JSON);
        }

        req.headers_.push_back(std::string("Accept: ") + constants::SPARQL_RESULTS_JSON);
        if (shape.method_ == http::model::Method::POST) {
            req.headers_.push_back(std::string("Content-Type: ") + constants::FORM_URLENCODED);
        }

        req.timeouts_ = http::model::Timeouts{.connect_ms_ = CONNECT_TIMEOUT_MS, .total_ms_ = static_cast<long>(timeout.count())};
        return req;
    }

    std::optional<SparqlResults> SparqlExecutor::parse_results(const std::string& body) {
        SparqlResults out;
        bool recognized = false;

        try {
            ondemand::parser parser;
            padded_string json(body);
            ondemand::document doc = parser.iterate(json);
            ondemand::object root = doc.get_object();

            for (auto field : root) {
                const std::string_view key = field.unescaped_key();

                if (key == "boolean") {
                    out.boolean_ = bool(field.value().get_bool());
                    recognized = true;
                    continue;
                }

                if (key != "results") {
                    continue;
                }

                for (auto results_field : field.value().get_object()) {
                    if (std::string_view(results_field.unescaped_key()) != "bindings") {
                        continue;
                    }

                    for (auto binding : results_field.value().get_array()) {
                        sparql::model::Row row;
                        for (auto cell : binding.get_object()) {
                            std::string variable(std::string_view(cell.unescaped_key()));
                            for (auto term_field : cell.value().get_object()) {
                                if (std::string_view(term_field.unescaped_key()) == "value") {
                                    row[variable] = std::string(std::string_view(term_field.value().get_string()));
                                }
                            }
                        }
                        out.rows_.emplace_back(std::move(row));
                    }
                    recognized = true;
                }
            }
        } catch (const simdjson_error& e) {
            spdlog::debug("response is not SPARQL JSON: {}", e.what());
            return std::nullopt;
        }

        if (!recognized) {
            return std::nullopt;
        }
        return out;
    }

    TransportResult SparqlExecutor::execute(const std::string& endpoint_url, const std::string& query, std::chrono::milliseconds timeout) {
        TransportResult result;
        TransportError last_error{.status_ = 0, .body_ = "no request shape attempted"};

        std::unique_ptr<http::client::IHttpClient> client;
        try {
            client = http_client_factory_();
        } catch (const std::exception& e) {
            spdlog::error("failed to create HTTP client: {}", e.what());
        }

        if (client == nullptr) {
            result.error_ = TransportError{.status_ = constants::SYNTHETIC_TRANSPORT_FAILURE_STATUS, .body_ = "HTTP client unavailable"};
            return result;
        }

        for (const auto& shape : REQUEST_SHAPES) {
            ++result.shapes_tried_;
            const auto req = build_request(endpoint_url, query, shape, timeout);

            try {
                const http::model::Response resp = client->perform(req);

                if (resp.status_ >= constants::HTTP_ERROR_LOWER_BOUNDARY) {
                    last_error = TransportError{
                        .status_ = resp.status_,
                        .body_ = string_utils::truncate(string_utils::sanitize_utf8(resp.body_), http::http_error::DIAGNOSTIC_BODY_LENGTH)};
                    spdlog::debug("{} {} (format={}) -> HTTP {}", method_name(shape.method_), endpoint_url, shape.with_format_, resp.status_);

                    // other shapes would hit the same limit and deepen the penalty
                    if (last_error.is_rate_limited()) {
                        result.error_ = std::move(last_error);
                        return result;
                    }
                    continue;
                }

                auto parsed = parse_results(resp.body_);
                if (!parsed) {
                    last_error = TransportError{
                        .status_ = resp.status_,
                        .body_ = "Response was not SPARQL JSON (content-type '" + string_utils::sanitize_utf8(resp.content_type_) +
                                 "'): " + string_utils::truncate(string_utils::sanitize_utf8(resp.body_), UNPARSEABLE_BODY_PREVIEW)};
                    continue;
                }

                spdlog::debug("{} {} (format={}) -> HTTP {}, {} rows", method_name(shape.method_), endpoint_url, shape.with_format_, resp.status_,
                              parsed->rows_.size());
                result.results_ = std::move(*parsed);
                return result;
            } catch (const std::exception& e) {
                spdlog::warn("{} {} (format={}) failed: {}", method_name(shape.method_), endpoint_url, shape.with_format_, e.what());
                last_error = TransportError{.status_ = 0, .body_ = string_utils::sanitize_utf8(e.what())};
            }
        }

        result.error_ = TransportError{
            .status_ = constants::SYNTHETIC_TRANSPORT_FAILURE_STATUS,
            .body_ = string_utils::truncate("All SPARQL request attempts failed; last error: " + last_error.message(),
                                            http::http_error::DIAGNOSTIC_BODY_LENGTH)};
        return result;
    }
}  // namespace sparql::transport
