#ifndef SPARQL_GUARD_SPARQL_EXECUTOR_HPP
#define SPARQL_GUARD_SPARQL_EXECUTOR_HPP

#include <array>
#include <chrono>
#include <optional>
#include <string>

#include "../../http/client/interface.hpp"
#include "../../http/model/model.hpp"
#include "interface.hpp"

namespace sparql::transport {
    const long CONNECT_TIMEOUT_MS = 10'000;

    struct RequestShape {
        http::model::Method method_;
        bool with_format_;
    };

    // Endpoints differ in which request form they accept, so each query is
    // tried in this order until one yields SPARQL JSON.
    inline constexpr std::array<RequestShape, 4> REQUEST_SHAPES = {{
        {.method_ = http::model::Method::POST, .with_format_ = false},
        {.method_ = http::model::Method::POST, .with_format_ = true},
        {.method_ = http::model::Method::GET, .with_format_ = false},
        {.method_ = http::model::Method::GET, .with_format_ = true},
    }};

    class SparqlExecutor : public ISparqlTransport {
       public:
        explicit SparqlExecutor(http::client::HttpClientFactory http_client_factory);

        TransportResult execute(const std::string& endpoint_url, const std::string& query, std::chrono::milliseconds timeout) override;

        [[nodiscard]] static http::model::Request build_request(const std::string& endpoint_url, const std::string& query, const RequestShape& shape,
                                                                std::chrono::milliseconds timeout);

        // nullopt unless the body is a JSON object carrying `results.bindings`
        // or `boolean`.
        [[nodiscard]] static std::optional<SparqlResults> parse_results(const std::string& body);

       private:
        http::client::HttpClientFactory http_client_factory_;
    };
}  // namespace sparql::transport

#endif
