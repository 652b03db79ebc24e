#ifndef SPARQL_GUARD_TRANSPORT_INTERFACE_HPP
#define SPARQL_GUARD_TRANSPORT_INTERFACE_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "../model/execution_result.hpp"

namespace sparql::transport {
    struct SparqlResults {
        std::vector<sparql::model::Row> rows_;
        std::optional<bool> boolean_;
    };

    struct TransportError {
        long status_ = 0;
        std::string body_;

        [[nodiscard]] bool is_rate_limited() const;
        // "HTTP <status>: <body>", or the bare body when no status was received.
        [[nodiscard]] std::string message() const;
    };

    struct TransportResult {
        std::optional<SparqlResults> results_;
        std::optional<TransportError> error_;
        int shapes_tried_ = 0;

        [[nodiscard]] bool ok() const { return results_.has_value(); }
    };

    class ISparqlTransport {
       public:
        ISparqlTransport() = default;
        virtual ~ISparqlTransport() = default;
        ISparqlTransport(const ISparqlTransport&) = delete;
        ISparqlTransport& operator=(const ISparqlTransport&) = delete;
        ISparqlTransport(ISparqlTransport&&) = delete;
        ISparqlTransport& operator=(ISparqlTransport&&) = delete;

        // Never throws; every failure comes back as TransportResult::error_.
        virtual TransportResult execute(const std::string& endpoint_url, const std::string& query, std::chrono::milliseconds timeout) = 0;
    };
}  // namespace sparql::transport

#endif
