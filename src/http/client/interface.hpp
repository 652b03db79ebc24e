#ifndef SPARQL_GUARD_CLIENT_INTERFACE_HPP
#define SPARQL_GUARD_CLIENT_INTERFACE_HPP

#include <functional>
#include <memory>

#include "../model/model.hpp"

namespace http::client {
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        // Throws std::runtime_error when no HTTP response was received
        // (connect failure, timeout, TLS error). Any HTTP status is returned.
        virtual http::model::Response perform(const http::model::Request& req) = 0;
    };

    using HttpClientFactory = std::function<std::unique_ptr<IHttpClient>()>;
}  // namespace http::client

#endif
