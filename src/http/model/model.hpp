#ifndef SPARQL_GUARD_MODEL_HPP
#define SPARQL_GUARD_MODEL_HPP

#include <string>
#include <utility>
#include <vector>

namespace http::model {
    enum class Method { GET, POST };

    using Field = std::pair<std::string, std::string>;

    struct Timeouts {
        long connect_ms_ = 10'000;
        long total_ms_ = 30'000;
    };

    struct Request {
        std::string url_;
        Method method_ = Method::GET;

        // GET: appended to the url as a query string. POST: sent as a
        // form-encoded body. Encoding is the client's job.
        std::vector<Field> fields_;

        std::vector<std::string> headers_;
        Timeouts timeouts_;
    };

    struct Response {
        long status_ = 0;

        std::string body_;
        std::string effective_url_;
        std::string content_type_;
    };
}  // namespace http::model

#endif
