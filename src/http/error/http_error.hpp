#ifndef SPARQL_GUARD_HTTP_ERROR_HPP
#define SPARQL_GUARD_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>

namespace http::http_error {
    const size_t ERROR_MESSAGE_LENGTH = 500;
    const size_t DIAGNOSTIC_BODY_LENGTH = 2000;

    struct HttpError : public std::runtime_error {
        long status_;
        std::string url_;
        std::string body_preview_;
        explicit HttpError(long s, std::string u, std::string preview, const std::string &msg);
    };
}  // namespace http::http_error

#endif
