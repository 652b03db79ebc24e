#ifndef SPARQL_GUARD_CURL_EASY_HPP
#define SPARQL_GUARD_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <string>
#include <vector>

#include "../model/model.hpp"
#include "interface.hpp"

struct curl_slist;

namespace http::client {
    const size_t ERROR_BUFFER_SIZE = 256;

    enum class HttpStatusCode : long {
        OK = 200,
        BAD_REQUEST = 400,
        TOO_MANY_REQUESTS = 429,
        INTERNAL_SERVER_ERROR = 500,
        BAD_GATEWAY = 502,
        SERVICE_UNAVAILABLE = 503,
        GATEWAY_TIMEOUT = 504,
    };

    struct CurlOptions {
        std::string user_agent_ = "sparql_guard/1.0 (libcurl)";
        bool prefer_http2_ = false;
        bool keepalive_ = true;
        bool compression_ = true;
    };

    // One easy handle, one thread. Build a fresh instance per logical
    // request through an HttpClientFactory.
    class CurlEasy : public IHttpClient {
       public:
        explicit CurlEasy(CurlOptions options);

        ~CurlEasy() override;
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        http::model::Response perform(const http::model::Request& req) override;

       private:
        template <typename T>
        void setopt(int option, T value);  // defined in .cpp with CURLoption

        void set_defaults_once();
        void enable_keepalive();
        void enable_compression();
        void prefer_http2_tls();
        void set_headers(const std::vector<std::string>& hs);
        void prepare_for_new_request(const http::model::Request& req, std::string& body);
        void perform_throw();
        [[nodiscard]] std::string encode_fields(const std::vector<http::model::Field>& fields) const;
        [[nodiscard]] std::string escape(const std::string& raw) const;
        http::model::Response make_response(std::string& incoming_body);
        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);
        static bool extract_header_value(const char* buffer, size_t bytes, const char* key, std::string& out_property);

        CurlOptions options_;

        std::string last_content_type_;
        std::string url_;
        std::string post_body_;

        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
    };
}  // namespace http::client

#endif
