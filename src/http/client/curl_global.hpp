#ifndef SPARQL_GUARD_CURL_GLOBAL_HPP
#define SPARQL_GUARD_CURL_GLOBAL_HPP

namespace http::client {

    // Must outlive every CurlEasy handle. Construct once in main before
    // any worker thread starts.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;

        [[nodiscard]] static bool supports_http2();
    };

}  // namespace http::client

#endif
