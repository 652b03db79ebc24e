#include "curl_global.hpp"

#include <curl/curl.h>

#include <stdexcept>

namespace http::client {

    CurlGlobal::CurlGlobal() {
        const auto rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    }

    CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

    bool CurlGlobal::supports_http2() {
        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        return info != nullptr && (info->features & CURL_VERSION_HTTP2) != 0;
    }

}  // namespace http::client
