#include "curl_easy.hpp"

#include <curl/curl.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../model/model.hpp"

namespace http::client {

    struct CurlDefaults {
        static constexpr long FOLLOW_LOCATION = 1L;
        static constexpr long MAX_REDIRECTS = 10L;
        static constexpr const char* ACCEPT_ENCODING = "";
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long TCP_KEEPALIVE = 1L;
        static constexpr long TCP_KEEPIDLE = 120L;
        static constexpr long TCP_KEEPINTVL = 60L;
        static constexpr long ENABLED = 1L;
        static constexpr long DISABLED = 0L;
        static constexpr const char* CUSTOM_REQUEST = nullptr;
    };

    struct HeaderKeys {
        static constexpr const char* CONTENT_TYPE = "content-type:";
    };

    CurlEasy::CurlEasy(CurlOptions options) : options_(std::move(options)), handle_(curl_easy_init()) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        set_defaults_once();
        if (options_.keepalive_) {
            enable_keepalive();
        }
        if (options_.compression_) {
            enable_compression();
        }
        if (options_.prefer_http2_) {
            prefer_http2_tls();
        }
    }

    CurlEasy::~CurlEasy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    void CurlEasy::set_headers(const std::vector<std::string>& hs) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& h : hs) {
            headers_ = curl_slist_append(headers_, h.c_str());
        }
        setopt(CURLOPT_HTTPHEADER, headers_);
    }

    void CurlEasy::set_defaults_once() {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_USERAGENT, options_.user_agent_.c_str());
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps
    }

    void CurlEasy::enable_keepalive() {
        setopt(CURLOPT_TCP_KEEPALIVE, CurlDefaults::TCP_KEEPALIVE);
        setopt(CURLOPT_TCP_KEEPIDLE, CurlDefaults::TCP_KEEPIDLE);
        setopt(CURLOPT_TCP_KEEPINTVL, CurlDefaults::TCP_KEEPINTVL);
    }

    void CurlEasy::enable_compression() {
        // Empty string => accept all supported encodings (gzip/deflate/br)
        setopt(CURLOPT_ACCEPT_ENCODING, CurlDefaults::ACCEPT_ENCODING);
    }

    void CurlEasy::prefer_http2_tls() { setopt(CURLOPT_HTTP_VERSION, static_cast<long>(CURL_HTTP_VERSION_2TLS)); }

    std::string CurlEasy::escape(const std::string& raw) const {
        char* escaped = curl_easy_escape(handle_, raw.c_str(), static_cast<int>(raw.size()));
        if (escaped == nullptr) {
            throw std::runtime_error("curl_easy_escape failed");
        }
        std::string out(escaped);
        curl_free(escaped);
        return out;
    }

    std::string CurlEasy::encode_fields(const std::vector<http::model::Field>& fields) const {
        std::string out;
        for (const auto& [name, value] : fields) {
            if (!out.empty()) {
                out.push_back('&');
            }
            out += escape(name);
            out.push_back('=');
            out += escape(value);
        }
        return out;
    }

    void CurlEasy::prepare_for_new_request(const http::model::Request& req, std::string& body) {
        // Clear per-request scratch
        last_content_type_.clear();
        body.clear();

        setopt(CURLOPT_CONNECTTIMEOUT_MS, req.timeouts_.connect_ms_);
        setopt(CURLOPT_TIMEOUT_MS, req.timeouts_.total_ms_);
        setopt(CURLOPT_WRITEFUNCTION, &::string_utils::write_to_string);
        setopt(CURLOPT_WRITEDATA, static_cast<void*>(&body));
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(CURLOPT_HEADERDATA, static_cast<void*>(this));
        setopt(CURLOPT_CUSTOMREQUEST, CurlDefaults::CUSTOM_REQUEST);  // clears any previous custom verb

        const std::string encoded = encode_fields(req.fields_);

        if (req.method_ == http::model::Method::POST) {
            post_body_ = encoded;
            url_ = req.url_;
            setopt(CURLOPT_POST, CurlDefaults::ENABLED);
            // CURLOPT_POSTFIELDS does not copy; post_body_ outlives the transfer
            setopt(CURLOPT_POSTFIELDS, post_body_.c_str());
            setopt(CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body_.size()));
        } else {
            post_body_.clear();
            url_ = req.url_;
            if (!encoded.empty()) {
                url_ += (url_.find('?') == std::string::npos ? '?' : '&');
                url_ += encoded;
            }
            setopt(CURLOPT_HTTPGET, CurlDefaults::ENABLED);
        }

        setopt(CURLOPT_URL, url_.c_str());
        set_headers(req.headers_);
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;

        extract_header_value(buffer, bytes, HeaderKeys::CONTENT_TYPE, self->last_content_type_);

        return bytes;
    }

    bool CurlEasy::extract_header_value(const char* buffer, size_t bytes, const char* key, std::string& out_property) {
        size_t key_len = std::char_traits<char>::length(key);
        if (bytes < key_len) {
            return false;
        }
        for (size_t i = 0; i < key_len; ++i) {
            const char a = buffer[i];
            const char b = key[i];
            if ((a | constants::ASCII_LOWERCASE_BIT) != (b | constants::ASCII_LOWERCASE_BIT)) {
                return false;
            }  // ASCII-only fold
        }
        const char* start = buffer + key_len;
        const char* end = buffer + bytes;
        while (start < end && (*start == ' ' || *start == '\t')) {
            ++start;
        }
        while (end > start && (end[-1] == '\r' || end[-1] == '\n' || end[-1] == ' ' || end[-1] == '\t')) {
            --end;
        }
        out_property.assign(start, end);
        return true;
    }

    http::model::Response CurlEasy::perform(const http::model::Request& req) {
        std::string body;
        prepare_for_new_request(req, body);

        perform_throw();
        return make_response(body);
    }

    template <typename T>
    void CurlEasy::setopt(int option, T value) {
        const auto rc = curl_easy_setopt(handle_, static_cast<CURLoption>(option), value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }

    void CurlEasy::perform_throw() {
        error_buf_[0] = '\0';
        const auto rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK) {
            return;
        }

        std::string err = "curl_easy_perform failed: ";

        if (error_buf_[0] != '\0') {
            err += error_buf_.data();
        } else {
            err += curl_easy_strerror(rc);
        }

        throw std::runtime_error(err);
    }

    http::model::Response CurlEasy::make_response(std::string& incoming_body) {
        long code = 0;
        char* eff = nullptr;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff);

        http::model::Response r;
        r.status_ = code;
        r.body_ = std::move(incoming_body);
        r.effective_url_ = eff != nullptr ? eff : std::string{};
        r.content_type_ = std::move(last_content_type_);
        return r;
    }

}  // namespace http::client
