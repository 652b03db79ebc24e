#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace string_utils {
    namespace {
        constexpr std::string_view REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

        // Length of the well-formed sequence starting at `i`, or 0. Overlong
        // forms, surrogates and code points past U+10FFFF are ill-formed.
        size_t utf8_sequence_length(std::string_view sv, size_t i) {
            const auto byte = [&sv](size_t k) { return static_cast<unsigned char>(sv[k]); };
            const unsigned char lead = byte(i);
            if (lead < 0x80U) {
                return 1;
            }

            size_t length = 0;
            unsigned char low = 0x80U;
            unsigned char high = 0xBFU;
            if (lead >= 0xC2U && lead <= 0xDFU) {
                length = 2;
            } else if (lead >= 0xE0U && lead <= 0xEFU) {
                length = 3;
                if (lead == 0xE0U) {
                    low = 0xA0U;
                } else if (lead == 0xEDU) {
                    high = 0x9FU;
                }
            } else if (lead >= 0xF0U && lead <= 0xF4U) {
                length = 4;
                if (lead == 0xF0U) {
                    low = 0x90U;
                } else if (lead == 0xF4U) {
                    high = 0x8FU;
                }
            } else {
                return 0;
            }

            if (i + length > sv.size() || byte(i + 1) < low || byte(i + 1) > high) {
                return 0;
            }
            for (size_t k = 2; k < length; ++k) {
                if ((byte(i + k) & 0xC0U) != 0x80U) {
                    return 0;
                }
            }
            return length;
        }
    }  // namespace

    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::string to_lower(std::string_view sv) {
        std::string out(sv);
        std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    std::string collapse_whitespace(std::string_view sv) {
        std::string out;
        out.reserve(sv.size());
        bool pending_space = false;
        for (const char c : sv) {
            if (std::isspace(static_cast<unsigned char>(c)) != 0) {
                pending_space = !out.empty();
                continue;
            }
            if (pending_space) {
                out.push_back(' ');
                pending_space = false;
            }
            out.push_back(c);
        }
        return out;
    }

    std::string truncate(std::string_view sv, size_t max_bytes) {
        if (sv.size() <= max_bytes) {
            return std::string(sv);
        }
        size_t end = max_bytes;
        // back off continuation bytes (10xxxxxx)
        while (end > 0 && (static_cast<unsigned char>(sv[end]) & 0xC0U) == 0x80U) {
            --end;
        }
        return std::string(sv.substr(0, end));
    }

    std::string sanitize_utf8(std::string_view sv) {
        std::string out;
        out.reserve(sv.size());
        size_t i = 0;
        while (i < sv.size()) {
            const size_t length = utf8_sequence_length(sv, i);
            if (length == 0) {
                out.append(REPLACEMENT_CHARACTER);
                ++i;
                continue;
            }
            out.append(sv.substr(i, length));
            i += length;
        }
        return out;
    }

    std::string join(const std::vector<std::string> &parts, std::string_view separator) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) {
                out.append(separator);
            }
            out.append(parts[i]);
        }
        return out;
    }

    std::vector<std::string> split_comma_delimited_string(std::string_view sv) {
        std::vector<std::string> out;
        size_t start = 0;
        for (;;) {
            size_t pos = sv.find(',', start);
            size_t end = (pos == std::string_view::npos) ? sv.size() : pos;

            std::string_view token = sv.substr(start, end - start);
            const auto first = token.find_first_not_of(" \t");
            if (first != std::string_view::npos) {
                const auto last = token.find_last_not_of(" \t");
                out.emplace_back(token.substr(first, last - first + 1));
            }

            if (pos == std::string_view::npos) {
                break;
            }

            start = pos + 1;
        }
        return out;
    }
}  // namespace string_utils
