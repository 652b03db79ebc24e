#include "cache_key.hpp"

#include <cstdio>
#include <functional>
#include <string>

#include "../../utils/string_utils.hpp"

namespace http::cache {
    std::string make_key(std::initializer_list<std::string_view> parts) {
        std::string raw;
        bool first = true;
        for (const auto part : parts) {
            if (!first) {
                raw.push_back('|');
            }
            raw.append(part);
            first = false;
        }

        std::hash<std::string> hash_maker;
        const size_t hash = hash_maker(raw);

        char buf[2 * sizeof(size_t) + 1];
        std::snprintf(buf, sizeof(buf), "%0*zx", static_cast<int>(2 * sizeof(size_t)), hash);
        return {buf};
    }

    std::string normalize_query(std::string_view query) { return string_utils::collapse_whitespace(query); }
}  // namespace http::cache
