#include "settings.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include "../utils/string_utils.hpp"

namespace config {
    namespace {
        std::optional<std::string> non_empty(const EnvLookup& lookup, const char* name) {
            auto value = lookup(name);
            if (!value) {
                return std::nullopt;
            }
            std::string trimmed = string_utils::trim(*value);
            if (trimmed.empty()) {
                return std::nullopt;
            }
            return trimmed;
        }

        bool parse_switch(const char* name, const std::string& raw) {
            const std::string value = string_utils::to_lower(raw);
            if (value == "on" || value == "1" || value == "true" || value == "yes") {
                return true;
            }
            if (value == "off" || value == "0" || value == "false" || value == "no") {
                return false;
            }
            throw std::invalid_argument(std::string(name) + " must be on or off, got '" + raw + "'");
        }
    }  // namespace

    std::optional<std::string> process_env(const char* name) {
        const char* value = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    }

    Settings load_settings(const EnvLookup& lookup) {
        Settings settings;

        if (auto value = non_empty(lookup, "SPARQL_GUARD_USER_AGENT")) {
            settings.user_agent_ = *value;
        }

        if (auto value = non_empty(lookup, "SPARQL_GUARD_HTTP2")) {
            if (string_utils::to_lower(*value) == "auto") {
                settings.http2_ = Http2Mode::AUTO;
            } else {
                settings.http2_ = parse_switch("SPARQL_GUARD_HTTP2", *value) ? Http2Mode::ON : Http2Mode::OFF;
            }
        }

        if (auto value = non_empty(lookup, "WIKIDATA_SPARQL")) {
            settings.wikidata_sparql_url_ = *value;
        }
        if (auto value = non_empty(lookup, "WIKIDATA_API")) {
            settings.wikidata_api_url_ = *value;
        }
        if (auto value = non_empty(lookup, "RHEA_SPARQL")) {
            settings.rhea_sparql_url_ = *value;
        }
        if (auto value = non_empty(lookup, "SPARQL_GUARD_CACHE")) {
            settings.cache_enabled_ = parse_switch("SPARQL_GUARD_CACHE", *value);
        }
        if (auto value = non_empty(lookup, "SPARQL_GUARD_LOG_LEVEL")) {
            settings.log_level_ = string_utils::to_lower(*value);
        }

        return settings;
    }

    bool http2_enabled(const Settings& settings, bool curl_supports_http2) {
        switch (settings.http2_) {
            case Http2Mode::ON:
                return true;
            case Http2Mode::OFF:
                return false;
            case Http2Mode::AUTO:
                return curl_supports_http2;
        }
        return false;
    }
}  // namespace config
