#ifndef SPARQL_GUARD_SETTINGS_HPP
#define SPARQL_GUARD_SETTINGS_HPP

#include <functional>
#include <optional>
#include <string>

namespace config {
    enum class Http2Mode { AUTO, ON, OFF };

    struct Settings {
        std::string user_agent_ = "sparql_guard/1.0 (libcurl)";
        Http2Mode http2_ = Http2Mode::AUTO;
        std::string wikidata_sparql_url_ = "https://query.wikidata.org/sparql";
        std::string wikidata_api_url_ = "https://www.wikidata.org/w/api.php";
        std::string rhea_sparql_url_ = "https://sparql.rhea-db.org/sparql";
        bool cache_enabled_ = true;
        std::string log_level_ = "info";
    };

    // Returns nullopt for unset variables.
    using EnvLookup = std::function<std::optional<std::string>(const char*)>;

    [[nodiscard]] std::optional<std::string> process_env(const char* name);

    // Unset or empty variables keep their defaults. Throws
    // std::invalid_argument for values it cannot read.
    [[nodiscard]] Settings load_settings(const EnvLookup& lookup = process_env);

    // AUTO resolves to whatever the linked libcurl supports.
    [[nodiscard]] bool http2_enabled(const Settings& settings, bool curl_supports_http2);
}  // namespace config

#endif
