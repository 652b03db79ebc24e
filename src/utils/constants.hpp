#ifndef SPARQL_GUARD_CONSTANTS_HPP
#define SPARQL_GUARD_CONSTANTS_HPP

namespace constants {
    inline constexpr int ASCII_LOWERCASE_BIT = 0x20;
    inline constexpr long SYNTHETIC_TRANSPORT_FAILURE_STATUS = 599;
    inline constexpr long HTTP_ERROR_LOWER_BOUNDARY = 400;
    inline constexpr const char* FORMAT_JSON = "json";
    inline constexpr const char* APPLICATION_JSON = "application/json";
    inline constexpr const char* SPARQL_RESULTS_JSON = "application/sparql-results+json";
    inline constexpr const char* FORM_URLENCODED = "application/x-www-form-urlencoded";
    inline constexpr const char* PING_QUERY = "SELECT (1 AS ?x) WHERE {} LIMIT 1";
}  // namespace constants

#endif
