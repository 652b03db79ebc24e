#ifndef SPARQL_GUARD_ENDPOINT_REGISTRY_HPP
#define SPARQL_GUARD_ENDPOINT_REGISTRY_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sparql::endpoint {
    inline constexpr const char* WIKIDATA = "wikidata";
    inline constexpr const char* RHEA = "rhea";

    struct EndpointClass {
        std::string name_;
        std::string sparql_url_;
        // Grounding is all-or-nothing: entity and property ids are both
        // checked, or neither is.
        bool requires_grounding_ = false;
    };

    class EndpointRegistry {
       public:
        void add(EndpointClass endpoint_class);
        [[nodiscard]] std::optional<EndpointClass> find(const std::string& name) const;
        [[nodiscard]] std::vector<std::string> names() const;

       private:
        std::map<std::string, EndpointClass> classes_;
    };
}  // namespace sparql::endpoint

#endif
