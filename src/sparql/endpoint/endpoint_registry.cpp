#include "endpoint_registry.hpp"

#include <stdexcept>
#include <utility>

namespace sparql::endpoint {
    void EndpointRegistry::add(EndpointClass endpoint_class) {
        if (endpoint_class.name_.empty()) {
            throw std::invalid_argument("Endpoint class name is required");
        }
        if (endpoint_class.sparql_url_.empty()) {
            throw std::invalid_argument("Endpoint class '" + endpoint_class.name_ + "' has no SPARQL url");
        }
        std::string name = endpoint_class.name_;
        classes_.insert_or_assign(std::move(name), std::move(endpoint_class));
    }

    std::optional<EndpointClass> EndpointRegistry::find(const std::string& name) const {
        auto it = classes_.find(name);
        if (it == classes_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<std::string> EndpointRegistry::names() const {
        std::vector<std::string> out;
        out.reserve(classes_.size());
        for (const auto& [name, _] : classes_) {
            out.push_back(name);
        }
        return out;
    }
}  // namespace sparql::endpoint
