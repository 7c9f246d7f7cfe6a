#include "endpoints.hpp"

#include <stdexcept>

namespace notion_sync {

namespace {

const std::string& require(const std::map<std::string, std::string>& values,
                           const std::string& key,
                           ResourceType type) {
    auto it = values.find(key);
    if (it == values.end() || it->second.empty()) {
        throw std::invalid_argument(std::string(toString(type)) +
                                    " requests require " + key);
    }
    return it->second;
}

} // namespace

const char* toString(ResourceType type) {
    switch (type) {
        case ResourceType::Database: return "database";
        case ResourceType::Page:     return "page";
        case ResourceType::Block:    return "block";
        case ResourceType::Property: return "property";
    }
    return "unknown";
}

ResourceType parseResourceType(const std::string& name) {
    if (name == "database") return ResourceType::Database;
    if (name == "page")     return ResourceType::Page;
    if (name == "block")    return ResourceType::Block;
    if (name == "property") return ResourceType::Property;
    throw std::invalid_argument("unknown resource type: " + name);
}

std::string endpointFor(ResourceType type, const std::map<std::string, std::string>& values) {
    switch (type) {
        case ResourceType::Database:
        case ResourceType::Page:
        case ResourceType::Block:
            return "/" + std::string(toString(type)) + "s/" +
                   require(values, "id", type);
        case ResourceType::Property:
            return "/pages/" + require(values, "page_id", type) +
                   "/properties/" + require(values, "property_id", type);
    }
    throw std::invalid_argument("unknown resource type");
}

} // namespace notion_sync
