#pragma once

#include <map>
#include <string>

namespace notion_sync {

enum class ResourceType {
    Database,
    Page,
    Block,
    Property,
};

const char* toString(ResourceType type);

/// Throws std::invalid_argument for unknown names.
ResourceType parseResourceType(const std::string& name);

inline constexpr const char* kSearchEndpoint = "/search";

/// Path for one resource.  Database, page and block need "id"; a property
/// needs "page_id" and "property_id".
/// @throws std::invalid_argument when a required value is missing.
std::string endpointFor(ResourceType type, const std::map<std::string, std::string>& values);

} // namespace notion_sync
