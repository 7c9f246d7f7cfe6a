#include "request.hpp"
#include "util.hpp"

#include <stdexcept>

namespace notion_sync {

const char* toString(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Put:    return "PUT";
        case HttpMethod::Patch:  return "PATCH";
        case HttpMethod::Delete: return "DELETE";
    }
    return "GET";
}

HttpMethod parseMethod(const std::string& name) {
    const std::string upper = toUpper(name);
    if (upper == "GET")    return HttpMethod::Get;
    if (upper == "POST")   return HttpMethod::Post;
    if (upper == "PUT")    return HttpMethod::Put;
    if (upper == "PATCH")  return HttpMethod::Patch;
    if (upper == "DELETE") return HttpMethod::Delete;
    throw std::invalid_argument("Unsupported HTTP method: " + name);
}

RequestDescriptor RequestDescriptor::withCursor(const std::string& cursor) const {
    RequestDescriptor next = *this;

    if (cursorPlacement == CursorPlacement::Body) {
        nlohmann::json body = next.body.value_or(nlohmann::json::object());
        body[cursorField]   = cursor;
        next.body           = std::move(body);
    } else {
        next.path = setQueryParam(path, cursorField, cursor);
    }
    return next;
}

} // namespace notion_sync
