#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace notion_sync {

enum class HttpMethod {
    Get,
    Post,
    Put,
    Patch,
    Delete,
};

const char* toString(HttpMethod method);

/// Case-insensitive.  Throws std::invalid_argument for anything else.
HttpMethod parseMethod(const std::string& name);

/// Where the pagination cursor travels on follow-up requests.
enum class CursorPlacement {
    Body,   // JSON body field, e.g. POST /search
    Query,  // query-string parameter, e.g. GET /pages/{id}/properties/{id}
};

/// Immutable input for one logical call.  Built at the configuration
/// boundary (HttpConfig::toDescriptor), which is where defaults are applied.
struct RequestDescriptor {
    std::string                              path;
    HttpMethod                               method = HttpMethod::Get;
    std::map<std::string, std::string>       headers;
    std::optional<nlohmann::json>            body;
    std::optional<std::chrono::milliseconds> timeout;
    int                                      retries = 0;
    std::chrono::milliseconds                backoff{0};

    std::string     cursorField     = "start_cursor";
    CursorPlacement cursorPlacement = CursorPlacement::Body;

    /// Copy of this descriptor resuming at @p cursor.
    RequestDescriptor withCursor(const std::string& cursor) const;
};

} // namespace notion_sync
