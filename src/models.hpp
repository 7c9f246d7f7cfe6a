#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace notion_sync {

/// Status line and headers of a response, captured before the body is parsed.
struct ResponseMeta {
    unsigned int                       status = 0;
    std::string                        reason;
    std::map<std::string, std::string> headers;
};

/// One page of a cursor-paginated list endpoint.
struct Page {
    nlohmann::json              payload;      // full response body, results possibly trimmed
    std::vector<nlohmann::json> results;
    bool                        hasMore = false;
    std::optional<std::string>  nextCursor;
    ResponseMeta                meta;
};

/// Inclusive ceilings for one pagination run; unset means unbounded.
struct PaginationLimits {
    std::optional<int> pages;
    std::optional<int> results;
};

} // namespace notion_sync
