#pragma once

#include "error.hpp"
#include "models.hpp"
#include "transport.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace notion_sync {

/// Parse a paginated list response ({"results": [...], "has_more": bool,
/// "next_cursor": string|null}) into a Page.
/// Missing pagination fields read as "no more pages"; a missing or non-array
/// "results" reads as an empty page.
Page parsePage(const nlohmann::json& payload, ResponseMeta meta = {});

/// Build the HttpError for a non-2xx response: JSON body first, then raw
/// text, then a synthesized "Unknown error (status: N)".
HttpError parseErrorResponse(const RawResponse& response);

/// Best human-readable message in an error body ("message" field, else the
/// dumped JSON).
std::string extractErrorMessage(const nlohmann::json& body);

} // namespace notion_sync
