#include "mapping.hpp"

namespace notion_sync {

Page parsePage(const nlohmann::json& payload, ResponseMeta meta) {
    Page page;
    page.payload = payload;
    page.meta    = std::move(meta);

    if (!payload.is_object()) {
        return page;
    }

    // --- results ---
    auto results = payload.find("results");
    if (results != payload.end() && results->is_array()) {
        page.results.assign(results->begin(), results->end());
    }

    // --- cursor ---
    auto hasMore = payload.find("has_more");
    page.hasMore = hasMore != payload.end() && hasMore->is_boolean() && hasMore->get<bool>();
    auto cursor = payload.find("next_cursor");
    if (cursor != payload.end() && cursor->is_string()) {
        page.nextCursor = cursor->get<std::string>();
    }

    return page;
}

std::string extractErrorMessage(const nlohmann::json& body) {
    if (body.is_object()) {
        auto message = body.find("message");
        if (message != body.end() && message->is_string()) {
            return message->get<std::string>();
        }
    }
    if (body.is_string()) {
        return body.get<std::string>();
    }
    return body.dump();
}

HttpError parseErrorResponse(const RawResponse& response) {
    HttpError error;
    error.status = response.meta.status;

    try {
        error.body    = nlohmann::json::parse(response.body);
        error.message = extractErrorMessage(error.body);
    } catch (const nlohmann::json::parse_error&) {
        // Not JSON: fall back to the raw text.
        error.message = response.body.empty()
            ? "Unknown error (status: " + std::to_string(response.meta.status) + ")"
            : response.body;
        error.body = {{"message", error.message}};
    }
    return error;
}

} // namespace notion_sync
