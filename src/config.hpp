#pragma once

#include "models.hpp"
#include "request.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace notion_sync {

inline constexpr const char*               kDefaultBaseUrl    = "https://api.notion.com/v1";
inline constexpr const char*               kDefaultApiVersion = "2022-06-28";
inline constexpr int                       kDefaultRetries    = 3;
inline constexpr std::chrono::milliseconds kDefaultBackoff{500};

/// Per-client HTTP settings.  Built once and passed by value; nothing in the
/// library reads process-wide defaults.
struct HttpConfig {
    std::string                              baseUrl    = kDefaultBaseUrl;
    std::optional<HttpMethod>                method;
    std::map<std::string, std::string>       headers;
    std::optional<std::chrono::milliseconds> timeout;
    int                                      retries    = kDefaultRetries;
    std::chrono::milliseconds                backoff    = kDefaultBackoff;
    std::optional<nlohmann::json>            body;
    std::optional<std::string>               token;
    std::string                              apiVersion = kDefaultApiVersion;

    /// Default headers, then caller headers, then the bearer token.
    std::map<std::string, std::string> mergedHeaders() const;

    /// Apply boundary defaults (GET when no method is configured) and build
    /// the descriptor for @p path.
    /// Throws std::invalid_argument if retries or backoff are negative.
    RequestDescriptor toDescriptor(const std::string& path) const;
    RequestDescriptor toDescriptor(const std::string& path, HttpMethod method) const;
};

/// Settings for one operation as a whole.
struct OperatorConfig {
    /// Bounds the entire operation (every page, retry and backoff).
    std::optional<std::chrono::milliseconds> timeout;
    PaginationLimits                         limits;
};

} // namespace notion_sync
