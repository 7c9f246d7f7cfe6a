#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace notion_sync {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "4000", etc.
    std::string target;   // path component (e.g. "/v1")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Upper bound for a single backoff delay.
inline constexpr std::chrono::milliseconds kMaxBackoff{60000};

/// Exponential backoff: base * 2^attempt, clamped to @p max.
/// attempt is 0-based.  Non-decreasing in attempt.
std::chrono::milliseconds computeBackoff(std::chrono::milliseconds base,
                                         int attempt,
                                         std::chrono::milliseconds max = kMaxBackoff);

/// Percent-encode everything outside RFC 3986 unreserved characters.
std::string urlEncode(const std::string& value);

/// Set (or replace) one query-string parameter on a path.
std::string setQueryParam(const std::string& path,
                          const std::string& key,
                          const std::string& value);

std::string toUpper(std::string s);

} // namespace notion_sync
