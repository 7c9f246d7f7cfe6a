#include "config.hpp"

#include <stdexcept>

namespace notion_sync {

std::map<std::string, std::string> HttpConfig::mergedHeaders() const {
    std::map<std::string, std::string> merged{
        {"Content-Type", "application/json"},
        {"Notion-Version", apiVersion},
    };
    for (const auto& [name, value] : headers) {
        merged[name] = value;
    }
    if (token && !token->empty()) {
        merged["Authorization"] = "Bearer " + *token;
    }
    return merged;
}

RequestDescriptor HttpConfig::toDescriptor(const std::string& path) const {
    return toDescriptor(path, method.value_or(HttpMethod::Get));
}

RequestDescriptor HttpConfig::toDescriptor(const std::string& path, HttpMethod m) const {
    if (retries < 0) {
        throw std::invalid_argument("retries must be >= 0");
    }
    if (backoff.count() < 0) {
        throw std::invalid_argument("backoff must be >= 0");
    }

    RequestDescriptor d;
    d.path    = path;
    d.method  = m;
    d.headers = mergedHeaders();
    d.body    = body;
    d.timeout = timeout;
    d.retries = retries;
    d.backoff = backoff;
    return d;
}

} // namespace notion_sync
