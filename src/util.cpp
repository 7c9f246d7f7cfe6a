#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace notion_sync {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Invalid URL (unsupported scheme): " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find('/', hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
    }

    // The target is a prefix that endpoint paths are appended to.
    while (!parts.target.empty() && parts.target.back() == '/') {
        parts.target.pop_back();
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    if (parts.port.empty()) {
        throw std::invalid_argument("Invalid URL (empty port): " + url);
    }
    return parts;
}

std::chrono::milliseconds computeBackoff(std::chrono::milliseconds base,
                                         int attempt,
                                         std::chrono::milliseconds max) {
    if (base.count() <= 0) {
        return std::chrono::milliseconds(0);
    }
    attempt = std::max(attempt, 0);

    // Double step by step so large attempt numbers cannot overflow the shift.
    int64_t backoff = base.count();
    for (int i = 0; i < attempt && backoff < max.count(); ++i) {
        backoff *= 2;
    }
    return std::chrono::milliseconds(std::min<int64_t>(backoff, max.count()));
}

std::string urlEncode(const std::string& value) {
    static constexpr char kHex[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string setQueryParam(const std::string& path,
                          const std::string& key,
                          const std::string& value) {
    const std::string encoded = key + "=" + urlEncode(value);

    auto queryStart = path.find('?');
    if (queryStart == std::string::npos) {
        return path + "?" + encoded;
    }

    std::string base  = path.substr(0, queryStart);
    std::string query = path.substr(queryStart + 1);
    std::string rebuilt;
    bool        replaced = false;

    size_t pos = 0;
    while (pos <= query.size()) {
        auto amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        std::string param = query.substr(pos, amp - pos);

        if (!param.empty()) {
            auto eq = param.find('=');
            std::string name = param.substr(0, eq);
            if (!rebuilt.empty()) rebuilt += '&';
            if (name == key) {
                rebuilt += encoded;
                replaced = true;
            } else {
                rebuilt += param;
            }
        }
        pos = amp + 1;
    }

    if (!replaced) {
        if (!rebuilt.empty()) rebuilt += '&';
        rebuilt += encoded;
    }
    return base + "?" + rebuilt;
}

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace notion_sync
