#pragma once

#include "cancellation.hpp"
#include "models.hpp"
#include "request.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace notion_sync {

/// Wire-level request, fully serialized.
struct HttpRequest {
    HttpMethod                         method = HttpMethod::Get;
    std::string                        target;   // path + query
    std::map<std::string, std::string> headers;
    std::string                        body;
};

struct RawResponse {
    ResponseMeta meta;
    std::string  body;
};

/// Performs exactly one network round-trip.
///
/// Implementations race the exchange against @p timeout (when set) and
/// against @p signal, and must return promptly once either fires.
///
/// @throws TransportError  Network on I/O failure, Timeout when @p timeout
///                         elapsed first, Aborted when @p signal fired first.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual RawResponse send(const HttpRequest& request,
                             std::optional<std::chrono::milliseconds> timeout,
                             CancellationSignal& signal) = 0;
};

} // namespace notion_sync
