#pragma once

#include "transport.hpp"

#include <string>

namespace notion_sync {

/// HTTP/1.1 transport built on Boost.Beast.
///
/// Every send() runs on its own single-threaded io_context.  The exchange
/// (resolve, connect, TLS handshake, write, read) is raced against a steady
/// timer for the per-call timeout and against the cancellation signal; the
/// loser is cancelled, which aborts the in-flight socket operations.
class HttpClient : public HttpTransport {
public:
    /// @param baseUrl  e.g. "https://api.notion.com/v1".  Request targets are
    ///                 appended to its path.
    /// @throws std::invalid_argument on a malformed URL, std::runtime_error
    ///         for https when built without OpenSSL.
    explicit HttpClient(const std::string& baseUrl, bool verbose = false);

    RawResponse send(const HttpRequest& request,
                     std::optional<std::chrono::milliseconds> timeout,
                     CancellationSignal& signal) override;

    void setVerbose(bool v) { mVerbose = v; }

private:
    std::string mHost;
    std::string mPort;
    std::string mPrefix;
    bool        mVerbose = false;
    bool        mUseSsl  = false;

    RawResponse doHttpRequest(const HttpRequest& request,
                              std::optional<std::chrono::milliseconds> timeout,
                              CancellationSignal& signal);
    RawResponse doHttpsRequest(const HttpRequest& request,
                               std::optional<std::chrono::milliseconds> timeout,
                               CancellationSignal& signal);
};

} // namespace notion_sync
