#include "http_client.hpp"
#include "util.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#ifdef NOTION_SYNC_HAS_SSL
#include <boost/asio/ssl.hpp>
#include <boost/beast/ssl.hpp>
#endif

#include <functional>
#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace notion_sync {

namespace {

http::verb toVerb(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return http::verb::get;
        case HttpMethod::Post:   return http::verb::post;
        case HttpMethod::Put:    return http::verb::put;
        case HttpMethod::Patch:  return http::verb::patch;
        case HttpMethod::Delete: return http::verb::delete_;
    }
    return http::verb::get;
}

http::request<http::string_body> buildRequest(const HttpRequest& request,
                                              const std::string& host,
                                              const std::string& prefix) {
    http::request<http::string_body> req{toVerb(request.method),
                                         prefix + request.target, 11};
    req.set(http::field::host, host);
    req.set(http::field::accept, "application/json");
    req.set(http::field::user_agent, "notion_sync/1.0");
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    if (!request.body.empty()) {
        req.body() = request.body;
    }
    req.prepare_payload();
    return req;
}

RawResponse toRawResponse(http::response<http::string_body>& res) {
    RawResponse raw;
    raw.meta.status = res.result_int();
    raw.meta.reason = std::string(res.reason());
    for (const auto& field : res) {
        raw.meta.headers[std::string(field.name_string())] = std::string(field.value());
    }
    raw.body = std::move(res.body());
    return raw;
}

/// Drive one exchange on @p ioc, racing it against the timer and the signal.
/// @p handshake is invoked after connect and must call its continuation.
template <class Stream, class Handshake>
http::response<http::string_body>
raceExchange(net::io_context& ioc,
             Stream& stream,
             Handshake handshake,
             const std::string& host,
             const std::string& port,
             http::request<http::string_body>& req,
             std::optional<std::chrono::milliseconds> timeout,
             CancellationSignal& signal)
{
    tcp::resolver     resolver(ioc);
    net::steady_timer timer(ioc);

    beast::flat_buffer                buffer;
    http::response<http::string_body> res;

    bool              done     = false;
    bool              timedOut = false;
    bool              aborted  = false;
    beast::error_code result;

    auto abortAll = [&] {
        resolver.cancel();
        beast::get_lowest_layer(stream).cancel();
    };
    auto finish = [&](beast::error_code ec) {
        if (done) return;
        if (!ec && (aborted || timedOut)) {
            ec = net::error::operation_aborted;
        }
        done   = true;
        result = ec;
        timer.cancel();
    };

    if (timeout) {
        timer.expires_after(*timeout);
        timer.async_wait([&](beast::error_code ec) {
            if (ec || done) return;
            timedOut = true;
            abortAll();
        });
    }

    // Cancellation can arrive from any thread; hop onto the loop first.
    auto registration = signal.onCancel([&] {
        net::post(ioc, [&] {
            if (done) return;
            aborted = true;
            abortAll();
        });
    });

    resolver.async_resolve(host, port,
        [&](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec || aborted || timedOut) return finish(ec);
            beast::get_lowest_layer(stream).async_connect(results,
                [&](beast::error_code ec, const tcp::endpoint&) {
                    if (ec || aborted || timedOut) return finish(ec);
                    handshake([&](beast::error_code ec) {
                        if (ec || aborted || timedOut) return finish(ec);
                        http::async_write(stream, req,
                            [&](beast::error_code ec, std::size_t) {
                                if (ec || aborted || timedOut) return finish(ec);
                                http::async_read(stream, buffer, res,
                                    [&](beast::error_code ec, std::size_t) {
                                        finish(ec);
                                    });
                            });
                    });
                });
        });

    ioc.run();
    registration.reset();

    if (aborted) {
        throw TransportError(TransportError::Kind::Aborted, "request aborted");
    }
    if (timedOut) {
        throw TransportError(TransportError::Kind::Timeout,
            "aborted request after " + std::to_string(timeout->count()) +
            "ms due to timeout");
    }
    if (result) {
        throw TransportError(TransportError::Kind::Network, result.message());
    }
    return res;
}

#ifdef NOTION_SYNC_HAS_SSL
/// Client TLS context verifying against the system trust store.
/// @throws TransportError (Network) when OpenSSL cannot set it up.
net::ssl::context makeTlsContext() {
    try {
        net::ssl::context ctx(net::ssl::context::tlsv12_client);
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(net::ssl::verify_peer);
        return ctx;
    } catch (const boost::system::system_error& e) {
        throw TransportError(TransportError::Kind::Network,
                             std::string("TLS setup failed: ") + e.what());
    }
}
#endif

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

HttpClient::HttpClient(const std::string& baseUrl, bool verbose)
    : mVerbose(verbose)
{
    auto parts = parseUrl(baseUrl);
    mHost   = parts.host;
    mPort   = parts.port;
    mPrefix = parts.target;
    mUseSsl = (parts.scheme == "https");

    if (mUseSsl) {
#ifndef NOTION_SYNC_HAS_SSL
        throw std::runtime_error(
            "HTTPS endpoint requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
#endif
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

RawResponse HttpClient::send(const HttpRequest& request,
                             std::optional<std::chrono::milliseconds> timeout,
                             CancellationSignal& signal)
{
    if (mVerbose) {
        std::cerr << "[HttpClient] " << toString(request.method) << " "
                  << mHost << ":" << mPort << mPrefix << request.target << "\n";
        if (!request.body.empty()) {
            if (request.body.size() <= 300) {
                std::cerr << "[HttpClient] Body: " << request.body << "\n";
            } else {
                std::cerr << "[HttpClient] Body: " << request.body.substr(0, 300)
                          << " ...(truncated)\n";
            }
        }
    }

    return mUseSsl ? doHttpsRequest(request, timeout, signal)
                   : doHttpRequest(request, timeout, signal);
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

RawResponse HttpClient::doHttpRequest(const HttpRequest& request,
                                      std::optional<std::chrono::milliseconds> timeout,
                                      CancellationSignal& signal)
{
    net::io_context   ioc;
    beast::tcp_stream stream(ioc);

    auto req = buildRequest(request, mHost, mPrefix);
    auto noHandshake = [](std::function<void(beast::error_code)> next) {
        next(beast::error_code{});
    };

    auto res = raceExchange(ioc, stream, noHandshake, mHost, mPort, req, timeout, signal);

    if (mVerbose) {
        std::cerr << "[HttpClient] HTTP " << res.result_int() << "\n";
    }

    // Graceful shutdown (non-critical errors are swallowed).
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return toRawResponse(res);
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

RawResponse HttpClient::doHttpsRequest(const HttpRequest& request,
                                       std::optional<std::chrono::milliseconds> timeout,
                                       CancellationSignal& signal)
{
#ifdef NOTION_SYNC_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    ctx = makeTlsContext();

    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), mHost.c_str())) {
        throw TransportError(TransportError::Kind::Network,
                             "Failed to set SNI hostname");
    }

    auto req = buildRequest(request, mHost, mPrefix);
    auto tlsHandshake = [&stream](std::function<void(beast::error_code)> next) {
        stream.async_handshake(ssl::stream_base::client, std::move(next));
    };

    auto res = raceExchange(ioc, stream, tlsHandshake, mHost, mPort, req, timeout, signal);

    if (mVerbose) {
        std::cerr << "[HttpClient] HTTPS " << res.result_int() << "\n";
    }

    // The response is complete; skip close_notify and drop the socket.
    beast::error_code ec;
    beast::get_lowest_layer(stream).socket().close(ec);

    return toRawResponse(res);
#else
    (void)request;
    (void)timeout;
    (void)signal;
    throw std::runtime_error("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace notion_sync
