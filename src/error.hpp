#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace notion_sync {

/// Transport-level failure: DNS, connection refused, reset, TLS.
struct NetworkError {
    std::string message;
};

/// The per-call timeout elapsed before a response arrived.
struct TimeoutError {
    std::chrono::milliseconds after{0};
    std::string               message;
};

/// Non-2xx response.  @c body is the parsed JSON error body when the server
/// sent one, otherwise {"message": <raw text or synthesized text>}.
struct HttpError {
    unsigned int   status = 0;
    nlohmann::json body;
    std::string    message;
};

/// A 2xx response whose body could not be parsed.
struct Unclassified {
    std::string message;
};

using ClassifiedError = std::variant<NetworkError, TimeoutError, HttpError, Unclassified>;

/// Only network errors, timeouts and HTTP 502/503/504 are worth retrying.
bool isRetryable(const ClassifiedError& error);

/// Human-readable description, e.g. "HTTP 404: object not found".
std::string describe(const ClassifiedError& error);

/// Status code for HttpError, 0 for everything else.
unsigned int statusOf(const ClassifiedError& error);

/// Why a cancellation signal fired.
enum class CancelReason {
    None,
    Cancelled,         // explicit caller cancel
    DeadlineExceeded,  // global operation timer
};

const char* toString(CancelReason reason);

/// Thrown by transports.  Converted into a ClassifiedError by the executor
/// as soon as it is caught; nothing else should look at it.
class TransportError : public std::runtime_error {
public:
    enum class Kind {
        Network,
        Timeout,
        Aborted,
    };

    TransportError(Kind kind, const std::string& what)
        : std::runtime_error(what), mKind(kind) {}

    Kind kind() const { return mKind; }

private:
    Kind mKind;
};

/// Thrown by the throwing accessors when a call ended in a terminal failure.
class RequestError : public std::runtime_error {
public:
    explicit RequestError(ClassifiedError error)
        : std::runtime_error(describe(error)), mError(std::move(error)) {}

    const ClassifiedError& error() const { return mError; }
    unsigned int status() const { return statusOf(mError); }

private:
    ClassifiedError mError;
};

/// Thrown by the throwing accessors when the operation was cancelled.
class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(CancelReason reason)
        : std::runtime_error(std::string("operation cancelled: ") + toString(reason))
        , mReason(reason) {}

    CancelReason reason() const { return mReason; }

private:
    CancelReason mReason;
};

} // namespace notion_sync
