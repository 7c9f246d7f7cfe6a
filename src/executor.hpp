#pragma once

#include "cancellation.hpp"
#include "error.hpp"
#include "metrics.hpp"
#include "models.hpp"
#include "request.hpp"
#include "transport.hpp"

#include <future>
#include <optional>
#include <variant>

#include <nlohmann/json.hpp>

namespace notion_sync {

/// Terminal result of one logical call.
struct Outcome {
    struct Success {
        nlohmann::json body;
        ResponseMeta   meta;
    };
    struct Failure {
        ClassifiedError             error;
        std::optional<ResponseMeta> meta;  // set for HttpError
    };
    struct Cancelled {
        CancelReason reason = CancelReason::Cancelled;
    };

    std::variant<Success, Failure, Cancelled> value;
    int                                       attempts = 0;

    bool ok() const { return std::holds_alternative<Success>(value); }
    bool cancelled() const { return std::holds_alternative<Cancelled>(value); }

    const Success*   success() const { return std::get_if<Success>(&value); }
    const Failure*   failure() const { return std::get_if<Failure>(&value); }
    const Cancelled* cancellation() const { return std::get_if<Cancelled>(&value); }
};

/// Shared, lazily-started handle to one logical call.
///
/// The call runs on the first access through any accessor, on the accessing
/// thread; every later access, from this handle or any copy of it, sees the
/// same memoized Outcome.  The network is never hit twice for one attempt no
/// matter how many consumers look at the result.
class CallHandle {
public:
    explicit CallHandle(std::shared_future<Outcome> future)
        : mFuture(std::move(future)) {}

    const Outcome& outcome() const { return mFuture.get(); }

    /// Parsed payload.
    /// @throws RequestError on failure, OperationCancelled on cancellation.
    const nlohmann::json& data() const;

    /// Status and headers.  A failed call without a response yields
    /// status 0 with reason "Request failed" instead of throwing.
    ResponseMeta raw() const;

private:
    std::shared_future<Outcome> mFuture;
};

/// Executes one logical HTTP call: per-call timeout, error classification,
/// exponential-backoff retry, and reporter updates at every transition.
class TransportExecutor {
public:
    explicit TransportExecutor(HttpTransport& transport, bool verbose = false);

    /// Deferred execution; nothing is sent until the handle is first read.
    /// @p reporter and @p signal are borrowed and must outlive the handle's
    /// first access.
    CallHandle execute(RequestDescriptor descriptor,
                       MetricsReporter& reporter,
                       CancellationSignal& signal);

    /// Run the call to completion on the calling thread.
    Outcome run(const RequestDescriptor& descriptor,
                MetricsReporter& reporter,
                CancellationSignal& signal);

    void setVerbose(bool v) { mVerbose = v; }

private:
    HttpTransport& mTransport;
    bool           mVerbose;

    /// One attempt.  Returns the Outcome when it is terminal by itself
    /// (success or cancellation), otherwise the classified error.
    std::variant<Outcome, Outcome::Failure> attempt(const RequestDescriptor& descriptor,
                                                    CancellationSignal& signal);
};

/// Serialize a descriptor into the wire request.
HttpRequest toHttpRequest(const RequestDescriptor& descriptor);

/// Record a fired signal on the reporter: sets the cancelled flag, and for
/// an expired deadline also stage timeout with an explanatory message.
void reportCancellation(MetricsReporter& reporter, const CancellationSignal& signal);

} // namespace notion_sync
