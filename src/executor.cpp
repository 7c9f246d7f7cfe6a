#include "executor.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>

namespace notion_sync {

// ---------------------------------------------------------------------------
// CallHandle
// ---------------------------------------------------------------------------

const nlohmann::json& CallHandle::data() const {
    const Outcome& result = outcome();
    if (const auto* success = result.success()) {
        return success->body;
    }
    if (const auto* failure = result.failure()) {
        throw RequestError(failure->error);
    }
    throw OperationCancelled(result.cancellation()->reason);
}

ResponseMeta CallHandle::raw() const {
    const Outcome& result = outcome();
    if (const auto* success = result.success()) {
        return success->meta;
    }
    if (const auto* failure = result.failure(); failure && failure->meta) {
        return *failure->meta;
    }
    ResponseMeta meta;
    meta.reason = "Request failed";
    return meta;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

HttpRequest toHttpRequest(const RequestDescriptor& descriptor) {
    HttpRequest request;
    request.method  = descriptor.method;
    request.target  = descriptor.path;
    request.headers = descriptor.headers;
    if (descriptor.body) {
        request.body = descriptor.body->dump();
    }
    return request;
}

void reportCancellation(MetricsReporter& reporter, const CancellationSignal& signal) {
    const CancelReason reason = signal.reason();
    const auto         budget = signal.deadlineBudget();

    reporter.apply([reason, budget](MetricsSnapshot& s) {
        s.cancelled = true;
        if (reason == CancelReason::DeadlineExceeded) {
            s.stage   = Stage::Timeout;
            s.message = "operation timed out after " +
                        std::to_string(budget ? budget->count() : 0) + "ms";
        }
    });
}

// ---------------------------------------------------------------------------
// TransportExecutor
// ---------------------------------------------------------------------------

TransportExecutor::TransportExecutor(HttpTransport& transport, bool verbose)
    : mTransport(transport)
    , mVerbose(verbose) {}

CallHandle TransportExecutor::execute(RequestDescriptor descriptor,
                                      MetricsReporter& reporter,
                                      CancellationSignal& signal)
{
    auto future = std::async(std::launch::deferred,
        [this, descriptor = std::move(descriptor), &reporter, &signal] {
            return run(descriptor, reporter, signal);
        });
    return CallHandle(future.share());
}

Outcome TransportExecutor::run(const RequestDescriptor& descriptor,
                               MetricsReporter& reporter,
                               CancellationSignal& signal)
{
    int attempts = 0;

    auto cancelled = [&] {
        reportCancellation(reporter, signal);
        Outcome out{Outcome::Cancelled{signal.reason()}, attempts};
        return out;
    };

    while (true) {
        if (signal.poll()) {
            return cancelled();
        }

        reporter.setStage(Stage::Requesting);
        ++attempts;

        auto result = attempt(descriptor, signal);
        if (auto* terminal = std::get_if<Outcome>(&result)) {
            terminal->attempts = attempts;
            if (terminal->cancelled()) {
                return cancelled();
            }
            reporter.setStage(Stage::Complete);
            return std::move(*terminal);
        }

        auto& failure = std::get<Outcome::Failure>(result);
        const std::string cause = describe(failure.error);

        // Single place where a failed attempt is counted.
        reporter.apply([](MetricsSnapshot& s) { ++s.errors; });

        const int retriesUsed = attempts - 1;
        if (!isRetryable(failure.error) || retriesUsed >= descriptor.retries) {
            const Stage stage = std::holds_alternative<TimeoutError>(failure.error)
                ? Stage::Timeout : Stage::Error;
            reporter.setStage(stage, cause);

            if (mVerbose) {
                std::cerr << "[Executor] " << toString(descriptor.method) << " "
                          << descriptor.path << " failed after " << attempts
                          << " attempt(s): " << cause << "\n";
            }
            return Outcome{std::move(failure), attempts};
        }

        const auto delay = computeBackoff(descriptor.backoff, retriesUsed);
        reporter.setStage(Stage::Retrying,
            "retrying after " + std::to_string(delay.count()) + "ms: " + cause);

        if (mVerbose) {
            std::cerr << "[Executor] " << cause << ", attempt " << attempts << "/"
                      << (descriptor.retries + 1) << ", backoff "
                      << delay.count() << " ms\n";
        }

        if (!signal.waitFor(delay)) {
            return cancelled();
        }
    }
}

std::variant<Outcome, Outcome::Failure>
TransportExecutor::attempt(const RequestDescriptor& descriptor, CancellationSignal& signal)
{
    // The per-call timeout never outlives the operation deadline.
    std::optional<std::chrono::milliseconds> timeout = descriptor.timeout;
    bool deadlineBound = false;
    if (auto left = signal.remaining()) {
        deadlineBound = !timeout || *left < *timeout;
        timeout       = deadlineBound ? *left : *timeout;
    }

    // Nothing goes on the wire once the signal has fired.
    if (signal.poll()) {
        return Outcome{Outcome::Cancelled{signal.reason()}};
    }

    RawResponse response;
    try {
        response = mTransport.send(toHttpRequest(descriptor), timeout, signal);
    } catch (const TransportError& e) {
        switch (e.kind()) {
            case TransportError::Kind::Aborted:
                return Outcome{Outcome::Cancelled{signal.reason()}};
            case TransportError::Kind::Timeout: {
                // A deadline-bounded timer firing is cancellation, not a timeout.
                if (deadlineBound) {
                    signal.cancel(CancelReason::DeadlineExceeded);
                }
                if (signal.poll()) {
                    return Outcome{Outcome::Cancelled{signal.reason()}};
                }
                const auto after = descriptor.timeout.value_or(std::chrono::milliseconds(0));
                return Outcome::Failure{TimeoutError{after,
                    "aborted request after " + std::to_string(after.count()) +
                    "ms due to timeout"}, std::nullopt};
            }
            case TransportError::Kind::Network:
                if (signal.poll()) {
                    return Outcome{Outcome::Cancelled{signal.reason()}};
                }
                return Outcome::Failure{NetworkError{e.what()}, std::nullopt};
        }
        return Outcome::Failure{Unclassified{e.what()}, std::nullopt};
    } catch (const std::exception& e) {
        return Outcome::Failure{Unclassified{std::string("transport failure: ") + e.what()},
                                std::nullopt};
    }

    const unsigned int status = response.meta.status;
    if (status < 200 || status >= 300) {
        return Outcome::Failure{parseErrorResponse(response), response.meta};
    }

    if (status == 204 && response.body.empty()) {
        return Outcome{Outcome::Success{nlohmann::json(), std::move(response.meta)}};
    }

    try {
        auto body = nlohmann::json::parse(response.body);
        return Outcome{Outcome::Success{std::move(body), std::move(response.meta)}};
    } catch (const nlohmann::json::parse_error& e) {
        return Outcome::Failure{
            Unclassified{std::string("Failed to parse JSON response: ") + e.what()},
            response.meta};
    }
}

} // namespace notion_sync
