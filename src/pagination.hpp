#pragma once

#include "cancellation.hpp"
#include "error.hpp"
#include "executor.hpp"
#include "metrics.hpp"
#include "models.hpp"
#include "request.hpp"

#include <optional>
#include <string>
#include <vector>

namespace notion_sync {

/// Mutable progress of one pagination run.  Both counters only grow.
struct PaginationState {
    std::optional<std::string> nextCursor;
    int                        requestsIssued     = 0;
    int                        resultsAccumulated = 0;  // after trimming
};

enum class StopReason {
    PageLimit,
    ResultLimit,
    Exhausted,   // has_more false or no next cursor
};

const char* toString(StopReason reason);

enum class RunStatus {
    Running,
    Complete,
    Failed,
    Cancelled,
    DeadlineExceeded,
};

const char* toString(RunStatus status);

/// Stop conditions, checked in this order: page limit, result limit, end of
/// data.  @p state must already include @p page.
std::optional<StopReason> evaluateStop(const PaginationState& state,
                                       const PaginationLimits& limits,
                                       const Page& page);

/// Truncate @p page so that @p accumulatedBefore plus its result count does
/// not exceed limits.results.  The payload's "results" array is kept in step.
void trimToLimit(Page& page, int accumulatedBefore, const PaginationLimits& limits);

/// Pull-based stream of pages for one pagination run.
///
/// Each next() issues at most one request, and only after the previous one
/// has resolved, so pages arrive strictly in cursor order.  The signal is
/// checked before every request and honoured while a request is in flight;
/// a cancelled run simply ends, it is not a failure.
class PageStream {
public:
    PageStream(TransportExecutor& executor,
               RequestDescriptor initial,
               PaginationLimits limits,
               MetricsReporter& reporter,
               CancellationSignal& signal,
               bool verbose = false);

    /// Next page, or nullopt once the run has ended for any reason.
    std::optional<Page> next();

    /// Drain the remaining pages.
    std::vector<Page> collect();

    RunStatus                             status() const { return mStatus; }
    const PaginationState&                state() const { return mState; }
    std::optional<StopReason>             stopReason() const { return mStopReason; }
    const std::optional<ClassifiedError>& error() const { return mError; }

    /// @throws RequestError after a failure, OperationCancelled after the
    ///         deadline expired.  An explicit cancel does not throw.
    void rethrowIfFailed() const;

private:
    void failMalformed(const std::string& message);
    void finishCancelled();

    TransportExecutor*  mExecutor;
    RequestDescriptor   mInitial;
    PaginationLimits    mLimits;
    MetricsReporter*    mReporter;
    CancellationSignal* mSignal;
    bool                mVerbose;

    PaginationState                mState;
    RunStatus                      mStatus = RunStatus::Running;
    std::optional<StopReason>      mStopReason;
    std::optional<ClassifiedError> mError;
};

/// Orchestrates cursor-based pagination on top of the executor.
class Paginator {
public:
    explicit Paginator(TransportExecutor& executor, bool verbose = false);

    /// @throws std::invalid_argument if a limit is set to less than 1.
    PageStream paginate(RequestDescriptor initial,
                        PaginationLimits limits,
                        MetricsReporter& reporter,
                        CancellationSignal& signal) const;

private:
    TransportExecutor& mExecutor;
    bool               mVerbose;
};

} // namespace notion_sync
