#include "pagination.hpp"
#include "mapping.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace notion_sync {

const char* toString(StopReason reason) {
    switch (reason) {
        case StopReason::PageLimit:   return "page limit";
        case StopReason::ResultLimit: return "result limit";
        case StopReason::Exhausted:   return "no more pages";
    }
    return "unknown";
}

const char* toString(RunStatus status) {
    switch (status) {
        case RunStatus::Running:          return "running";
        case RunStatus::Complete:         return "complete";
        case RunStatus::Failed:           return "failed";
        case RunStatus::Cancelled:        return "cancelled";
        case RunStatus::DeadlineExceeded: return "deadline exceeded";
    }
    return "unknown";
}

std::optional<StopReason> evaluateStop(const PaginationState& state,
                                       const PaginationLimits& limits,
                                       const Page& page) {
    if (limits.pages && state.requestsIssued >= *limits.pages) {
        return StopReason::PageLimit;
    }
    if (limits.results && state.resultsAccumulated >= *limits.results) {
        return StopReason::ResultLimit;
    }
    if (!page.hasMore || !page.nextCursor || page.nextCursor->empty()) {
        return StopReason::Exhausted;
    }
    return std::nullopt;
}

void trimToLimit(Page& page, int accumulatedBefore, const PaginationLimits& limits) {
    if (!limits.results) {
        return;
    }
    const int remaining = std::max(0, *limits.results - accumulatedBefore);
    if (static_cast<int>(page.results.size()) <= remaining) {
        return;
    }

    page.results.resize(static_cast<std::size_t>(remaining));
    if (page.payload.is_object() && page.payload.contains("results") &&
        page.payload["results"].is_array()) {
        page.payload["results"] = page.results;
    }
}

// ---------------------------------------------------------------------------
// PageStream
// ---------------------------------------------------------------------------

PageStream::PageStream(TransportExecutor& executor,
                       RequestDescriptor initial,
                       PaginationLimits limits,
                       MetricsReporter& reporter,
                       CancellationSignal& signal,
                       bool verbose)
    : mExecutor(&executor)
    , mInitial(std::move(initial))
    , mLimits(limits)
    , mReporter(&reporter)
    , mSignal(&signal)
    , mVerbose(verbose) {}

std::optional<Page> PageStream::next() {
    if (mStatus != RunStatus::Running) {
        return std::nullopt;
    }
    if (mSignal->poll()) {
        finishCancelled();
        return std::nullopt;
    }

    RequestDescriptor descriptor = (mState.requestsIssued == 0)
        ? mInitial
        : mInitial.withCursor(*mState.nextCursor);

    if (mVerbose) {
        std::cerr << "[Paginator] Fetching page " << (mState.requestsIssued + 1);
        if (mState.nextCursor) std::cerr << ", cursor=" << *mState.nextCursor;
        std::cerr << "\n";
    }

    CallHandle     call    = mExecutor->execute(std::move(descriptor), *mReporter, *mSignal);
    const Outcome& outcome = call.outcome();

    if (outcome.cancelled()) {
        finishCancelled();
        return std::nullopt;
    }
    if (const auto* failure = outcome.failure()) {
        mStatus = RunStatus::Failed;
        mError  = failure->error;
        if (mVerbose) {
            std::cerr << "[Paginator] Fatal error after retries: "
                      << describe(failure->error) << "\n";
        }
        return std::nullopt;
    }

    const auto* success = outcome.success();
    if (!success->body.is_object()) {
        failMalformed("list response is not a JSON object: " + success->body.dump());
        return std::nullopt;
    }

    Page page;
    try {
        page = parsePage(success->body, success->meta);
    } catch (const nlohmann::json::exception& e) {
        failMalformed(std::string("malformed list response: ") + e.what());
        return std::nullopt;
    }

    trimToLimit(page, mState.resultsAccumulated, mLimits);

    const int count = static_cast<int>(page.results.size());
    ++mState.requestsIssued;
    mState.resultsAccumulated += count;
    mState.nextCursor = page.nextCursor;

    mReporter->apply([count, cursor = page.nextCursor](MetricsSnapshot& s) {
        s.stage = Stage::Paginating;
        s.requests += 1;
        s.items += count;
        s.cursor = cursor;
    });

    if (mVerbose) {
        std::cerr << "[Paginator] Got " << count << " results (total so far: "
                  << mState.resultsAccumulated << ")\n";
    }

    if (auto reason = evaluateStop(mState, mLimits, page)) {
        mStopReason = reason;
        mStatus     = RunStatus::Complete;
        mReporter->setStage(Stage::Complete,
            "pagination ended with " + std::to_string(mState.resultsAccumulated) +
            " results from " + std::to_string(mState.requestsIssued) + " pages");
        if (mVerbose) {
            std::cerr << "[Paginator] Stopping: " << toString(*reason) << "\n";
        }
    } else {
        mReporter->setStage(Stage::Requesting);
    }

    return page;
}

std::vector<Page> PageStream::collect() {
    std::vector<Page> pages;
    while (auto page = next()) {
        pages.push_back(std::move(*page));
    }
    return pages;
}

void PageStream::rethrowIfFailed() const {
    if (mStatus == RunStatus::Failed && mError) {
        throw RequestError(*mError);
    }
    if (mStatus == RunStatus::DeadlineExceeded) {
        throw OperationCancelled(CancelReason::DeadlineExceeded);
    }
}

void PageStream::failMalformed(const std::string& message) {
    mStatus = RunStatus::Failed;
    mError  = Unclassified{message};

    // Counted here because the executor saw a successful exchange.
    mReporter->apply([&message](MetricsSnapshot& s) {
        ++s.errors;
        s.stage   = Stage::Error;
        s.message = "unclassified error: " + message;
    });

    if (mVerbose) {
        std::cerr << "[Paginator] " << message << "\n";
    }
}

void PageStream::finishCancelled() {
    mStatus = (mSignal->reason() == CancelReason::DeadlineExceeded)
        ? RunStatus::DeadlineExceeded
        : RunStatus::Cancelled;
    reportCancellation(*mReporter, *mSignal);

    if (mVerbose) {
        std::cerr << "[Paginator] Run " << toString(mStatus) << " after "
                  << mState.requestsIssued << " pages\n";
    }
}

// ---------------------------------------------------------------------------
// Paginator
// ---------------------------------------------------------------------------

Paginator::Paginator(TransportExecutor& executor, bool verbose)
    : mExecutor(executor)
    , mVerbose(verbose) {}

PageStream Paginator::paginate(RequestDescriptor initial,
                               PaginationLimits limits,
                               MetricsReporter& reporter,
                               CancellationSignal& signal) const
{
    if (limits.pages && *limits.pages < 1) {
        throw std::invalid_argument("pages limit must be >= 1");
    }
    if (limits.results && *limits.results < 1) {
        throw std::invalid_argument("results limit must be >= 1");
    }
    return PageStream(mExecutor, std::move(initial), limits, reporter, signal, mVerbose);
}

} // namespace notion_sync
