/// @file test_pagination.cpp
/// Unit tests for pagination.hpp: stop conditions, trimming, cursor
/// propagation, failure and cancellation of a run.

#include "pagination.hpp"
#include "fake_transport.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <stdexcept>
#include <thread>

using namespace notion_sync;
using namespace std::chrono_literals;
using notion_sync::testing::FakeTransport;
using json = nlohmann::json;

namespace {

RequestDescriptor searchDescriptor() {
    RequestDescriptor d;
    d.method  = HttpMethod::Post;
    d.path    = "/search";
    d.body    = json{{"query", ""}};
    d.retries = 0;
    return d;
}

Page pageOf(int count, bool hasMore, std::optional<std::string> cursor) {
    Page page;
    page.payload    = FakeTransport::makePage(0, count, hasMore, cursor);
    page.results.assign(page.payload["results"].begin(), page.payload["results"].end());
    page.hasMore    = hasMore;
    page.nextCursor = cursor;
    return page;
}

class PaginationTest : public ::testing::Test {
protected:
    FakeTransport      transport;
    TransportExecutor  executor{transport};
    Paginator          paginator{executor};
    MetricsReporter    reporter;
    CancellationSignal signal;

    PageStream run(PaginationLimits limits = {}, RequestDescriptor d = searchDescriptor()) {
        return paginator.paginate(std::move(d), limits, reporter, signal);
    }
};

int totalResults(const std::vector<Page>& pages) {
    int total = 0;
    for (const auto& p : pages) total += static_cast<int>(p.results.size());
    return total;
}

} // namespace

// ============================================================================
// evaluateStop / trimToLimit
// ============================================================================

TEST(EvaluateStop, ContinuesWhileMoreData) {
    PaginationState state{std::string("c"), 1, 10};
    EXPECT_FALSE(evaluateStop(state, {}, pageOf(10, true, "c")).has_value());
}

TEST(EvaluateStop, ExhaustedWhenNoMore) {
    PaginationState state{std::nullopt, 1, 5};
    EXPECT_EQ(evaluateStop(state, {}, pageOf(5, false, std::nullopt)), StopReason::Exhausted);
}

TEST(EvaluateStop, ExhaustedWhenCursorMissingDespiteHasMore) {
    PaginationState state{std::nullopt, 1, 5};
    EXPECT_EQ(evaluateStop(state, {}, pageOf(5, true, std::nullopt)), StopReason::Exhausted);
}

TEST(EvaluateStop, PageLimitCheckedFirst) {
    PaginationState  state{std::nullopt, 2, 20};
    PaginationLimits limits{2, 20};
    EXPECT_EQ(evaluateStop(state, limits, pageOf(10, false, std::nullopt)), StopReason::PageLimit);
}

TEST(EvaluateStop, ResultLimitBeforeExhausted) {
    PaginationState  state{std::nullopt, 1, 20};
    PaginationLimits limits{std::nullopt, 20};
    EXPECT_EQ(evaluateStop(state, limits, pageOf(20, false, std::nullopt)), StopReason::ResultLimit);
}

TEST(TrimToLimit, TrimsLastPage) {
    Page page = pageOf(11, true, "c");
    trimToLimit(page, 22, PaginationLimits{std::nullopt, 25});
    EXPECT_EQ(page.results.size(), 3u);
    EXPECT_EQ(page.payload["results"].size(), 3u);
    EXPECT_EQ(page.results.front()["id"], "id-0");
}

TEST(TrimToLimit, NoLimitLeavesPageAlone) {
    Page page = pageOf(11, true, "c");
    trimToLimit(page, 100, {});
    EXPECT_EQ(page.results.size(), 11u);
}

// ============================================================================
// Full runs
// ============================================================================

TEST_F(PaginationTest, CollectsAllPagesUntilExhausted) {
    transport.pushPages({11, 11, 8});

    auto stream = run();
    auto pages  = stream.collect();

    EXPECT_EQ(pages.size(), 3u);
    EXPECT_EQ(totalResults(pages), 30);
    EXPECT_EQ(transport.calls(), 3);
    EXPECT_EQ(stream.status(), RunStatus::Complete);
    EXPECT_EQ(stream.stopReason(), StopReason::Exhausted);

    auto s = reporter.snapshot();
    EXPECT_EQ(s.stage, Stage::Complete);
    EXPECT_EQ(s.requests, 3);
    EXPECT_EQ(s.items, 30);
    EXPECT_EQ(s.errors, 0);
    EXPECT_FALSE(s.cursor.has_value());
    EXPECT_EQ(s.message, "pagination ended with 30 results from 3 pages");
}

TEST_F(PaginationTest, PagesArriveInCursorOrder) {
    transport.pushPages({2, 2, 2});

    auto pages = run().collect();
    ASSERT_EQ(pages.size(), 3u);
    EXPECT_EQ(pages[0].results[0]["id"], "id-0");
    EXPECT_EQ(pages[1].results[0]["id"], "id-2");
    EXPECT_EQ(pages[2].results[0]["id"], "id-4");
}

TEST_F(PaginationTest, ResultLimitTrimsFinalPage) {
    transport.pushPages({11, 11, 11, 11});

    auto stream = run(PaginationLimits{std::nullopt, 25});
    auto pages  = stream.collect();

    ASSERT_EQ(pages.size(), 3u);
    EXPECT_EQ(pages[2].results.size(), 3u);
    EXPECT_EQ(totalResults(pages), 25);
    EXPECT_EQ(transport.calls(), 3);
    EXPECT_EQ(stream.stopReason(), StopReason::ResultLimit);
    EXPECT_EQ(stream.state().resultsAccumulated, 25);
    EXPECT_EQ(reporter.snapshot().items, 25);
}

TEST_F(PaginationTest, PageLimitStopsEarly) {
    transport.pushPages({5, 5, 5});

    auto stream = run(PaginationLimits{2, std::nullopt});
    auto pages  = stream.collect();

    EXPECT_EQ(pages.size(), 2u);
    EXPECT_EQ(transport.calls(), 2);
    EXPECT_EQ(stream.stopReason(), StopReason::PageLimit);
    EXPECT_EQ(reporter.snapshot().cursor, "cursor-2");
}

TEST_F(PaginationTest, SinglePageWithoutMore) {
    transport.pushJson(200, FakeTransport::makePage(0, 4, false, std::nullopt));

    auto stream = run();
    EXPECT_EQ(stream.collect().size(), 1u);
    EXPECT_EQ(stream.status(), RunStatus::Complete);
}

TEST_F(PaginationTest, NullCursorEndsRunEvenWhenHasMore) {
    transport.pushJson(200, FakeTransport::makePage(0, 4, true, std::nullopt));
    transport.pushPages({4});

    auto stream = run();
    EXPECT_EQ(stream.collect().size(), 1u);
    EXPECT_EQ(transport.calls(), 1);
}

TEST_F(PaginationTest, CursorTravelsInBody) {
    transport.pushPages({1, 1, 1});
    run().collect();

    auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_FALSE(json::parse(requests[0].body).contains("start_cursor"));
    EXPECT_EQ(json::parse(requests[1].body)["start_cursor"], "cursor-1");
    EXPECT_EQ(json::parse(requests[2].body)["start_cursor"], "cursor-2");
    EXPECT_EQ(json::parse(requests[2].body)["query"], "");
    for (const auto& r : requests) {
        EXPECT_EQ(r.target, "/search");
        EXPECT_EQ(r.method, HttpMethod::Post);
    }
}

TEST_F(PaginationTest, CursorTravelsInQuery) {
    transport.pushPages({1, 1});

    RequestDescriptor d;
    d.path            = "/pages/p1/properties/title";
    d.cursorPlacement = CursorPlacement::Query;
    run({}, d).collect();

    auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].target, "/pages/p1/properties/title");
    EXPECT_EQ(requests[1].target, "/pages/p1/properties/title?start_cursor=cursor-1");
    EXPECT_TRUE(requests[1].body.empty());
}

TEST_F(PaginationTest, PullBasedStreamIssuesOneRequestPerNext) {
    transport.pushPages({3, 3, 3});

    auto stream = run();
    EXPECT_EQ(transport.calls(), 0);
    ASSERT_TRUE(stream.next().has_value());
    EXPECT_EQ(transport.calls(), 1);
    ASSERT_TRUE(stream.next().has_value());
    EXPECT_EQ(transport.calls(), 2);
    EXPECT_EQ(stream.status(), RunStatus::Running);
    EXPECT_EQ(reporter.snapshot().stage, Stage::Requesting);
}

TEST_F(PaginationTest, InvalidLimitsRejected) {
    EXPECT_THROW(run(PaginationLimits{0, std::nullopt}), std::invalid_argument);
    EXPECT_THROW(run(PaginationLimits{std::nullopt, 0}), std::invalid_argument);
    EXPECT_THROW(run(PaginationLimits{-1, std::nullopt}), std::invalid_argument);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(PaginationTest, RetryWithinPaginationIsTransparent) {
    transport.pushJson(200, FakeTransport::makePage(0, 2, true, std::string("cursor-1")));
    transport.pushResponse(503, "busy");
    transport.pushJson(200, FakeTransport::makePage(2, 2, false, std::nullopt));

    auto d    = searchDescriptor();
    d.retries = 2;
    d.backoff = 1ms;

    auto stream = run({}, d);
    auto pages  = stream.collect();

    EXPECT_EQ(pages.size(), 2u);
    EXPECT_EQ(stream.status(), RunStatus::Complete);
    EXPECT_EQ(transport.calls(), 3);

    auto s = reporter.snapshot();
    EXPECT_EQ(s.requests, 2);
    EXPECT_EQ(s.errors, 1);
    EXPECT_EQ(s.stage, Stage::Complete);

    // The retried request resumes at the same cursor.
    auto requests = transport.requests();
    EXPECT_EQ(json::parse(requests[1].body)["start_cursor"], "cursor-1");
    EXPECT_EQ(json::parse(requests[2].body)["start_cursor"], "cursor-1");
}

TEST_F(PaginationTest, TerminalFailureEndsRun) {
    transport.pushJson(200, FakeTransport::makePage(0, 5, true, std::string("cursor-1")));
    transport.pushJson(400, {{"object", "error"}, {"message", "invalid cursor"}});
    transport.pushPages({5});

    auto stream = run();
    auto pages  = stream.collect();

    EXPECT_EQ(pages.size(), 1u);
    EXPECT_EQ(transport.calls(), 2);
    EXPECT_EQ(stream.status(), RunStatus::Failed);
    ASSERT_TRUE(stream.error().has_value());
    EXPECT_EQ(statusOf(*stream.error()), 400u);
    EXPECT_FALSE(stream.next().has_value());

    try {
        stream.rethrowIfFailed();
        FAIL() << "expected RequestError";
    } catch (const RequestError& e) {
        EXPECT_EQ(e.status(), 400u);
    }

    auto s = reporter.snapshot();
    EXPECT_EQ(s.stage, Stage::Error);
    EXPECT_EQ(s.errors, 1);
    EXPECT_EQ(s.items, 5);
}

TEST_F(PaginationTest, NullHasMoreEndsRunCleanly) {
    transport.pushResponse(200, R"({"results":[1,2],"has_more":null,"next_cursor":null})");
    transport.pushPages({2});

    auto stream = run();
    std::optional<Page> first;
    ASSERT_NO_THROW(first = stream.next());
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->results.size(), 2u);

    EXPECT_FALSE(stream.next().has_value());
    EXPECT_EQ(transport.calls(), 1);
    EXPECT_EQ(stream.status(), RunStatus::Complete);
    EXPECT_EQ(stream.stopReason(), StopReason::Exhausted);

    auto s = reporter.snapshot();
    EXPECT_EQ(s.stage, Stage::Complete);
    EXPECT_EQ(s.requests, 1);
    EXPECT_EQ(s.items, 2);
}

TEST_F(PaginationTest, NonObjectListResponseFailsRun) {
    transport.pushResponse(200, "[1,2,3]");
    transport.pushPages({2});

    auto stream = run();
    EXPECT_FALSE(stream.next().has_value());
    EXPECT_FALSE(stream.next().has_value());

    EXPECT_EQ(transport.calls(), 1);
    EXPECT_EQ(stream.status(), RunStatus::Failed);
    ASSERT_TRUE(stream.error().has_value());
    EXPECT_TRUE(std::holds_alternative<Unclassified>(*stream.error()));
    EXPECT_THROW(stream.rethrowIfFailed(), RequestError);

    auto s = reporter.snapshot();
    EXPECT_EQ(s.stage, Stage::Error);
    EXPECT_EQ(s.errors, 1);
    EXPECT_EQ(s.requests, 0);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(PaginationTest, CancelBetweenPagesStopsQuietly) {
    transport.pushPages({3, 3, 3});

    auto stream = run();
    ASSERT_TRUE(stream.next().has_value());
    signal.cancel();
    EXPECT_FALSE(stream.next().has_value());

    EXPECT_EQ(transport.calls(), 1);
    EXPECT_EQ(stream.status(), RunStatus::Cancelled);
    EXPECT_NO_THROW(stream.rethrowIfFailed());

    auto s = reporter.snapshot();
    EXPECT_TRUE(s.cancelled);
    EXPECT_NE(s.stage, Stage::Error);
    EXPECT_EQ(s.errors, 0);
}

TEST_F(PaginationTest, CancelWhileRequestInFlight) {
    transport.pushJson(200, FakeTransport::makePage(0, 3, true, std::string("cursor-1")));
    transport.pushHang();
    transport.pushPages({3});

    std::thread canceller([this] {
        std::this_thread::sleep_for(80ms);
        signal.cancel();
    });

    auto stream = run();
    auto pages  = stream.collect();
    canceller.join();

    EXPECT_EQ(pages.size(), 1u);
    EXPECT_EQ(transport.calls(), 2);
    EXPECT_EQ(stream.status(), RunStatus::Cancelled);
    EXPECT_EQ(reporter.snapshot().errors, 0);
}

TEST_F(PaginationTest, DeadlineEndsRun) {
    transport.pushJson(200, FakeTransport::makePage(0, 3, true, std::string("cursor-1")));
    transport.pushHang();

    signal.armDeadline(100ms);
    auto stream = run();
    auto pages  = stream.collect();

    EXPECT_EQ(pages.size(), 1u);
    EXPECT_EQ(stream.status(), RunStatus::DeadlineExceeded);
    EXPECT_THROW(stream.rethrowIfFailed(), OperationCancelled);

    auto s = reporter.snapshot();
    EXPECT_EQ(s.stage, Stage::Timeout);
    EXPECT_TRUE(s.cancelled);
    EXPECT_EQ(s.message, "operation timed out after 100ms");
}

TEST_F(PaginationTest, AlreadyCancelledIssuesNoRequest) {
    transport.pushPages({3});
    signal.cancel();

    auto stream = run();
    EXPECT_TRUE(stream.collect().empty());
    EXPECT_EQ(transport.calls(), 0);
}
