/// @file test_metrics.cpp
/// Unit tests for metrics.hpp: snapshots, mutations and subscribers.

#include "metrics.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace notion_sync;

TEST(MetricsReporter, DefaultSnapshot) {
    MetricsReporter reporter;
    auto s = reporter.snapshot();
    EXPECT_EQ(s.stage, Stage::Requesting);
    EXPECT_EQ(s.requests, 0);
    EXPECT_EQ(s.errors, 0);
    EXPECT_EQ(s.items, 0);
    EXPECT_FALSE(s.cursor.has_value());
    EXPECT_FALSE(s.message.has_value());
    EXPECT_FALSE(s.cancelled);
}

TEST(MetricsReporter, ApplyMutatesInOrder) {
    MetricsReporter reporter;
    reporter.apply([](MetricsSnapshot& s) { s.items += 11; });
    reporter.apply([](MetricsSnapshot& s) { s.items += 8; s.requests = 2; });

    auto s = reporter.snapshot();
    EXPECT_EQ(s.items, 19);
    EXPECT_EQ(s.requests, 2);
}

TEST(MetricsReporter, SetStageWithMessage) {
    MetricsReporter reporter;
    reporter.setStage(Stage::Error, "HTTP 404: gone");

    auto s = reporter.snapshot();
    EXPECT_EQ(s.stage, Stage::Error);
    EXPECT_EQ(s.message, "HTTP 404: gone");

    reporter.setStage(Stage::Requesting);
    EXPECT_EQ(reporter.snapshot().message, "HTTP 404: gone");  // message is sticky
}

TEST(MetricsReporter, SnapshotIsACopy) {
    MetricsReporter reporter;
    auto before = reporter.snapshot();
    reporter.apply([](MetricsSnapshot& s) { s.errors = 3; });
    EXPECT_EQ(before.errors, 0);
}

TEST(MetricsReporter, SubscribersSeeEverySnapshot) {
    MetricsReporter reporter;
    std::vector<Stage> seen;
    int token = reporter.subscribe([&](const MetricsSnapshot& s) { seen.push_back(s.stage); });

    reporter.setStage(Stage::Requesting);
    reporter.setStage(Stage::Retrying);
    reporter.setStage(Stage::Complete);

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[1], Stage::Retrying);
    EXPECT_EQ(seen[2], Stage::Complete);

    reporter.unsubscribe(token);
    reporter.setStage(Stage::Error);
    EXPECT_EQ(seen.size(), 3u);
}

TEST(MetricsReporter, SubscriberMayReadSnapshot) {
    MetricsReporter reporter;
    int observed = -1;
    reporter.subscribe([&](const MetricsSnapshot&) { observed = reporter.snapshot().items; });

    reporter.apply([](MetricsSnapshot& s) { s.items = 5; });
    EXPECT_EQ(observed, 5);
}

TEST(MetricsReporter, InitialSnapshotConstructor) {
    MetricsSnapshot initial;
    initial.stage = Stage::Paginating;
    MetricsReporter reporter(initial);
    EXPECT_EQ(reporter.snapshot().stage, Stage::Paginating);
}

TEST(Stage, ToString) {
    EXPECT_STREQ(toString(Stage::Requesting), "requesting");
    EXPECT_STREQ(toString(Stage::Paginating), "paginating");
    EXPECT_STREQ(toString(Stage::Retrying), "retrying");
    EXPECT_STREQ(toString(Stage::Timeout), "timeout");
    EXPECT_STREQ(toString(Stage::Error), "error");
    EXPECT_STREQ(toString(Stage::Complete), "complete");
}
