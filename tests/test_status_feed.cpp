#include <gtest/gtest.h>
#include <managers/status_feed.hpp>

static LogSettings small_settings(int max_lines, int max_errors) {
    LogSettings s;
    s.max_lines = max_lines;
    s.max_error_lines = max_errors;
    s.refresh_ms = 10;
    return s;
}

TEST(StatusFeed, LogRingIsBounded) {
    StatusFeed feed(small_settings(100, 40));
    for (int i = 0; i < 250; i++) {
        feed.append_log("line " + std::to_string(i));
    }
    auto lines = feed.log_lines();
    EXPECT_LE(lines.size(), 100u);
    EXPECT_GE(lines.size(), 90u);
    EXPECT_EQ(lines.back(), "line 249");
}

TEST(StatusFeed, ErrorRingIsBounded) {
    StatusFeed feed(small_settings(100, 40));
    for (int i = 0; i < 100; i++) {
        feed.append_error("ERROR " + std::to_string(i));
    }
    auto errors = feed.error_lines();
    EXPECT_LE(errors.size(), 40u);
    EXPECT_EQ(errors.back(), "ERROR 99");
}

TEST(StatusFeed, TinyCapStillTrims) {
    StatusFeed feed(small_settings(5, 5));
    for (int i = 0; i < 20; i++) feed.append_log(std::to_string(i));
    auto lines = feed.log_lines();
    EXPECT_LE(lines.size(), 5u);
    EXPECT_EQ(lines.back(), "19");
}

TEST(StatusFeed, SnapshotCarriesTail) {
    StatusFeed feed(small_settings(2000, 100));
    for (int i = 0; i < 700; i++) feed.append_log(std::to_string(i));
    auto snap = feed.snapshot();
    EXPECT_EQ(snap.log_tail.size(), 500u);
    EXPECT_EQ(snap.log_tail.front(), "200");
    EXPECT_EQ(snap.log_tail.back(), "699");
}

TEST(StatusFeed, ClearLogsKeepsStatus) {
    StatusFeed feed;
    RunStatus st;
    st.status_text = "Paused. 3 completed.";
    feed.set_status(st);
    feed.append_log("a");
    feed.append_error("ERROR b");
    feed.clear_logs();
    EXPECT_TRUE(feed.log_lines().empty());
    EXPECT_TRUE(feed.error_lines().empty());
    EXPECT_EQ(feed.status().status_text, "Paused. 3 completed.");
}

TEST(StatusFeed, FlushDeliversOnlyWhenChanged) {
    StatusFeed feed;
    int deliveries = 0;
    std::string seen;
    feed.subscribe([&](const StatusSnapshot& s) {
        deliveries++;
        seen = s.status.status_text;
    });

    RunStatus st;
    st.status_text = "Scanning...";
    feed.set_status(st);
    feed.append_log("Scanning...");
    feed.flush();
    EXPECT_EQ(deliveries, 1);
    EXPECT_EQ(seen, "Scanning...");

    feed.flush();
    EXPECT_EQ(deliveries, 1);
}

TEST(StatusFeed, InvisibleFeedHoldsDeliveries) {
    StatusFeed feed;
    int deliveries = 0;
    feed.subscribe([&](const StatusSnapshot&) { deliveries++; });

    feed.set_visible(false);
    feed.append_log("x");
    feed.flush();
    EXPECT_EQ(deliveries, 0);

    feed.set_visible(true);
    EXPECT_EQ(deliveries, 1);
}

TEST(StatusFeed, UnsubscribeStopsDelivery) {
    StatusFeed feed;
    int a = 0;
    int b = 0;
    int token_a = feed.subscribe([&](const StatusSnapshot&) { a++; });
    feed.subscribe([&](const StatusSnapshot&) { b++; });
    EXPECT_NE(token_a, 0);

    feed.unsubscribe(token_a);
    feed.append_log("x");
    feed.flush();
    EXPECT_EQ(a, 0);
    EXPECT_EQ(b, 1);
}

TEST(StatusFeed, ThrowingObserverDoesNotBlockOthers) {
    StatusFeed feed;
    int delivered = 0;
    feed.subscribe([](const StatusSnapshot&) { throw std::runtime_error("boom"); });
    feed.subscribe([&](const StatusSnapshot&) { delivered++; });
    feed.append_log("x");
    feed.flush();
    EXPECT_EQ(delivered, 1);
}

TEST(StatusFeed, StopFlushesPendingChanges) {
    StatusFeed feed(small_settings(100, 100));
    int deliveries = 0;
    feed.subscribe([&](const StatusSnapshot&) { deliveries++; });
    feed.start();
    feed.append_log("x");
    feed.stop();
    EXPECT_GE(deliveries, 1);
}
