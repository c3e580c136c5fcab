#include <gtest/gtest.h>
#include <managers/event_classifier.hpp>

// ── Id helpers ──────────────────────────────────────────────

TEST(EventClassifier, BaseItemIdStripsVariantSuffix) {
    EXPECT_EQ(base_item_id("Photos/IMG_1.HEIC:edited"), "Photos/IMG_1.HEIC");
    EXPECT_EQ(base_item_id("Photos/IMG_1.HEIC:pairedVideo"), "Photos/IMG_1.HEIC");
    EXPECT_EQ(base_item_id("Photos/IMG_1.HEIC:video"), "Photos/IMG_1.HEIC");
    EXPECT_EQ(base_item_id("abc-edited"), "abc");
    EXPECT_EQ(base_item_id("abc-paired-video"), "abc");
    EXPECT_EQ(base_item_id("Photos/IMG_1.HEIC"), "Photos/IMG_1.HEIC");
}

TEST(EventClassifier, ExtractItemIdUsesLastGroup) {
    EXPECT_EQ(extract_item_id("upload created (A/1.jpg)"), std::optional<ItemId>("A/1.jpg"));
    EXPECT_EQ(extract_item_id("ERROR upload failed (timeout) (A/2.jpg)"),
              std::optional<ItemId>("A/2.jpg"));
    EXPECT_FALSE(extract_item_id("upload created").has_value());
    EXPECT_FALSE(extract_item_id("upload created ( )").has_value());
}

// ── Structured events ───────────────────────────────────────

TEST(EventClassifier, ProgressAndStatus) {
    EventClassifier c;
    auto scan = c.handle(ProgressEvent::scanning());
    EXPECT_EQ(scan.status, std::optional<std::string>("Scanning..."));

    auto will = c.handle(ProgressEvent::will_process(3));
    EXPECT_EQ(will.status, std::optional<std::string>("Will export 3 item(s)..."));
    EXPECT_EQ(c.progress_total(), 3);
    EXPECT_EQ(c.progress_value(), 0);

    auto proc = c.handle(ProgressEvent::processing(2, 3, "A/2.jpg", "2.jpg"));
    EXPECT_EQ(proc.status, std::optional<std::string>("Exporting 2/3: 2.jpg"));
    ASSERT_EQ(proc.log_lines.size(), 1u);
    EXPECT_EQ(proc.log_lines[0], "[2/3] 2.jpg");
    EXPECT_EQ(c.progress_value(), 2);
}

TEST(EventClassifier, ProgressLinesAreSampled) {
    EventClassifier c;
    EXPECT_EQ(c.handle(ProgressEvent::processing(25, 1000, "x", "x")).log_lines.size(), 1u);
    EXPECT_TRUE(c.handle(ProgressEvent::processing(26, 1000, "x", "x")).log_lines.empty());
    EXPECT_EQ(c.handle(ProgressEvent::processing(500, 1000, "x", "x")).log_lines.size(), 1u);
    EXPECT_TRUE(c.handle(ProgressEvent::processing(501, 1000, "x", "x")).log_lines.empty());
    EXPECT_EQ(c.handle(ProgressEvent::processing(1000, 1000, "x", "x")).log_lines.size(), 1u);
}

TEST(EventClassifier, VariantsOfOneItemCountOnce) {
    EventClassifier c;
    c.handle(ProgressEvent::uploaded("A/1.heic"));
    c.handle(ProgressEvent::uploaded("A/1.heic:pairedVideo"));
    c.handle(ProgressEvent::skipped("A/1.heic:edited"));
    c.handle(ProgressEvent::uploaded("A/2.heic"));

    EXPECT_EQ(c.stats().uploaded_count, 2);
    EXPECT_EQ(c.stats().skipped_count, 0);
}

TEST(EventClassifier, SkippedItemNeverRecountsAsUploaded) {
    EventClassifier c;
    c.handle(ProgressEvent::skipped("A/7.jpg"));
    c.handle(ProgressEvent::uploaded("A/7.jpg"));
    c.handle(ProgressEvent::uploaded("A/7.jpg:edited"));
    EXPECT_EQ(c.stats().skipped_count, 1);
    EXPECT_EQ(c.stats().uploaded_count, 0);
}

TEST(EventClassifier, EmptyIdUploadCountsButSkipDoesNot) {
    EventClassifier c;
    c.handle(ProgressEvent::uploaded(""));
    c.handle(ProgressEvent::uploaded(""));
    c.handle(ProgressEvent::skipped(""));
    EXPECT_EQ(c.stats().uploaded_count, 2);
    EXPECT_EQ(c.stats().skipped_count, 0);
}

TEST(EventClassifier, ErrorsDedupOnlyWithId) {
    EventClassifier c;
    auto first = c.handle(ProgressEvent::failed("A/1.jpg", "read failed"));
    c.handle(ProgressEvent::failed("A/1.jpg:edited", "read failed"));
    c.handle(ProgressEvent::failed("", "disk full"));
    c.handle(ProgressEvent::failed("", "disk full"));

    EXPECT_EQ(c.stats().error_count, 3);
    ASSERT_EQ(first.error_lines.size(), 1u);
    EXPECT_EQ(first.error_lines[0], "ERROR read failed (A/1.jpg)");
    EXPECT_EQ(first.log_lines, first.error_lines);
}

TEST(EventClassifier, PausedEvent) {
    EventClassifier c;
    auto out = c.handle(ProgressEvent::paused(4, 10));
    EXPECT_TRUE(out.paused);
    EXPECT_EQ(out.status, std::optional<std::string>("Paused at 4/10"));
}

TEST(EventClassifier, RetryUpdatesStatus) {
    EventClassifier c;
    auto out = c.handle(ProgressEvent::retrying("1.jpg", 2, 3, "busy"));
    EXPECT_EQ(out.status, std::optional<std::string>("Retrying 1.jpg..."));
    ASSERT_EQ(out.log_lines.size(), 1u);
    EXPECT_EQ(out.log_lines[0], "Retry 2/3 for 1.jpg: busy");
}

// ── Free-form messages ──────────────────────────────────────

TEST(EventClassifier, MessageRules) {
    EventClassifier c;
    c.handle(ProgressEvent::text("upload created (A/1.jpg)"));
    c.handle(ProgressEvent::text("upload created (A/1.jpg:edited)"));
    c.handle(ProgressEvent::text("exists, skipping upload (A/2.jpg)"));
    c.handle(ProgressEvent::text("upload duplicate (A/3.jpg)"));
    c.handle(ProgressEvent::text("skipping upload"));
    EXPECT_EQ(c.stats().uploaded_count, 1);
    EXPECT_EQ(c.stats().skipped_count, 2);

    auto err = c.handle(ProgressEvent::text("ERROR upload failed (A/4.jpg)"));
    c.handle(ProgressEvent::text("ERROR upload failed (A/4.jpg)"));
    c.handle(ProgressEvent::text("ERROR processing album"));
    c.handle(ProgressEvent::text("ERROR processing album"));
    c.handle(ProgressEvent::text("ERROR Files: source not found: /x"));
    EXPECT_EQ(c.stats().error_count, 4);
    ASSERT_EQ(err.error_lines.size(), 1u);
    EXPECT_EQ(err.error_lines[0], "ERROR upload failed (A/4.jpg)");
}

TEST(EventClassifier, PlainMessageChangesNothing) {
    EventClassifier c;
    auto out = c.handle(ProgressEvent::text("Files: copied 3 items"));
    ASSERT_EQ(out.log_lines.size(), 1u);
    EXPECT_TRUE(out.error_lines.empty());
    EXPECT_FALSE(out.status.has_value());
    EXPECT_EQ(c.stats().uploaded_count, 0);
    EXPECT_EQ(c.stats().skipped_count, 0);
    EXPECT_EQ(c.stats().error_count, 0);
}

// ── Seeding and totals ──────────────────────────────────────

TEST(EventClassifier, SeedTreatsProcessedAsCounted) {
    EventClassifier c;
    c.handle(ProgressEvent::uploaded("stale"));

    SessionStats stats;
    stats.uploaded_count = 5;
    stats.skipped_count = 2;
    stats.error_count = 1;
    c.seed({"A/1.jpg", "A/2.jpg:edited"}, stats);

    c.handle(ProgressEvent::uploaded("A/1.jpg"));
    c.handle(ProgressEvent::skipped("A/2.jpg"));
    c.handle(ProgressEvent::uploaded("stale"));
    EXPECT_EQ(c.stats().uploaded_count, 6);
    EXPECT_EQ(c.stats().skipped_count, 2);
    EXPECT_EQ(c.stats().error_count, 1);
}

TEST(EventClassifier, MergeErrorTotalKeepsMax) {
    EventClassifier c;
    c.handle(ProgressEvent::failed("", "a"));
    c.handle(ProgressEvent::failed("", "b"));
    c.merge_error_total(1);
    EXPECT_EQ(c.stats().error_count, 2);
    c.merge_error_total(7);
    EXPECT_EQ(c.stats().error_count, 7);
}

TEST(EventClassifier, ResetClearsEverything) {
    EventClassifier c;
    c.handle(ProgressEvent::will_process(9));
    c.handle(ProgressEvent::uploaded("A/1.jpg"));
    c.reset();
    EXPECT_EQ(c.progress_total(), 0);
    EXPECT_EQ(c.stats().uploaded_count, 0);
    c.handle(ProgressEvent::uploaded("A/1.jpg"));
    EXPECT_EQ(c.stats().uploaded_count, 1);
}
