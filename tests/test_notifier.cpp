#include <gtest/gtest.h>
#include <managers/notifier.hpp>
#include <vector>

TEST(Notifier, CompletionSummary) {
    SessionStats s;
    EXPECT_EQ(completion_summary(s), "Backup finished.");

    s.uploaded_count = 3;
    s.skipped_count = 1;
    s.error_count = 2;
    EXPECT_EQ(completion_summary(s), "3 uploaded, 1 skipped, 2 errors");

    s.uploaded_count = 0;
    EXPECT_EQ(completion_summary(s), "1 skipped, 2 errors");
}

TEST(Notifier, DefaultGates) {
    std::vector<Notification> sent;
    Notifier n(NotificationSettings{}, [&](const Notification& x) { sent.push_back(x); });

    n.backup_started();
    EXPECT_TRUE(sent.empty());

    SessionStats s;
    s.uploaded_count = 4;
    n.backup_completed(s);
    n.backup_error("Error: disk full");
    n.backup_skipped("on battery power");

    ASSERT_EQ(sent.size(), 3u);
    EXPECT_EQ(sent[0].kind, NotificationKind::Completed);
    EXPECT_EQ(sent[0].title, "Backup Complete");
    EXPECT_EQ(sent[0].body, "4 uploaded");
    EXPECT_EQ(sent[1].title, "Backup Error");
    EXPECT_EQ(sent[1].body, "Error: disk full");
    EXPECT_EQ(sent[2].title, "Scheduled Backup Skipped");
    EXPECT_EQ(sent[2].body, "on battery power");
}

TEST(Notifier, ErrorSettingAlsoGatesSkips) {
    std::vector<Notification> sent;
    NotificationSettings settings;
    settings.on_start = true;
    settings.on_error = false;
    Notifier n(settings, [&](const Notification& x) { sent.push_back(x); });

    n.backup_error("x");
    n.backup_skipped("on battery power");
    n.backup_started();

    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].title, "Backup Started");
    EXPECT_EQ(sent[0].body, "Backup is now running.");
}

TEST(Notifier, NoSinkIsFine) {
    Notifier n;
    n.backup_error("nobody listening");
    n.set_settings(NotificationSettings{false, false, false});
    EXPECT_FALSE(n.settings().on_completion);
}
