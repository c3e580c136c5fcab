#include "notifier.hpp"
#include "backup_log.hpp"
#include <fmt/format.h>
#include <vector>

std::string completion_summary(const SessionStats& stats) {
    std::vector<std::string> parts;
    if (stats.uploaded_count > 0) parts.push_back(fmt::format("{} uploaded", stats.uploaded_count));
    if (stats.skipped_count > 0) parts.push_back(fmt::format("{} skipped", stats.skipped_count));
    if (stats.error_count > 0) parts.push_back(fmt::format("{} errors", stats.error_count));
    if (parts.empty()) return "Backup finished.";

    std::string body;
    for (const auto& p : parts) {
        if (!body.empty()) body += ", ";
        body += p;
    }
    return body;
}

Notifier::Notifier(NotificationSettings settings, Sink sink)
    : settings_(settings), sink_(std::move(sink)) {}

void Notifier::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Notifier::set_settings(const NotificationSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = settings;
}

NotificationSettings Notifier::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

void Notifier::backup_started() {
    if (!settings().on_start) return;
    send(NotificationKind::Started, "Backup Started", "Backup is now running.");
}

void Notifier::backup_completed(const SessionStats& stats) {
    if (!settings().on_completion) return;
    send(NotificationKind::Completed, "Backup Complete", completion_summary(stats));
}

void Notifier::backup_error(const std::string& message) {
    if (!settings().on_error) return;
    send(NotificationKind::Error, "Backup Error", message);
}

void Notifier::backup_skipped(const std::string& reason) {
    if (!settings().on_error) return;
    send(NotificationKind::Skipped, "Scheduled Backup Skipped", reason);
}

void Notifier::send(NotificationKind kind, const std::string& title, const std::string& body) {
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink = sink_;
    }
    keepsake_log(fmt::format("notify: {}: {}", title, body));
    if (sink) sink(Notification{kind, title, body});
}
