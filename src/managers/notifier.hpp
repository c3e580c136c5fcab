#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <core/types.hpp>

enum class NotificationKind { Started, Completed, Error, Skipped };

struct Notification {
    NotificationKind kind;
    std::string title;
    std::string body;
};

// Builds user-facing notices and hands them to a sink (the CLI prints them).
// Delivery to a desktop notification service is left to the sink.
class Notifier {
public:
    using Sink = std::function<void(const Notification&)>;

    explicit Notifier(NotificationSettings settings = NotificationSettings{}, Sink sink = nullptr);

    void set_sink(Sink sink);
    void set_settings(const NotificationSettings& settings);
    NotificationSettings settings() const;

    void backup_started();                              // gated by on_start
    void backup_completed(const SessionStats& stats);   // gated by on_completion
    void backup_error(const std::string& message);      // gated by on_error
    void backup_skipped(const std::string& reason);     // gated by on_error

private:
    void send(NotificationKind kind, const std::string& title, const std::string& body);

    mutable std::mutex mutex_;
    NotificationSettings settings_;
    Sink sink_;
};

// "3 uploaded, 1 skipped, 2 errors", or "Backup finished." when all are zero.
std::string completion_summary(const SessionStats& stats);
