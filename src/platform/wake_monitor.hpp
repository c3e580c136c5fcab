#pragma once

#include <atomic>
#include <functional>
#include <thread>

// Detects system sleep/wake without a session-bus dependency.
// CLOCK_MONOTONIC stops while the machine is suspended but the wall clock
// keeps going, so a wall-clock step much larger than the monotonic step
// between two checks means the process was frozen in a suspend.
class WakeMonitor {
public:
    using WakeCallback = std::function<void()>;

    WakeMonitor(WakeCallback on_wake, int check_interval_ms, int gap_threshold_secs);
    ~WakeMonitor();

    bool start();
    void stop();

    // True when wall_elapsed exceeds mono_elapsed by more than threshold.
    static bool is_sleep_gap(double wall_elapsed_secs, double mono_elapsed_secs,
                             int threshold_secs);

private:
    void monitor_loop();

    WakeCallback on_wake_;
    int check_interval_ms_;
    int gap_threshold_secs_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};
