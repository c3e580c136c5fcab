#include "wake_monitor.hpp"
#include <core/constants.hpp>
#include <managers/backup_log.hpp>
#include <chrono>

WakeMonitor::WakeMonitor(WakeCallback on_wake, int check_interval_ms, int gap_threshold_secs)
    : on_wake_(std::move(on_wake)),
      check_interval_ms_(check_interval_ms),
      gap_threshold_secs_(gap_threshold_secs) {}

WakeMonitor::~WakeMonitor() {
    stop();
}

bool WakeMonitor::start() {
    if (running_) return true;
    running_ = true;
    thread_ = std::thread(&WakeMonitor::monitor_loop, this);
    keepsake_log("wake_monitor: started");
    return true;
}

void WakeMonitor::stop() {
    if (!running_) return;
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    keepsake_log("wake_monitor: stopped");
}

bool WakeMonitor::is_sleep_gap(double wall_elapsed_secs, double mono_elapsed_secs,
                               int threshold_secs) {
    return (wall_elapsed_secs - mono_elapsed_secs) > threshold_secs;
}

void WakeMonitor::monitor_loop() {
    using namespace std::chrono;

    auto last_wall = system_clock::now();
    auto last_mono = steady_clock::now();

    while (running_) {
        // Sleep in 100ms increments for responsive shutdown
        for (int waited = 0; waited < check_interval_ms_ && running_; waited += SHUTDOWN_POLL_MS) {
            std::this_thread::sleep_for(milliseconds(SHUTDOWN_POLL_MS));
        }
        if (!running_) break;

        auto wall = system_clock::now();
        auto mono = steady_clock::now();
        double wall_elapsed = duration<double>(wall - last_wall).count();
        double mono_elapsed = duration<double>(mono - last_mono).count();
        last_wall = wall;
        last_mono = mono;

        if (is_sleep_gap(wall_elapsed, mono_elapsed, gap_threshold_secs_)) {
            keepsake_log(fmt::format("wake_monitor: wake detected (wall {:.0f}s vs monotonic {:.0f}s)",
                                     wall_elapsed, mono_elapsed));
            if (on_wake_) on_wake_();
        }
    }
}
