#pragma once

#include "base_cli.hpp"
#include <deque>
#include <mutex>
#include <string>
#include <vector>

class KeepsakeCLI : public BaseCLI {
public:
    KeepsakeCLI();

    // Interactive shell with the scheduler running in the background.
    void run_repl();

    // One-shot entry points (`keepsake run`, `keepsake status`, ...).
    // Return the process exit code.
    int run_command(const std::string& command, const std::vector<std::string>& args);

    // Scheduler only, until SIGINT/SIGTERM.
    int run_daemon();

    // Set from the signal handler.
    static void request_interrupt();

private:
    void register_all_commands();
    void install_notification_sink(bool immediate);
    void flush_notices();

    // Notices raised on background threads, printed before the next prompt.
    std::mutex notices_mutex_;
    std::deque<std::string> notices_;
};
