#include "command_helpers.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <iostream>
#include <sstream>
#include <algorithm>
#include <fmt/format.h>

std::vector<std::string> split_args(const std::string& args) {
    std::vector<std::string> out;
    std::istringstream iss(args);
    std::string token;
    while (iss >> token) {
        out.push_back(token);
    }
    return out;
}

void print_lines(const std::vector<std::string>& lines, size_t max_lines) {
    size_t start = lines.size() > max_lines ? lines.size() - max_lines : 0;
    for (size_t i = start; i < lines.size(); i++) {
        if (starts_with(lines[i], "ERROR")) {
            std::cout << theme::red("    " + lines[i]) << "\n";
        } else {
            std::cout << theme::log(lines[i]);
        }
    }
}

void print_status(BackupService& service) {
    auto snap = service.snapshot();
    const auto& st = snap.status;

    std::cout << theme::section("Backup");
    std::cout << theme::kv("Status", st.status_text);
    std::cout << theme::kv("Phase", session_phase_name(service.phase()));
    if (st.progress_total > 0) {
        std::cout << theme::kv("Progress",
                               fmt::format("{} {}/{}", theme::progress_bar(st.progress_value, st.progress_total),
                                           st.progress_value, st.progress_total));
    }
    std::cout << theme::kv("Uploaded", std::to_string(st.stats.uploaded_count));
    std::cout << theme::kv("Skipped", std::to_string(st.stats.skipped_count));
    std::cout << theme::kv("Errors", st.stats.error_count > 0
                                         ? theme::red(std::to_string(st.stats.error_count))
                                         : std::string("0"));
    if (!st.resumable_info.empty()) {
        std::cout << theme::kv("Resumable", st.resumable_info);
    }

    const auto& cfg = service.config();
    std::cout << theme::section("Settings");
    std::cout << theme::kv("Sources", std::to_string(cfg.sources().paths.size()) + " folder(s)");
    std::cout << theme::kv("Destination", cfg.destination().folder.empty()
                                              ? theme::dim("(not set)")
                                              : cfg.destination().folder);
    std::cout << theme::kv("Mode", to_string(cfg.transfer().backup_mode));
    std::cout << theme::kv("Device", service.device_id());

    print_schedule(service);
}

void print_schedule(BackupService& service) {
    auto s = service.schedule_summary();
    std::cout << theme::section("Schedule");
    std::cout << theme::kv("Policy", s.description);
    std::cout << theme::kv("Next run", s.next_run);
    std::cout << theme::kv("Last run", s.last_run);
    std::cout << theme::kv("On battery", s.skip_on_battery ? "skip" : "run");
    std::cout << "\n";
}

void follow_run(BackupService& service, const std::function<bool()>& interrupted) {
    std::string last_status;
    bool pause_requested = false;

    while (service.is_running()) {
        if (!pause_requested && interrupted()) {
            pause_requested = true;
            service.pause();
            std::cout << theme::info("Interrupted: pausing after the current item...");
        }
        auto st = service.snapshot().status;
        if (st.status_text != last_status) {
            last_status = st.status_text;
            std::cout << theme::log(st.status_text);
        }
        platform::sleep_ms(200);
    }
    service.wait_for_idle();

    auto snap = service.snapshot();
    std::cout << "\n" << theme::kv("Result", snap.status.status_text);
    if (!snap.status.resumable_info.empty()) {
        std::cout << theme::kv("Resumable", snap.status.resumable_info);
    }
    if (!snap.error_lines.empty()) {
        std::cout << theme::section(fmt::format("Errors ({})", snap.error_lines.size()));
        print_lines(snap.error_lines, 20);
    }
    std::cout << "\n";
}

// ── Commands ──────────────────────────────────────────────────

static void do_status(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    print_status(cli.service);
}

static void do_log(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    int n = arg.empty() ? 40 : safe_stoi(arg, 40);
    auto lines = cli.service.log_lines();
    if (lines.empty()) {
        std::cout << theme::dim("    (log is empty)") << "\n";
        return;
    }
    print_lines(lines, static_cast<size_t>(std::max(1, n)));
}

static void do_errors(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    auto lines = cli.service.error_lines();
    if (lines.empty()) {
        std::cout << theme::ok("No errors");
        return;
    }
    std::cout << theme::section(fmt::format("Errors ({})", lines.size()));
    print_lines(lines, lines.size());
}

static void do_reset(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    bool wipe = false;
    for (const auto& a : split_args(arg)) {
        if (a == "--wipe-manifest") {
            wipe = true;
        } else {
            std::cout << theme::fail("Unknown option: " + a);
            std::cout << theme::step("Usage: reset [--wipe-manifest]");
            return;
        }
    }

    auto result = cli.service.reset(wipe);
    print_lines(cli.service.log_lines(), 20);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    std::cout << theme::ok("Reset complete. The next backup re-checks every file.");
}

void register_session_commands(BaseCLI& cli) {
    cli.add_command("Session", "status", do_status, "Show progress, counters and schedule");
    cli.add_command("Session", "log", do_log, "Show the last N log lines (default 40)");
    cli.add_command("Session", "errors", do_errors, "Show error lines from the current run");
    cli.add_command("Session", "reset", do_reset, "Forget the paused session [--wipe-manifest]");
}
