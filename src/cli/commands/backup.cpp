#include "command_helpers.hpp"
#include "../theme.hpp"
#include <iostream>

static void report(const Result<void>& result, const std::string& ok_msg) {
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    std::cout << theme::ok(ok_msg);
    std::cout << theme::step("Use 'status' to follow progress.");
}

static void do_start(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    report(cli.service.start_backup(), "Backup started (fresh session)");
}

static void do_run(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    report(cli.service.run_now(), "Backup started");
}

static void do_dry_run(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    report(cli.service.start_dry_run(), "Dry run started (nothing will be copied)");
}

static void do_pause(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    if (!cli.service.is_running()) {
        std::cout << theme::fail("No backup is running.");
        return;
    }
    cli.service.pause();
    std::cout << theme::info("Pausing after the current item...");
}

static void do_stop(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    if (!cli.service.is_running()) {
        std::cout << theme::fail("No backup is running.");
        return;
    }
    cli.service.stop();
    std::cout << theme::info("Stopping after the current item; the session stays resumable.");
}

static void do_resume(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    auto result = cli.service.resume();
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    std::cout << theme::ok("Resumed paused session");
}

void register_backup_commands(BaseCLI& cli) {
    cli.add_command("Backup", "start", do_start, "Start a fresh backup (discards a paused session)");
    cli.add_command("Backup", "run", do_run, "Resume the paused session, or start a new one");
    cli.add_command("Backup", "dry-run", do_dry_run, "Show what a backup would do");
    cli.add_command("Backup", "pause", do_pause, "Pause after the current item");
    cli.add_command("Backup", "stop", do_stop, "Stop after the current item (resumable)");
    cli.add_command("Backup", "resume", do_resume, "Resume the paused session");
}
