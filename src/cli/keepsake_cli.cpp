#include "keepsake_cli.hpp"
#include "commands/command_helpers.hpp"
#include "theme.hpp"
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/schedule.hpp>
#include <managers/backup_log.hpp>
#include <platform/platform.hpp>
#include <readline/readline.h>
#include <readline/history.h>

static volatile std::sig_atomic_t g_interrupted = 0;

static bool interrupted() {
    return g_interrupted != 0;
}

void KeepsakeCLI::request_interrupt() {
    g_interrupted = 1;
}

KeepsakeCLI::KeepsakeCLI() : BaseCLI() {
    register_all_commands();
}

void KeepsakeCLI::register_all_commands() {
    register_backup_commands(*this);
    register_session_commands(*this);
    register_schedule_commands(*this);

    add_command("General", "help", [this](BaseCLI&, const std::string&) {
        print_help();
    }, "Show this help message");

    add_command("General", "clear", [](BaseCLI&, const std::string&) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    // The REPL loop handles these itself; listed here for help.
    auto noop = [](BaseCLI&, const std::string&) {};
    add_command("General", "quit", noop, "Pause any running backup and exit");
    add_command("General", "exit", noop, "Pause any running backup and exit");
}

void KeepsakeCLI::install_notification_sink(bool immediate) {
    service.set_notification_sink([this, immediate](const Notification& n) {
        std::string text = theme::info(theme::bold(n.title) + "  " + n.body);
        if (immediate) {
            std::cout << text << std::flush;
            return;
        }
        std::lock_guard<std::mutex> lock(notices_mutex_);
        notices_.push_back(text);
    });
}

void KeepsakeCLI::flush_notices() {
    std::deque<std::string> pending;
    {
        std::lock_guard<std::mutex> lock(notices_mutex_);
        pending.swap(notices_);
    }
    for (const auto& n : pending) {
        std::cout << n;
    }
}

void KeepsakeCLI::run_repl() {
    std::cout << theme::banner();

    if (!require_service()) {
        std::cout << "\n";
        return;
    }
    install_notification_sink(false);
    // The REPL reads snapshots on demand; nothing is pushed to it.
    service.set_visible(false);
    service.start_background();

    std::cout << theme::section("Ready");
    std::cout << theme::kv("Config", service.config().path().string());
    std::cout << theme::kv("Destination", service.config().destination().folder.empty()
                                              ? theme::dim("(not set)")
                                              : service.config().destination().folder);
    auto snap = service.snapshot();
    if (!snap.status.resumable_info.empty()) {
        std::cout << theme::kv("Resumable", snap.status.resumable_info);
    }
    std::cout << theme::kv("Schedule", describe(service.schedule()));
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (true) {
        flush_notices();

        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        if (command == "quit" || command == "exit") {
            break;
        }
        execute_command(command, args);
    }

    if (service.is_running()) {
        std::cout << theme::dim("    Pausing the running backup so it can be resumed...") << "\n";
    }
    service.shutdown();
    flush_notices();
}

int KeepsakeCLI::run_command(const std::string& command, const std::vector<std::string>& args) {
    if (!require_service()) return 1;
    install_notification_sink(true);

    if (command == "status") {
        print_status(service);
        return 0;
    }

    if (command == "schedule") {
        std::string joined;
        for (const auto& a : args) {
            if (!joined.empty()) joined += " ";
            joined += a;
        }
        execute_command("schedule", joined);
        return 0;
    }

    if (command == "reset") {
        bool wipe = !args.empty() && args[0] == "--wipe-manifest";
        auto result = service.reset(wipe);
        print_lines(service.log_lines(), 20);
        if (result.is_err()) {
            std::cout << theme::fail(result.error);
            return 1;
        }
        std::cout << theme::ok("Reset complete.");
        return 0;
    }

    Result<void> started = Result<void>::Err("Unknown command: " + command);
    if (command == "run") {
        started = service.run_now();
    } else if (command == "dry-run") {
        started = service.start_dry_run();
    } else if (command == "resume") {
        started = service.resume();
    } else if (command == "start") {
        started = service.start_backup();
    }
    if (started.is_err()) {
        std::cout << theme::fail(started.error);
        return 1;
    }

    std::cout << theme::section(command == "dry-run" ? "Dry run" : "Backup");
    follow_run(service, interrupted);
    SessionPhase phase = service.phase();
    service.shutdown();
    return phase == SessionPhase::Errored ? 1 : 0;
}

int KeepsakeCLI::run_daemon() {
    if (!require_service()) return 1;
    install_notification_sink(true);
    service.set_visible(false);
    service.start_background();

    std::cout << theme::section("Scheduler");
    print_schedule(service);
    std::cout << theme::dim("    Running until interrupted (Ctrl-C).") << "\n";
    keepsake_log("daemon: started");

    while (!interrupted()) {
        platform::sleep_ms(SHUTDOWN_POLL_MS);
    }

    std::cout << "\n" << theme::dim("    Shutting down...") << "\n";
    keepsake_log("daemon: stopping");
    service.shutdown();
    return 0;
}
