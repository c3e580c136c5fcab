#include <csignal>
#include <iostream>
#include <vector>
#include <string>
#include <core/constants.hpp>
#include "cli/keepsake_cli.hpp"
#include "cli/theme.hpp"

static void on_signal(int) {
    KeepsakeCLI::request_interrupt();
}

static void usage_row(const std::string& cmd, const std::string& arg, const std::string& help) {
    std::string left = "    keepsake" + (cmd.empty() ? "" : " " + cmd);
    std::cout << theme::color::BLUE << left << theme::color::RESET;
    size_t width = left.size();
    if (!arg.empty()) {
        std::cout << " " << theme::color::BROWN << arg << theme::color::RESET;
        width += arg.size() + 1;
    }
    std::cout << std::string(width < 36 ? 36 - width : 1, ' ')
              << theme::color::DIM << help << theme::color::RESET << "\n";
}

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    usage_row("", "", "Interactive shell, scheduler in background");
    usage_row("run", "", "Resume the paused session or start one");
    usage_row("start", "", "Start a fresh backup");
    usage_row("dry-run", "", "Show what a backup would do");
    usage_row("resume", "", "Resume the paused session");
    usage_row("status", "", "Show progress, counters and schedule");
    usage_row("reset", "[--wipe-manifest]", "Forget the paused session");
    usage_row("schedule", "[args]", "Show or change the schedule");
    usage_row("daemon", "", "Run the scheduler until interrupted");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    keepsake --version                Show version\n"
              << "    keepsake --help                   Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            KeepsakeCLI cli;
            cli.run_repl();
            return 0;
        }

        std::string cmd = argv[1];
        std::vector<std::string> args(argv + 2, argv + argc);

        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "keepsake"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << KEEPSAKE_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "help") {
            print_usage();
            return 0;
        }

        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);

        KeepsakeCLI cli;
        if (cmd == "daemon") {
            return cli.run_daemon();
        } else if (cmd == "run" || cmd == "start" || cmd == "dry-run" || cmd == "resume" ||
                   cmd == "status" || cmd == "reset" || cmd == "schedule") {
            return cli.run_command(cmd, args);
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
