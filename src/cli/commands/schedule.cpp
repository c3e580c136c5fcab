#include "command_helpers.hpp"
#include "../theme.hpp"
#include <core/schedule.hpp>
#include <iostream>

static void do_schedule(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;

    auto args = split_args(arg);
    if (args.empty()) {
        print_schedule(cli.service);
        return;
    }

    auto updated = apply_schedule_args(cli.service.schedule(), args);
    if (updated.is_err()) {
        std::cout << theme::fail(updated.error);
        std::cout << theme::step("Usage: schedule [off | interval <h> | weekly <HH:MM> <days> | battery on|off]");
        return;
    }

    auto saved = cli.service.set_schedule(updated.value);
    if (saved.is_err()) {
        std::cout << theme::fail("Could not save schedule: " + saved.error);
        return;
    }
    std::cout << theme::ok(describe(updated.value));
    print_schedule(cli.service);
}

void register_schedule_commands(BaseCLI& cli) {
    cli.add_command("Schedule", "schedule", do_schedule,
                    "Show or change the schedule (off, interval, weekly, battery)");
}
