#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <fmt/format.h>

void BaseCLI::add_command(const std::string& group, const std::string& name,
                          CommandHandler handler, const std::string& help) {
    for (auto& cmd : commands_) {
        if (cmd.name == name) {
            cmd = Command{group, name, help, std::move(handler)};
            return;
        }
    }
    commands_.push_back(Command{group, name, help, std::move(handler)});
}

const BaseCLI::Command* BaseCLI::find_command(const std::string& name) const {
    for (const auto& cmd : commands_) {
        if (cmd.name == name) return &cmd;
    }
    return nullptr;
}

bool BaseCLI::require_service() {
    if (service.initialized()) return true;
    auto result = service.init();
    if (result.is_ok()) return true;

    std::cout << theme::fail(result.error);
    std::cout << theme::step("Check " + get_global_config_path().string());
    return false;
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    const Command* cmd = find_command(command);
    if (!cmd) {
        std::cout << theme::fail(fmt::format("Unknown command: {}", command));
        std::cout << theme::step("'help' lists what is available.");
        return;
    }

    // A handler may replace its own entry; call through a copy.
    CommandHandler handler = cmd->handler;
    try {
        handler(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(e.what());
    }
}

void BaseCLI::print_help() const {
    std::vector<std::string> groups;
    for (const auto& cmd : commands_) {
        bool seen = false;
        for (const auto& g : groups) {
            if (g == cmd.group) { seen = true; break; }
        }
        if (!seen) groups.push_back(cmd.group);
    }

    for (const auto& group : groups) {
        std::cout << "\n" << theme::brown(theme::bold("  " + group)) << "\n";
        for (const auto& cmd : commands_) {
            if (cmd.group != group) continue;
            std::cout << theme::blue(fmt::format("    {:<14}", cmd.name))
                      << theme::dim(cmd.help) << "\n";
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // \001 .. \002 hide escape codes from readline's width calculation
    auto hidden = [](const std::string& code) { return "\001" + code + "\002"; };
    auto paint = [&](const std::string& code, const std::string& text) {
        return hidden(code) + text + hidden(theme::color::RESET);
    };

    std::string prompt = paint(theme::color::BROWN, "keepsake");
    if (service.is_running()) {
        prompt += ":" + paint(theme::color::GREEN, "running");
    } else if (service.phase() == SessionPhase::Paused) {
        prompt += ":" + paint(theme::color::YELLOW, "paused");
    }
    return prompt + "> ";
}
