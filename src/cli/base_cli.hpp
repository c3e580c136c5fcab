#pragma once

#include <string>
#include <vector>
#include <functional>
#include <managers/backup_service.hpp>

class BaseCLI {
public:
    BaseCLI() = default;
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    struct Command {
        std::string group;
        std::string name;
        std::string help;
        CommandHandler handler;
    };

    // Registers `name` under a help group. Groups are listed in the order
    // they were first used; re-registering a name replaces it in place.
    void add_command(const std::string& group, const std::string& name,
                     CommandHandler handler, const std::string& help);

    const Command* find_command(const std::string& name) const;

    // Initializes the service on first use; prints why when it cannot.
    bool require_service();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // "keepsake:running> " with readline's non-printing markers
    std::string get_prompt_string() const;

    BackupService service;

protected:
    std::vector<Command> commands_;
};
