#pragma once

#include "../base_cli.hpp"
#include <functional>
#include <string>
#include <vector>

// Shared helpers used by the command files and the one-shot entry points

std::vector<std::string> split_args(const std::string& args);

void print_status(BackupService& service);
void print_schedule(BackupService& service);
void print_lines(const std::vector<std::string>& lines, size_t max_lines);

// Print status changes of the active run until it ends. `interrupted` is
// polled; the first time it reports true the run is asked to pause.
void follow_run(BackupService& service, const std::function<bool()>& interrupted);

void register_backup_commands(BaseCLI& cli);
void register_session_commands(BaseCLI& cli);
void register_schedule_commands(BaseCLI& cli);
