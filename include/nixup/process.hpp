#pragma once

#include <nixup/result.hpp>
#include <string>
#include <vector>

namespace nixup {

struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command (args[0] is looked up in PATH), capturing stdout
// and stderr. A command that cannot be executed exits with 127.
// Returns an error on pipe/fork/wait failure or timeout.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60);

// "a b 'c d'" style rendering for log and error messages
std::string command_line(const std::vector<std::string>& args);

} // namespace nixup
