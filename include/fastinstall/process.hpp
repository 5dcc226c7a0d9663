#pragma once

#include <fastinstall/result.hpp>
#include <string>
#include <vector>

namespace fastinstall {

// Result of running an external command
struct CommandResult {
    int exit_code = -1;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// Fails with IO on spawn failure and Timeout when the child outlives
// timeout_seconds (the child is killed). timeout_seconds <= 0 waits forever.
// A non-zero exit status is not an error here; callers inspect exit_code.
// Each spawn is traced on the global logger.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 0);

// Last non-empty line of captured output, for error messages
std::string last_line(const std::string& output);

} // namespace fastinstall
