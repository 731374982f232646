// FILE: include/cli/process_command.hpp
#pragma once
#include <string>
#include <vector>

#include "cli/command/commands.hpp"

namespace dyn {

// Dispatch one command line (program name and global options removed).
// Returns the exit code.
int process_command(const std::vector<std::string>& args, CliContext& ctx);

} // namespace dyn
