// FILE: include/cli/command/commands.hpp
#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "cli/components.hpp"
#include "cli_config.hpp"
#include "config/change_set.hpp"
#include "descriptor/target_registry.hpp"
#include "nsm_state.hpp"

namespace dyn {

// Everything one invocation works against.
struct CliContext {
    CliConfig& config;
    NsmState& state;
    const TargetRegistry& registry;
    const std::vector<Component>& components;
    std::ostream& out;
};

// Each command exposes a handler taking the arguments after its own name
// and returning the process exit code. Usage errors are thrown as
// CliError(CliErrc::Usage).

// grammar <component> <interface>: the derived grammar as JSON
int handle_grammar(const std::vector<std::string>& args, CliContext& ctx);

// targets: registered target types and their operations
int handle_targets(const std::vector<std::string>& args, CliContext& ctx);

// <component> <interface> [flags...] [action]
int handle_component(const Component& component, const std::vector<std::string>& args, CliContext& ctx);

// Table or JSON depending on `config.report_format`.
void print_report(const Report& report, const CliConfig& config, std::ostream& out);

} // namespace dyn
