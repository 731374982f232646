// FILE: src/cli/process_command.cpp
#include "cli/process_command.hpp"

#include <iostream>

#include "cli/print_cli_help.hpp"

namespace dyn {

int process_command(const std::vector<std::string>& args, CliContext& ctx) {
    if (args.empty()) {
        print_cli_help(ctx.components, ctx.out);
        return 1;
    }
    const std::string& cmd = args.front();
    const std::vector<std::string> rest(args.begin() + 1, args.end());
    if (cmd == "-h" || cmd == "--help" || cmd == "help") {
        print_cli_help(ctx.components, ctx.out);
        return 0;
    } else if (cmd == "grammar") {
        return handle_grammar(rest, ctx);
    } else if (cmd == "targets") {
        return handle_targets(rest, ctx);
    } else if (const Component* component = find_component(ctx.components, cmd)) {
        return handle_component(*component, rest, ctx);
    }
    throw CliError(CliErrc::Usage, "Unknown component: " + cmd + ". Run 'dynamite --help' for a list of components.");
}

} // namespace dyn
