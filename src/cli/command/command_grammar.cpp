// FILE: src/cli/command/command_grammar.cpp
#include <iostream>

#include "cli/command/commands.hpp"

namespace dyn {

int handle_grammar(const std::vector<std::string>& args, CliContext& ctx) {
    if (args.size() != 2) {
        throw CliError(CliErrc::Usage, "usage: dynamite grammar <component> <interface>");
    }
    const Component* component = find_component(ctx.components, args[0]);
    if (!component) throw CliError(CliErrc::Usage, "Unknown component: " + args[0]);
    const InterfaceEntry* entry = component->find(args[1]);
    if (!entry) {
        throw CliError(CliErrc::Usage, "Component '" + component->name + "' has no interface '" + args[1] + "'.");
    }
    ctx.out << component->grammar(*entry, ctx.state).to_json().dump(2) << std::endl;
    return 0;
}

} // namespace dyn
