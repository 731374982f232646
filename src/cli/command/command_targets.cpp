// FILE: src/cli/command/command_targets.cpp
#include <iostream>

#include "cli/command/commands.hpp"

namespace dyn {

int handle_targets(const std::vector<std::string>& /*args*/, CliContext& ctx) {
    auto keys = ctx.registry.get_keys();
    if (keys.empty()) {
        ctx.out << "(no targets registered)\n";
        return 0;
    }
    ctx.out << "Registered targets:" << std::endl;
    for (const auto& key : keys) {
        const TargetDescriptor& d = ctx.registry.at(key);
        ctx.out << "\n  " << key;
        if (!d.description.empty()) ctx.out << "  (" << d.description << ")";
        ctx.out << std::endl;
        for (const auto& op : d.operations) {
            ctx.out << "    - " << op.name << "(";
            for (std::size_t i = 0; i < op.parameters.size(); ++i) {
                if (i) ctx.out << ", ";
                ctx.out << op.parameters[i].name << ": " << op.parameters[i].semantic_type.to_string();
            }
            ctx.out << ")" << std::endl;
        }
    }
    return 0;
}

} // namespace dyn
