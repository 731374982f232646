// FILE: src/cli/command_set.cpp
#include "cli/command_set.hpp"

#include <iomanip>
#include <sstream>

#include "cli/argument_parser.hpp"

namespace dyn {

bool CommandSet::add_command(const std::string& name, const std::string& help, const Grammar& grammar) {
    if (find(name)) return false;
    commands_.push_back({name, help, grammar});
    return true;
}

const CommandSet::Command* CommandSet::find(const std::string& name) const {
    for (const auto& c : commands_)
        if (c.name == name) return &c;
    return nullptr;
}

ParsedArgs CommandSet::parse(const std::vector<std::string>& args) const {
    if (args.empty() || args.front().empty() || args.front()[0] == '-') {
        throw CliError(CliErrc::Usage, "the following arguments are required: command");
    }
    const Command* cmd = find(args.front());
    if (!cmd) {
        std::string msg = "argument command: invalid choice: '" + args.front() + "' (choose from ";
        for (std::size_t i = 0; i < commands_.size(); ++i) {
            if (i) msg += ", ";
            msg += "'" + commands_[i].name + "'";
        }
        throw CliError(CliErrc::Usage, msg + ")");
    }
    std::vector<std::string> rest(args.begin() + 1, args.end());
    ParsedArgs values = parse_arguments(cmd->grammar, rest);
    values[kSubInterfaceKey] = cmd->name;
    return values;
}

std::string CommandSet::format_help() const {
    std::ostringstream ss;
    ss << "usage: " << prog_ << " [-h] {";
    for (std::size_t i = 0; i < commands_.size(); ++i) {
        if (i) ss << ",";
        ss << commands_[i].name;
    }
    ss << "} ...\n";
    if (!description_.empty()) ss << "\n" << description_ << "\n";
    ss << "\ncommands:\n";
    for (const auto& c : commands_) {
        ss << "  " << std::left << std::setw(24) << c.name << c.help << "\n";
    }
    return ss.str();
}

} // namespace dyn
