// FILE: include/cli/command_set.hpp
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "cli/grammar.hpp"
#include "dyn_types.hpp"

namespace dyn {

/**
 * @brief Parent dispatcher keyed by command name.
 *
 * Each command carries an already assembled Grammar; parse() selects the
 * command from the first argument, parses the rest against its grammar and
 * records the command name under the reserved `sub_interface` key.
 */
class CommandSet {
public:
    struct Command {
        std::string name;
        std::string help;
        Grammar grammar;
    };

    CommandSet() = default;
    CommandSet(std::string prog, std::string description)
        : prog_(std::move(prog)), description_(std::move(description)) {}

    // Returns false (and keeps the earlier command) when `name` is taken.
    bool add_command(const std::string& name, const std::string& help, const Grammar& grammar);

    const Command* find(const std::string& name) const;
    const std::vector<Command>& commands() const { return commands_; }
    const std::string& prog() const { return prog_; }
    const std::string& description() const { return description_; }

    ParsedArgs parse(const std::vector<std::string>& args) const;

    std::string format_help() const;

private:
    std::string prog_;
    std::string description_;
    std::vector<Command> commands_;
};

} // namespace dyn
