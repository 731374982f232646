// FILE: include/cli/interfaces.hpp
#pragma once

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "cli/command_set.hpp"
#include "cli/grammar.hpp"
#include "descriptor/descriptors.hpp"

namespace dyn {

/**
 * @brief A target type turned into a command-line interface.
 *
 * The grammar is assembled once in the constructor and never changes. The
 * base (constructor) flags always come first; see the two subclasses for how
 * operation flags are added.
 */
class CommandInterface {
public:
    virtual ~CommandInterface() = default;

    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }
    const Grammar& grammar() const { return grammar_; }
    const TargetDescriptor& target() const { return target_; }

    // Runs one parsed invocation and returns the operation's result. When
    // `out` is given the result is also printed there.
    virtual YAML::Node execute(const ParsedArgs& args, std::ostream* out = nullptr) const = 0;

protected:
    CommandInterface(TargetDescriptor target, std::string interface_name,
                     std::string interface_description, YAML::Node defaults);

    // Flags for every non-reserved parameter, honouring the external defaults.
    void append_parameter_flags(const std::vector<ParameterDescriptor>& params);

    // {constructor args, operation args}; reserved keys go to neither.
    std::pair<YAML::Node, YAML::Node> partition(const ParsedArgs& args) const;

    YAML::Node invoke(const OperationDescriptor& op, const ParsedArgs& args, std::ostream* out) const;

    TargetDescriptor target_;
    std::string name_;
    std::string description_;
    YAML::Node defaults_;
    Grammar grammar_;
};

// Exactly one entry operation, no action selector.
class SingleResponsibilityInterface : public CommandInterface {
public:
    SingleResponsibilityInterface(TargetDescriptor target, std::string entry_method_name,
                                  std::string interface_name,
                                  std::string interface_description = {},
                                  YAML::Node defaults = YAML::Node());

    const std::string& entry_method_name() const { return entry_method_name_; }

    YAML::Node execute(const ParsedArgs& args, std::ostream* out = nullptr) const override;

private:
    std::string entry_method_name_;
};

/**
 * @brief A positional action over a whitelisted subset of operations.
 *
 * Whitelisted operations without parameters become action tokens (with `_`
 * replaced by `-`), in whitelist order. Whitelisted operations that take
 * parameters contribute their flags instead and are not selectable.
 */
class MultipleResponsibilityInterface : public CommandInterface {
public:
    MultipleResponsibilityInterface(TargetDescriptor target,
                                    std::vector<std::string> supported_method_names,
                                    std::string interface_name,
                                    std::string interface_description = {},
                                    YAML::Node defaults = YAML::Node());

    const std::vector<std::string>& supported_method_names() const { return supported_; }
    const std::vector<std::string>& actions() const { return actions_; }

    YAML::Node execute(const ParsedArgs& args, std::ostream* out = nullptr) const override;

private:
    std::vector<std::string> supported_;
    std::vector<std::string> actions_;
};

// Attach an assembled interface to a parent dispatcher under `command_name`.
bool append_interface_to_command_set(CommandSet& parent, const std::string& command_name,
                                     const CommandInterface& interface);

} // namespace dyn
