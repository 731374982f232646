// FILE: src/cli/interfaces.cpp
#include "cli/interfaces.hpp"

#include <algorithm>

#include "kernel/param_utils.hpp"

namespace dyn {

namespace {

void print_result(std::ostream& out, const YAML::Node& result) {
    if (!result.IsDefined() || result.IsNull()) return;
    if (result.IsScalar()) {
        out << result.Scalar() << "\n";
        return;
    }
    out << result << "\n";
}

}  // namespace

CommandInterface::CommandInterface(TargetDescriptor target, std::string interface_name,
                                   std::string interface_description, YAML::Node defaults)
    : target_(std::move(target)),
      name_(std::move(interface_name)),
      description_(std::move(interface_description)),
      defaults_(defaults.IsDefined() ? YAML::Clone(defaults) : YAML::Node(YAML::NodeType::Map)) {
    if (description_.empty()) description_ = target_.description;
    grammar_ = Grammar(name_, description_);
    append_parameter_flags(target_.constructor.parameters);
}

void CommandInterface::append_parameter_flags(const std::vector<ParameterDescriptor>& params) {
    const YAML::Node& defaults = defaults_;
    for (const auto& p : params) {
        if (p.is_reserved) continue;
        YAML::Node override_value = defaults.IsMap() ? defaults[p.name] : YAML::Node();
        // a colliding switch keeps the first definition
        grammar_.add_flag(map_parameter(p, override_value, p.description));
    }
}

std::pair<YAML::Node, YAML::Node> CommandInterface::partition(const ParsedArgs& args) const {
    YAML::Node ctor_args(YAML::NodeType::Map);
    YAML::Node op_args(YAML::NodeType::Map);
    const auto& base = target_.constructor.parameters;
    for (auto it = args.begin(); it != args.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        if (is_reserved_name(key)) continue;
        bool is_base = std::any_of(base.begin(), base.end(), [&](const ParameterDescriptor& p) {
            return !p.is_reserved && p.name == key;
        });
        if (is_base) ctor_args[key] = it->second;
        else op_args[key] = it->second;
    }
    return {ctor_args, op_args};
}

YAML::Node CommandInterface::invoke(const OperationDescriptor& op, const ParsedArgs& args,
                                    std::ostream* out) const {
    auto bags = partition(args);
    std::unique_ptr<Target> instance = target_.construct(bags.first);
    YAML::Node result = op.invoke(*instance, bags.second);
    if (out) print_result(*out, result);
    return result;
}

SingleResponsibilityInterface::SingleResponsibilityInterface(TargetDescriptor target,
                                                             std::string entry_method_name,
                                                             std::string interface_name,
                                                             std::string interface_description,
                                                             YAML::Node defaults)
    : CommandInterface(std::move(target), std::move(interface_name),
                       std::move(interface_description), defaults),
      entry_method_name_(std::move(entry_method_name)) {
    const OperationDescriptor* op = target_.find_operation(entry_method_name_);
    if (!op) {
        throw CliError(CliErrc::UnknownOperation,
                       "'" + target_.name + "' has no operation '" + entry_method_name_ + "'.");
    }
    append_parameter_flags(op->parameters);
}

YAML::Node SingleResponsibilityInterface::execute(const ParsedArgs& args, std::ostream* out) const {
    return invoke(*target_.find_operation(entry_method_name_), args, out);
}

MultipleResponsibilityInterface::MultipleResponsibilityInterface(
    TargetDescriptor target, std::vector<std::string> supported_method_names,
    std::string interface_name, std::string interface_description, YAML::Node defaults)
    : CommandInterface(std::move(target), std::move(interface_name),
                       std::move(interface_description), defaults),
      supported_(std::move(supported_method_names)) {
    for (const auto& method : supported_) {
        const OperationDescriptor* op = target_.find_operation(method);
        if (!op) continue;
        if (op->parameters.empty()) {
            actions_.push_back(to_flag_name(method));
        } else {
            append_parameter_flags(op->parameters);
        }
    }
    if (!actions_.empty()) grammar_.set_action(actions_);
}

YAML::Node MultipleResponsibilityInterface::execute(const ParsedArgs& args, std::ostream* out) const {
    const std::string token = as_str(args, kActionKey);
    if (token.empty()) {
        throw CliError(CliErrc::Usage, name_ + ": no action selected.");
    }
    if (std::find(actions_.begin(), actions_.end(), token) == actions_.end()) {
        throw CliError(CliErrc::Usage, name_ + ": invalid action '" + token + "'.");
    }
    const OperationDescriptor* op = target_.find_operation(from_flag_name(token));
    return invoke(*op, args, out);
}

bool append_interface_to_command_set(CommandSet& parent, const std::string& command_name,
                                     const CommandInterface& interface) {
    return parent.add_command(command_name, interface.description(), interface.grammar());
}

} // namespace dyn
