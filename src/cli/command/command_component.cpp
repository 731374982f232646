// FILE: src/cli/command/command_component.cpp
#include <algorithm>
#include <iostream>

#include "cli/argument_parser.hpp"
#include "cli/command/commands.hpp"
#include "config/config_interfaces.hpp"
#include "kernel/param_utils.hpp"

namespace dyn {

namespace {

bool is_truthy(const YAML::Node& result) {
    if (!result.IsDefined() || result.IsNull()) return false;
    if (result.IsScalar()) {
        const std::string& s = result.Scalar();
        return !s.empty() && s != "false" && s != "0";
    }
    return result.size() > 0;
}

// Persist the mutated object and show what changed.
void commit(const ChangeSet& changes, CliContext& ctx) {
    ctx.state.save(ctx.config.state_path);
    print_report(change_set_report(changes), ctx.config, ctx.out);
}

int run_command_interface(const CommandInterface& iface, ParsedArgs values, CliContext& ctx) {
    std::ostream* out = ctx.config.print_results ? &ctx.out : nullptr;
    const auto* multi = dynamic_cast<const MultipleResponsibilityInterface*>(&iface);
    const std::string action = as_str(values, kActionKey);
    const bool has_status = multi && std::find(multi->actions().begin(), multi->actions().end(), "status") !=
                                         multi->actions().end();
    if (!has_status || action == "status") {
        iface.execute(values, out);
        ctx.state.save(ctx.config.state_path);
        return 0;
    }
    // Follow a lifecycle action with the resulting status.
    YAML::Node result = iface.execute(values);
    ctx.state.save(ctx.config.state_path);
    if (is_truthy(result)) {
        values[kActionKey] = "status";
        iface.execute(values, out);
    }
    return 0;
}

} // namespace

void print_report(const Report& report, const CliConfig& config, std::ostream& out) {
    if (config.report_format == "json") {
        out << report.to_json().dump(2) << std::endl;
    } else {
        out << report.render() << std::endl;
    }
}

int handle_component(const Component& component, const std::vector<std::string>& args, CliContext& ctx) {
    CommandSet cs = component.command_set(ctx.state);
    if (args.empty()) {
        ctx.out << cs.format_help();
        return 1;
    }
    if (wants_help(args)) {
        const InterfaceEntry* entry = component.find(args.front());
        ctx.out << (entry ? component.grammar(*entry, ctx.state).format_help() : cs.format_help());
        return 0;
    }

    ParsedArgs values = cs.parse(args);
    const InterfaceEntry* entry = component.find(as_str(values, kSubInterfaceKey));
    if (!entry) throw CliError(CliErrc::Usage, "No interface selected.");

    switch (entry->kind) {
    case InterfaceKind::Command:
        return run_command_interface(*entry->command, values, ctx);
    case InterfaceKind::Analyzers: {
        AnalyzersInterface iface(ctx.state.analyzers(entry->object_name));
        auto result = iface.execute(values);
        if (result.report) print_report(*result.report, ctx.config, ctx.out);
        else commit(result.changes, ctx);
        return 0;
    }
    case InterfaceKind::Targets: {
        TargetsInterface iface(ctx.state.filebeat_target(entry->object_name));
        auto result = iface.execute(values);
        if (result.report) print_report(*result.report, ctx.config, ctx.out);
        else commit(result.changes, ctx);
        return 0;
    }
    }
    return 0;
}

} // namespace dyn
