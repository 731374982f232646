// FILE: src/cli/components.cpp
#include "cli/components.hpp"

#include "config/config_interfaces.hpp"
#include "services/builtin_targets.hpp"

namespace dyn {

namespace {

InterfaceEntry command_entry(std::shared_ptr<const CommandInterface> iface, const std::string& name) {
    InterfaceEntry e;
    e.kind = InterfaceKind::Command;
    e.name = name;
    e.help = iface->description();
    e.command = std::move(iface);
    return e;
}

InterfaceEntry object_entry(InterfaceKind kind, const std::string& name, const std::string& object_name,
                            const std::string& help) {
    InterfaceEntry e;
    e.kind = kind;
    e.name = name;
    e.help = help;
    e.object_name = object_name;
    return e;
}

} // namespace

const InterfaceEntry* Component::find(const std::string& interface_name) const {
    for (const auto& e : interfaces)
        if (e.name == interface_name) return &e;
    return nullptr;
}

Grammar Component::grammar(const InterfaceEntry& entry, NsmState& state) const {
    const std::string prog = "dynamite " + name + " " + entry.name;
    switch (entry.kind) {
    case InterfaceKind::Command:
        return entry.command->grammar();
    case InterfaceKind::Analyzers:
        return AnalyzersInterface(state.analyzers(entry.object_name)).grammar(prog);
    case InterfaceKind::Targets:
        return TargetsInterface(state.filebeat_target(entry.object_name)).grammar(prog);
    }
    throw CliError(CliErrc::UnknownOperation, "Unknown interface kind for '" + entry.name + "'.");
}

CommandSet Component::command_set(NsmState& state) const {
    CommandSet cs("dynamite " + name, description);
    for (const auto& e : interfaces) {
        if (e.kind == InterfaceKind::Command) {
            append_interface_to_command_set(cs, e.name, *e.command);
        } else {
            cs.add_command(e.name, e.help, grammar(e, state));
        }
    }
    return cs;
}

std::vector<Component> build_components(const TargetRegistry& registry, const CliConfig& config) {
    static const std::vector<std::string> kProcessActions = {"start", "stop", "restart", "status"};

    std::vector<Component> out;
    for (const auto& service : builtin_services()) {
        Component c;
        c.name = service;
        c.description = "Manage the " + service + " service.";
        c.interfaces.push_back(command_entry(
            std::make_shared<MultipleResponsibilityInterface>(
                registry.at(make_key(service, "process")), kProcessActions, "dynamite " + service + " process",
                "Start, stop, restart or check the status of " + service + "."),
            "process"));
        c.interfaces.push_back(command_entry(
            std::make_shared<SingleResponsibilityInterface>(
                registry.at(make_key(service, "install")), "setup", "dynamite " + service + " install",
                "Install " + service + " as a standalone component.", install_defaults(config, service)),
            "install"));
        out.push_back(std::move(c));
    }

    for (auto& c : out) {
        if (c.name == "zeek") {
            c.interfaces.push_back(object_entry(InterfaceKind::Analyzers, "scripts", "zeek.scripts",
                                                "Enable or disable Zeek scripts."));
            c.interfaces.push_back(object_entry(InterfaceKind::Analyzers, "signatures", "zeek.signatures",
                                                "Enable or disable Zeek signatures."));
            c.interfaces.push_back(object_entry(InterfaceKind::Analyzers, "definitions", "zeek.definitions",
                                                "Enable, disable or redefine Zeek definitions."));
        } else if (c.name == "suricata") {
            c.interfaces.push_back(object_entry(InterfaceKind::Analyzers, "rules", "suricata.rules",
                                                "Enable or disable Suricata rule-sets."));
        }
    }

    Component filebeat;
    filebeat.name = "filebeat";
    filebeat.description = "Configure where Filebeat sends events.";
    for (const char* target : {"elasticsearch", "logstash", "kafka"}) {
        filebeat.interfaces.push_back(object_entry(InterfaceKind::Targets, target, target,
                                                   std::string("Configure the ") + target + " target."));
    }
    out.push_back(std::move(filebeat));
    return out;
}

const Component* find_component(const std::vector<Component>& components, const std::string& name) {
    for (const auto& c : components)
        if (c.name == name) return &c;
    return nullptr;
}

} // namespace dyn
