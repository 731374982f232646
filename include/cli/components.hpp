// FILE: include/cli/components.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "cli/command_set.hpp"
#include "cli/interfaces.hpp"
#include "cli_config.hpp"
#include "descriptor/target_registry.hpp"
#include "nsm_state.hpp"

namespace dyn {

enum class InterfaceKind { Command, Analyzers, Targets };

// One `<component> <interface>` entry point.
struct InterfaceEntry {
    InterfaceKind kind = InterfaceKind::Command;
    std::string name;
    std::string help;
    // Kind::Command only.
    std::shared_ptr<const CommandInterface> command;
    // Analyzer collection or filebeat target name in NsmState.
    std::string object_name;
};

struct Component {
    std::string name;
    std::string description;
    std::vector<InterfaceEntry> interfaces;

    const InterfaceEntry* find(const std::string& interface_name) const;
    // Parent dispatcher over every interface of this component.
    CommandSet command_set(NsmState& state) const;
    Grammar grammar(const InterfaceEntry& entry, NsmState& state) const;
};

/**
 * @brief The built-in command surface: one component per service, with
 * `process` and `install` interfaces, plus the Zeek and Suricata analyzer
 * collections and the Filebeat downstream targets.
 */
std::vector<Component> build_components(const TargetRegistry& registry, const CliConfig& config);

const Component* find_component(const std::vector<Component>& components, const std::string& name);

} // namespace dyn
