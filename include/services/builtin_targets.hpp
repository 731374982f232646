// Descriptors for the built-in service managers
#pragma once

#include <string>
#include <vector>

#include "cli_config.hpp"
#include "descriptor/target_registry.hpp"
#include "nsm_state.hpp"

namespace dyn {

// Services with a process and an install interface.
const std::vector<std::string>& builtin_services();

// "<service>.process" over BaseProcessManager: start, stop, restart, status.
TargetDescriptor process_descriptor(NsmState& state, const std::string& service);
// "<service>.install" over BaseInstallManager: setup.
TargetDescriptor install_descriptor(NsmState& state, const std::string& service);

/**
 * @brief Register the process and install descriptors of every built-in
 * service. The managers act on `state`, which must outlive the registry.
 *
 * Zeek registers its own subclasses: `zeek.process` redefines `status` and
 * `zeek.install` redefines `setup`; the remaining operations are inherited.
 */
void register_builtin_targets(TargetRegistry& registry, NsmState& state);

// External defaults of "<service>.install": directories under the configured roots.
YAML::Node install_defaults(const CliConfig& config, const std::string& service);

} // namespace dyn
