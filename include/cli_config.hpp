// Lightweight CLI configuration definition and I/O declarations
#pragma once

#include <string>

namespace dyn {

struct CliConfig {
    std::string loaded_config_path;
    // Where service state and config objects are persisted between runs.
    std::string state_path = "nsm_state.yaml";
    // "table" (box-drawn) or "json".
    std::string report_format = "table";
    // Print the value returned by an operation after dispatch.
    bool print_results = true;
    std::string install_root = "/opt/dynamite";
    std::string config_root = "/etc/dynamite";
    std::string log_root = "/var/log/dynamite";
};

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
bool write_config_to_file(const CliConfig& config, const std::string& path);

// Load an existing config from `config_path` if it exists.
// If `config_path` is the default "config.yaml" and does not exist, create it with defaults.
void load_or_create_config(const std::string& config_path, CliConfig& config);

} // namespace dyn
