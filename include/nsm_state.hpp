// Persisted service status and config objects of one sensor host
#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "config/config_objects.hpp"

namespace dyn {

struct ServiceStatus {
    bool installed = false;
    bool running = false;
    std::string install_directory;
    std::string configuration_directory;
    std::string log_directory;
    std::vector<std::string> capture_interfaces;
};

/**
 * @brief Everything the built-in managers act on, loaded from and saved to
 * a single YAML document.
 *
 * Layout:
 * @code
 *   services:   { <name>: { installed, running, install_directory, ... } }
 *   analyzers:  { <collection>: { supports_values, items: [...] } }
 *   filebeat:   { targets: { <target>: { enabled, <field>: ... } } }
 * @endcode
 */
class NsmState {
public:
    NsmState();
    NsmState(NsmState&&) = default;
    NsmState& operator=(NsmState&&) = default;

    // Built-in collections and targets; every service uninstalled.
    static NsmState defaults();

    // A missing file yields defaults(). Sections absent from the file keep their defaults.
    static NsmState load(const std::string& path);
    void save(const std::string& path) const;

    YAML::Node to_yaml() const;
    void merge_yaml(const YAML::Node& root);

    ServiceStatus& service(const std::string& name) { return services_[name]; }
    const ServiceStatus* find_service(const std::string& name) const;
    std::vector<std::string> service_names() const;

    AnalyzerCollection& analyzers(const std::string& name);

    TargetConfigObject& filebeat_target(const std::string& name);
    std::vector<std::string> filebeat_target_names() const;

private:
    std::map<std::string, ServiceStatus> services_;
    std::map<std::string, AnalyzerCollection> analyzers_;
    std::map<std::string, std::unique_ptr<TargetConfigObject>> targets_;
};

} // namespace dyn
