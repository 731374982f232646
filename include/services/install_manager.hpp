// Simulated install managers for the sensor services
#pragma once

#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "descriptor/descriptors.hpp"
#include "nsm_state.hpp"

namespace dyn {

class BaseInstallManager : public Target {
public:
    BaseInstallManager(NsmState& state, std::string service, std::string install_directory,
                       std::string configuration_directory, std::string log_directory,
                       bool stdout_enabled = true, bool verbose = false);

    const std::string& service() const { return service_; }

    // Records the directories and marks the service installed. Returns false
    // when it already was.
    virtual YAML::Node setup();

protected:
    void info(const std::string& msg) const;
    bool begin_setup();

    NsmState& state_;
    std::string service_;
    std::string install_directory_;
    std::string configuration_directory_;
    std::string log_directory_;
    bool stdout_;
    bool verbose_;
};

class ZeekInstallManager : public BaseInstallManager {
public:
    ZeekInstallManager(NsmState& state, std::string install_directory,
                       std::string configuration_directory, std::string log_directory,
                       bool stdout_enabled = true, bool verbose = false)
        : BaseInstallManager(state, "zeek", std::move(install_directory),
                             std::move(configuration_directory), std::move(log_directory),
                             stdout_enabled, verbose) {}

    using BaseInstallManager::setup;

    /**
     * @brief Install Zeek and bind it to the given capture interfaces.
     * @param capture_network_interfaces Interfaces to capture on (E.G mon0 mon1).
     *        When empty, every interface found on the host is used.
     * @throws ServiceError if an interface does not exist on this host.
     */
    YAML::Node setup(std::vector<std::string> capture_network_interfaces);
};

// Names under /sys/class/net, sorted. Empty when sysfs is unavailable.
std::vector<std::string> list_network_interfaces();

} // namespace dyn
