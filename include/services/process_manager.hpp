// Simulated process managers for the sensor services
#pragma once

#include <string>
#include <yaml-cpp/yaml.h>

#include "descriptor/descriptors.hpp"
#include "nsm_state.hpp"

namespace dyn {

/**
 * @brief start/stop/restart/status over one service's entry in NsmState.
 *
 * Construction throws ServiceError when the service is not installed.
 */
class BaseProcessManager : public Target {
public:
    BaseProcessManager(NsmState& state, std::string service, bool stdout_enabled = true,
                       bool verbose = false, bool pretty_print_status = false);

    const std::string& service() const { return service_; }

    virtual YAML::Node start();
    virtual YAML::Node stop();
    virtual YAML::Node restart();
    // A map of status fields, or a rendered table when pretty printing.
    virtual YAML::Node status();

protected:
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;
    YAML::Node status_fields() const;
    YAML::Node render_status(const YAML::Node& fields) const;

    NsmState& state_;
    ServiceStatus& status_;
    std::string service_;
    bool stdout_;
    bool verbose_;
    bool pretty_print_status_;
};

// Adds the capture interfaces to the reported status.
class ZeekProcessManager : public BaseProcessManager {
public:
    ZeekProcessManager(NsmState& state, bool stdout_enabled = true, bool verbose = false,
                       bool pretty_print_status = false)
        : BaseProcessManager(state, "zeek", stdout_enabled, verbose, pretty_print_status) {}

    YAML::Node status() override;
};

} // namespace dyn
