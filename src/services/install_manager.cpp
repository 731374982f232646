#include "services/install_manager.hpp"

#include <algorithm>
#include <iostream>

#include "dyn_types.hpp"
#include "services/service_error.hpp"

namespace dyn {

std::vector<std::string> list_network_interfaces() {
    std::vector<std::string> names;
    std::error_code ec;
    const fs::path root("/sys/class/net");
    if (!fs::is_directory(root, ec)) return names;
    for (const auto& entry : fs::directory_iterator(root, ec)) {
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

BaseInstallManager::BaseInstallManager(NsmState& state, std::string service,
                                       std::string install_directory,
                                       std::string configuration_directory,
                                       std::string log_directory, bool stdout_enabled, bool verbose)
    : state_(state),
      service_(std::move(service)),
      install_directory_(std::move(install_directory)),
      configuration_directory_(std::move(configuration_directory)),
      log_directory_(std::move(log_directory)),
      stdout_(stdout_enabled),
      verbose_(verbose) {
    if (install_directory_.empty() || configuration_directory_.empty()) {
        throw ServiceError(service_, "install and configuration directories must be set.");
    }
}

void BaseInstallManager::info(const std::string& msg) const {
    if (stdout_) std::cout << "[+] " << msg << std::endl;
}

bool BaseInstallManager::begin_setup() {
    ServiceStatus& s = state_.service(service_);
    if (s.installed) {
        std::cerr << "Warning: " << service_ << " is already installed at '" << s.install_directory
                  << "'." << std::endl;
        return false;
    }
    if (verbose_) info("Creating directory: " + configuration_directory_);
    if (verbose_) info("Creating directory: " + install_directory_);
    s.install_directory = install_directory_;
    s.configuration_directory = configuration_directory_;
    s.log_directory = log_directory_;
    return true;
}

YAML::Node BaseInstallManager::setup() {
    if (!begin_setup()) return YAML::Node(false);
    state_.service(service_).installed = true;
    info("Installed " + service_ + " to " + install_directory_ + ".");
    return YAML::Node(true);
}

YAML::Node ZeekInstallManager::setup(std::vector<std::string> capture_network_interfaces) {
    const std::vector<std::string> available = list_network_interfaces();
    if (capture_network_interfaces.empty()) capture_network_interfaces = available;
    if (!available.empty()) {
        for (const auto& name : capture_network_interfaces) {
            if (std::find(available.begin(), available.end(), name) == available.end()) {
                throw ServiceError(service_, "Network interface '" + name + "' was not found.");
            }
        }
    }
    if (!begin_setup()) return YAML::Node(false);
    ServiceStatus& s = state_.service(service_);
    s.capture_interfaces = capture_network_interfaces;
    s.installed = true;
    for (const auto& name : capture_network_interfaces) info("Adding capture worker on " + name + ".");
    info("Installed " + service_ + " to " + install_directory_ + ".");
    return YAML::Node(true);
}

} // namespace dyn
