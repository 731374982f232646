#include "services/process_manager.hpp"

#include <iostream>

#include "config/change_set.hpp"
#include "kernel/param_utils.hpp"
#include "services/service_error.hpp"

namespace dyn {

BaseProcessManager::BaseProcessManager(NsmState& state, std::string service, bool stdout_enabled,
                                       bool verbose, bool pretty_print_status)
    : state_(state),
      status_(state.service(service)),
      service_(std::move(service)),
      stdout_(stdout_enabled),
      verbose_(verbose),
      pretty_print_status_(pretty_print_status) {
    if (!status_.installed)
        throw ServiceError(service_, service_ + " is not installed. Install it with 'dynamite " + service_ +
                                         " install -h'");
}

void BaseProcessManager::info(const std::string& msg) const {
    if (stdout_) std::cout << "[+] " << msg << std::endl;
}

void BaseProcessManager::debug(const std::string& msg) const {
    if (stdout_ && verbose_) std::cout << "[d] " << msg << std::endl;
}

YAML::Node BaseProcessManager::start() {
    if (status_.running) {
        info(service_ + " is already running.");
        return YAML::Node(true);
    }
    debug("Starting " + service_ + " from " + status_.install_directory);
    status_.running = true;
    info("Started " + service_ + ".");
    return YAML::Node(true);
}

YAML::Node BaseProcessManager::stop() {
    if (!status_.running) {
        info(service_ + " is not running.");
        return YAML::Node(true);
    }
    status_.running = false;
    info("Stopped " + service_ + ".");
    return YAML::Node(true);
}

YAML::Node BaseProcessManager::restart() {
    stop();
    return start();
}

YAML::Node BaseProcessManager::status_fields() const {
    YAML::Node fields;
    fields["service"] = service_;
    fields["running"] = status_.running;
    fields["install_directory"] = status_.install_directory;
    fields["configuration_directory"] = status_.configuration_directory;
    fields["log_directory"] = status_.log_directory;
    return fields;
}

YAML::Node BaseProcessManager::render_status(const YAML::Node& fields) const {
    if (!pretty_print_status_) return fields;
    Report report;
    report.headers = {"Field", "Value"};
    for (const auto& kv : fields) {
        std::string value = value_to_string(kv.second);
        report.rows.push_back({kv.first.as<std::string>(), value.empty() ? "N/A" : value});
    }
    return YAML::Node(report.render());
}

YAML::Node BaseProcessManager::status() {
    return render_status(status_fields());
}

YAML::Node ZeekProcessManager::status() {
    YAML::Node fields = status_fields();
    fields["capture_interfaces"] = status_.capture_interfaces;
    fields["workers"] = static_cast<int>(status_.capture_interfaces.size());
    return render_status(fields);
}

} // namespace dyn
