#include "services/builtin_targets.hpp"

#include "descriptor/target_builder.hpp"
#include "kernel/param_utils.hpp"
#include "services/install_manager.hpp"
#include "services/process_manager.hpp"

namespace dyn {

namespace {

std::vector<ParameterDescriptor> process_params() {
    return {
        make_param("stdout", SemanticType::boolean(), "Print output to console"),
        make_param("verbose", SemanticType::boolean(), "Include detailed debug messages"),
        make_param("pretty_print_status", SemanticType::boolean(),
                   "Print the status in a more human-readable format"),
    };
}

std::vector<ParameterDescriptor> install_params(const std::string& service) {
    return {
        make_param("install_directory", SemanticType::string(),
                   "Path to the install directory (E.G /opt/dynamite/" + service + "/)"),
        make_param("configuration_directory", SemanticType::string(),
                   "Path to the configuration directory (E.G /etc/dynamite/" + service + "/)"),
        make_param("log_directory", SemanticType::string(),
                   "Path to the log directory (E.G /var/log/dynamite/" + service + "/)"),
        make_param("stdout", SemanticType::boolean(), "Print output to console"),
        make_param("verbose", SemanticType::boolean(), "Include detailed debug messages"),
    };
}

template <typename Builder>
Builder& with_process_operations(Builder& b) {
    b.operation("start", {}, [](BaseProcessManager& m, const YAML::Node&) { return m.start(); },
                "Start the service");
    b.operation("stop", {}, [](BaseProcessManager& m, const YAML::Node&) { return m.stop(); },
                "Stop the service");
    b.operation("restart", {}, [](BaseProcessManager& m, const YAML::Node&) { return m.restart(); },
                "Restart the service");
    b.operation("status", {}, [](BaseProcessManager& m, const YAML::Node&) { return m.status(); },
                "Print the status of the service");
    return b;
}

} // namespace

const std::vector<std::string>& builtin_services() {
    static const std::vector<std::string> names = {"elasticsearch", "logstash", "kibana", "zeek", "suricata"};
    return names;
}

TargetDescriptor process_descriptor(NsmState& state, const std::string& service) {
    TargetBuilder<BaseProcessManager> b(make_key(service, "process"), "Start, stop and check " + service);
    b.constructor(process_params(), [&state, service](const YAML::Node& a) {
        return std::make_unique<BaseProcessManager>(state, service,
                                                    as_bool_flexible(a, "stdout", false),
                                                    as_bool_flexible(a, "verbose", false),
                                                    as_bool_flexible(a, "pretty_print_status", false));
    });
    return with_process_operations(b).build();
}

TargetDescriptor install_descriptor(NsmState& state, const std::string& service) {
    TargetBuilder<BaseInstallManager> b(make_key(service, "install"), "Install " + service);
    b.constructor(install_params(service), [&state, service](const YAML::Node& a) {
        return std::make_unique<BaseInstallManager>(state, service, as_str(a, "install_directory"),
                                                    as_str(a, "configuration_directory"),
                                                    as_str(a, "log_directory"),
                                                    as_bool_flexible(a, "stdout", false),
                                                    as_bool_flexible(a, "verbose", false));
    });
    b.operation("setup", {}, [](BaseInstallManager& m, const YAML::Node&) { return m.setup(); },
                "Install " + service);
    return b.build();
}

void register_builtin_targets(TargetRegistry& registry, NsmState& state) {
    for (const auto& service : builtin_services()) {
        if (service == "zeek") continue;
        registry.register_target(process_descriptor(state, service));
        registry.register_target(install_descriptor(state, service));
    }

    TargetBuilder<ZeekProcessManager> zeek_process(make_key("zeek", "process"),
                                                   "Start, stop and check zeek");
    zeek_process
        .constructor(process_params(), [&state](const YAML::Node& a) {
            return std::make_unique<ZeekProcessManager>(state, as_bool_flexible(a, "stdout", false),
                                                        as_bool_flexible(a, "verbose", false),
                                                        as_bool_flexible(a, "pretty_print_status", false));
        })
        .operation("status", {}, [](ZeekProcessManager& m, const YAML::Node&) { return m.status(); },
                   "Print the status of zeek and its capture workers")
        .inherit(process_descriptor(state, "zeek"));
    registry.register_target(zeek_process.build());

    TargetBuilder<ZeekInstallManager> zeek_install(make_key("zeek", "install"), "Install zeek");
    zeek_install
        .constructor(install_params("zeek"), [&state](const YAML::Node& a) {
            return std::make_unique<ZeekInstallManager>(state, as_str(a, "install_directory"),
                                                        as_str(a, "configuration_directory"),
                                                        as_str(a, "log_directory"),
                                                        as_bool_flexible(a, "stdout", false),
                                                        as_bool_flexible(a, "verbose", false));
        })
        .operation("setup",
                   {make_param("capture_network_interfaces",
                               SemanticType::optional_of(SemanticType::list_of(SemanticType::string())),
                               "A list of network interfaces to capture on (E.G mon0 mon1)")},
                   [](ZeekInstallManager& m, const YAML::Node& a) {
                       return m.setup(as_str_list(a, "capture_network_interfaces"));
                   },
                   "Install zeek")
        .inherit(install_descriptor(state, "zeek"));
    registry.register_target(zeek_install.build());
}

YAML::Node install_defaults(const CliConfig& config, const std::string& service) {
    const auto under = [&service](const std::string& root) { return (fs::path(root) / service).string(); };
    YAML::Node d;
    d["install_directory"] = under(config.install_root);
    d["configuration_directory"] = under(config.config_root);
    d["log_directory"] = under(config.log_root);
    return d;
}

} // namespace dyn
