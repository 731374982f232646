#include "nsm_state.hpp"

#include <fstream>
#include <iostream>

#include "config/filebeat_targets.hpp"
#include "dyn_types.hpp"

namespace dyn {

namespace {

const char* const kServiceNames[] = {"elasticsearch", "logstash", "kibana", "zeek", "suricata"};

AnalyzerCollection zeek_scripts() {
    return AnalyzerCollection("zeek.scripts", false, {
        {1, "policy/frameworks/dpd/detect-protocols", true, std::nullopt},
        {2, "policy/protocols/conn/known-hosts", true, std::nullopt},
        {3, "policy/protocols/conn/known-services", false, std::nullopt},
        {4, "policy/protocols/ssl/validate-certs", false, std::nullopt},
        {5, "policy/protocols/ssh/detect-bruteforcing", true, std::nullopt},
    });
}

AnalyzerCollection zeek_signatures() {
    return AnalyzerCollection("zeek.signatures", false, {
        {1, "frameworks/signatures/detect-windows-shells", false, std::nullopt},
        {2, "policy/misc/dump-events", false, std::nullopt},
    });
}

AnalyzerCollection zeek_definitions() {
    return AnalyzerCollection("zeek.definitions", true, {
        {1, "Site::local_nets", true, std::string("{ 10.0.0.0/8, 172.16.0.0/12, 192.168.0.0/16 };")},
        {2, "SSL::disable_analyzer_after_detection", false, std::string("F;")},
        {3, "Notice::mail_dest", false, std::nullopt},
    });
}

AnalyzerCollection suricata_rules() {
    return AnalyzerCollection("suricata.rules", false, {
        {1, "emerging-dns.rules", true, std::nullopt},
        {2, "emerging-malware.rules", true, std::nullopt},
        {3, "emerging-scan.rules", false, std::nullopt},
        {4, "emerging-policy.rules", false, std::nullopt},
    });
}

} // namespace

NsmState::NsmState() {
    targets_["elasticsearch"] = std::make_unique<ElasticsearchTarget>();
    targets_["logstash"] = std::make_unique<LogstashTarget>();
    targets_["kafka"] = std::make_unique<KafkaTarget>();
}

NsmState NsmState::defaults() {
    NsmState state;
    for (const char* name : kServiceNames) state.services_[name] = ServiceStatus{};
    for (auto c : {zeek_scripts(), zeek_signatures(), zeek_definitions(), suricata_rules()}) {
        std::string key = c.name();
        state.analyzers_.emplace(key, std::move(c));
    }
    auto& es = static_cast<ElasticsearchTarget&>(*state.targets_["elasticsearch"]);
    es.target_strings = {"https://localhost:9200"};
    es.index = "dynamite-events-%{+YYYY.MM.dd}";
    es.username = "admin";
    es.set_enabled(true);
    auto& ls = static_cast<LogstashTarget&>(*state.targets_["logstash"]);
    ls.pipelining = 2;
    return state;
}

NsmState NsmState::load(const std::string& path) {
    NsmState state = defaults();
    if (!fs::exists(path)) return state;
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw CliError(CliErrc::InvalidYaml, "Could not parse state file '" + path + "': " + e.what());
    }
    state.merge_yaml(root);
    return state;
}

void NsmState::save(const std::string& path) const {
    const fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
    std::ofstream fout(path);
    if (!fout) throw CliError(CliErrc::Io, "Could not open state file '" + path + "' for writing.");
    fout << to_yaml() << std::endl;
    if (!fout) throw CliError(CliErrc::Io, "Failed while writing state file '" + path + "'.");
}

YAML::Node NsmState::to_yaml() const {
    YAML::Node root;
    for (const auto& [name, s] : services_) {
        YAML::Node n;
        n["installed"] = s.installed;
        n["running"] = s.running;
        n["install_directory"] = s.install_directory;
        n["configuration_directory"] = s.configuration_directory;
        n["log_directory"] = s.log_directory;
        n["capture_interfaces"] = s.capture_interfaces;
        root["services"][name] = n;
    }
    for (const auto& [name, c] : analyzers_) root["analyzers"][name] = c.to_yaml();
    for (const auto& [name, t] : targets_) root["filebeat"]["targets"][name] = t->to_yaml();
    return root;
}

void NsmState::merge_yaml(const YAML::Node& root) {
    if (!root || root.IsNull()) return;
    if (!root.IsMap()) throw CliError(CliErrc::InvalidYaml, "State document must be a map.");

    if (root["services"] && root["services"].IsMap()) {
        for (const auto& kv : root["services"]) {
            const std::string name = kv.first.as<std::string>();
            const YAML::Node& n = kv.second;
            ServiceStatus& s = services_[name];
            try {
                if (n["installed"]) s.installed = n["installed"].as<bool>();
                if (n["running"]) s.running = n["running"].as<bool>();
                if (n["install_directory"]) s.install_directory = n["install_directory"].as<std::string>();
                if (n["configuration_directory"])
                    s.configuration_directory = n["configuration_directory"].as<std::string>();
                if (n["log_directory"]) s.log_directory = n["log_directory"].as<std::string>();
                if (n["capture_interfaces"] && n["capture_interfaces"].IsSequence())
                    s.capture_interfaces = n["capture_interfaces"].as<std::vector<std::string>>();
            } catch (const YAML::Exception& e) {
                throw CliError(CliErrc::InvalidYaml, "services." + name + ": " + e.what());
            }
        }
    }

    if (root["analyzers"] && root["analyzers"].IsMap()) {
        for (const auto& kv : root["analyzers"]) {
            const std::string name = kv.first.as<std::string>();
            analyzers_[name] = AnalyzerCollection::from_yaml(name, kv.second);
        }
    }

    const YAML::Node targets = root["filebeat"] ? root["filebeat"]["targets"] : YAML::Node();
    if (targets && targets.IsMap()) {
        for (const auto& kv : targets) {
            const std::string name = kv.first.as<std::string>();
            auto it = targets_.find(name);
            if (it == targets_.end()) {
                std::cerr << "Warning: Ignoring unknown filebeat target '" << name << "' in state file." << std::endl;
                continue;
            }
            it->second->load_yaml(kv.second);
        }
    }
}

const ServiceStatus* NsmState::find_service(const std::string& name) const {
    auto it = services_.find(name);
    return it == services_.end() ? nullptr : &it->second;
}

std::vector<std::string> NsmState::service_names() const {
    std::vector<std::string> names;
    for (const auto& kv : services_) names.push_back(kv.first);
    return names;
}

AnalyzerCollection& NsmState::analyzers(const std::string& name) {
    auto it = analyzers_.find(name);
    if (it == analyzers_.end())
        throw CliError(CliErrc::UnknownOperation, "No analyzer collection named '" + name + "'.");
    return it->second;
}

TargetConfigObject& NsmState::filebeat_target(const std::string& name) {
    auto it = targets_.find(name);
    if (it == targets_.end())
        throw CliError(CliErrc::UnknownOperation, "No filebeat target named '" + name + "'.");
    return *it->second;
}

std::vector<std::string> NsmState::filebeat_target_names() const {
    std::vector<std::string> names;
    for (const auto& kv : targets_) names.push_back(kv.first);
    return names;
}

} // namespace dyn
