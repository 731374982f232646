// CLI configuration YAML read/write implementation
#include "cli_config.hpp"

#include <fstream>
#include <iostream>
#include <yaml-cpp/yaml.h>
#include "dyn_types.hpp" // for dyn::fs alias

namespace dyn {

bool write_config_to_file(const CliConfig& config, const std::string& path) {
    YAML::Node root;
    root["_comment1"] = "Dynamite CLI configuration.";
    root["state_path"] = config.state_path;
    root["report_format"] = config.report_format;
    root["print_results"] = config.print_results;
    root["install_root"] = config.install_root;
    root["config_root"] = config.config_root;
    root["log_root"] = config.log_root;

    std::ofstream fout(path);
    if (!fout) return false;
    fout << root;
    return static_cast<bool>(fout);
}

void load_or_create_config(const std::string& config_path, CliConfig& config) {
    if (fs::exists(config_path)) {
        config.loaded_config_path = fs::absolute(config_path).string();
        try {
            YAML::Node root = YAML::LoadFile(config_path);
            if (root["state_path"]) config.state_path = root["state_path"].as<std::string>();
            if (root["report_format"]) config.report_format = root["report_format"].as<std::string>();
            if (root["print_results"]) config.print_results = root["print_results"].as<bool>();
            if (root["install_root"]) config.install_root = root["install_root"].as<std::string>();
            if (root["config_root"]) config.config_root = root["config_root"].as<std::string>();
            if (root["log_root"]) config.log_root = root["log_root"].as<std::string>();
        } catch (const std::exception& e) {
            std::cerr << "Warning: Could not parse config file '" << config_path
                      << "'. Using default settings. Error: " << e.what() << std::endl;
        }
        if (config.report_format != "table" && config.report_format != "json") {
            std::cerr << "Warning: Unknown report_format '" << config.report_format
                      << "'. Falling back to 'table'." << std::endl;
            config.report_format = "table";
        }
    } else if (config_path == "config.yaml") {
        std::cout << "Configuration file 'config.yaml' not found. Creating a default one." << std::endl;
        config = CliConfig{};
        if (write_config_to_file(config, "config.yaml")) {
            config.loaded_config_path = fs::absolute("config.yaml").string();
        }
    }
}

} // namespace dyn
