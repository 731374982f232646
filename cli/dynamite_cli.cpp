// FILE: cli/dynamite_cli.cpp
#include <getopt.h>
#include <iostream>
#include <string>
#include <vector>

#include "cli/components.hpp"
#include "cli/print_cli_help.hpp"
#include "cli/process_command.hpp"
#include "cli_config.hpp"
#include "descriptor/target_registry.hpp"
#include "nsm_state.hpp"
#include "services/builtin_targets.hpp"
#include "services/service_error.hpp"

using namespace dyn;

int main(int argc, char** argv) {
    // Fast path: top-level help needs no config or state on disk.
    if (argc < 2 || std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help") {
        NsmState state = NsmState::defaults();
        TargetRegistry registry;
        register_builtin_targets(registry, state);
        print_cli_help(build_components(registry, CliConfig{}), std::cout);
        return argc < 2 ? 1 : 0;
    }

    std::string custom_config_path;

    // '+' stops at the component name; everything after it belongs to the interface grammar.
    const char* const short_opts = "+";
    const option long_opts[] = {
        {"config", required_argument, nullptr, 2001},
        {nullptr, 0, nullptr, 0}
    };

    opterr = 0;
    int opt;
    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        if (opt == 2001) {
            custom_config_path = optarg;
        } else {
            std::cerr << "Error: Unknown option '" << argv[optind - 1] << "'. Run 'dynamite --help'." << std::endl;
            return 1;
        }
    }
    std::vector<std::string> args(argv + optind, argv + argc);

    CliConfig config;
    std::string config_to_load = custom_config_path.empty() ? "config.yaml" : custom_config_path;
    load_or_create_config(config_to_load, config);

    try {
        NsmState state = NsmState::load(config.state_path);
        TargetRegistry registry;
        register_builtin_targets(registry, state);
        const std::vector<Component> components = build_components(registry, config);

        CliContext ctx{config, state, registry, components, std::cout};
        return process_command(args, ctx);
    } catch (const CliError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return e.code() == CliErrc::Usage ? 1 : 2;
    } catch (const ServiceError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }
}
