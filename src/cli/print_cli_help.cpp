// FILE: src/cli/print_cli_help.cpp
#include "cli/print_cli_help.hpp"

#include <iomanip>

namespace dyn {

void print_cli_help(const std::vector<Component>& components, std::ostream& out) {
    out << "Usage: dynamite [--config <file>] <component> <interface> [flags...] [action]\n\n"
        << "Options:\n"
        << "  -h, --help                 Show this help message\n"
        << "      --config <file>        Use a specific configuration file\n\n"
        << "Commands:\n"
        << "  grammar <component> <interface>\n"
        << "                             Print the derived grammar of an interface as JSON\n"
        << "  targets                    List registered target types and their operations\n\n"
        << "Components:\n";
    for (const auto& c : components) {
        out << "  " << std::left << std::setw(25) << c.name << c.description << "\n";
        for (const auto& e : c.interfaces) {
            out << "      " << std::left << std::setw(21) << e.name << e.help << "\n";
        }
    }
    out << "\nRun 'dynamite <component> <interface> --help' for the flags of one interface."
        << std::endl;
}

} // namespace dyn
