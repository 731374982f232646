// FILE: include/cli/print_cli_help.hpp
#pragma once

#include <ostream>
#include <vector>

#include "cli/components.hpp"

namespace dyn {

void print_cli_help(const std::vector<Component>& components, std::ostream& out);

} // namespace dyn
