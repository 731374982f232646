// FILE: include/cli/argument_parser.hpp
#pragma once

#include <string>
#include <vector>

#include "cli/grammar.hpp"
#include "dyn_types.hpp"

namespace dyn {

// True if `-h` or `--help` appears anywhere in `args`.
bool wants_help(const std::vector<std::string>& args);

/**
 * @brief Parse `args` (program name excluded) against `grammar`.
 *
 * The result holds one entry per FlagSpec destination, in grammar order:
 * toggles are true/false, list flags are sequences, absent optional flags
 * carry their default (or null). When the grammar has an action selector
 * the chosen token is stored under `action`.
 *
 * List flags consume every following non-option argument, so
 * `--ids 1 3 start` puts `start` into the list.
 *
 * Throws CliError(CliErrc::Usage) for unknown options, missing values,
 * values that do not coerce to the declared type, missing required flags,
 * and missing or unknown action tokens.
 */
ParsedArgs parse_arguments(const Grammar& grammar, const std::vector<std::string>& args);

} // namespace dyn
