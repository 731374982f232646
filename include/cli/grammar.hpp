// FILE: include/cli/grammar.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "cli/flag_spec.hpp"

namespace dyn {

// The positional action selector of a multiple-responsibility grammar.
struct ActionSpec {
    std::string dest = kActionKey;
    std::vector<std::string> choices;
};

/**
 * @brief Complete set of flags and positionals accepted by one interface.
 *
 * Flags keep insertion order. Merging is first-wins: add_flag() refuses a
 * FlagSpec whose switch or destination is already taken and returns false,
 * leaving the earlier definition in place.
 */
class Grammar {
public:
    Grammar() = default;
    Grammar(std::string prog, std::string description)
        : prog_(std::move(prog)), description_(std::move(description)) {}

    bool add_flag(FlagSpec spec);
    void set_action(std::vector<std::string> choices);

    const std::string& prog() const { return prog_; }
    const std::string& description() const { return description_; }
    const std::vector<FlagSpec>& flags() const { return flags_; }
    const std::optional<ActionSpec>& action() const { return action_; }

    const FlagSpec* find_flag(const std::string& flag) const;
    const FlagSpec* find_dest(const std::string& dest) const;

    std::string format_usage() const;
    std::string format_help() const;
    nlohmann::json to_json() const;

private:
    std::string prog_;
    std::string description_;
    std::vector<FlagSpec> flags_;
    std::optional<ActionSpec> action_;
};

} // namespace dyn
