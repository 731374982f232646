// FILE: src/cli/grammar.cpp
#include "cli/grammar.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

#include "kernel/param_utils.hpp"

namespace dyn {

bool Grammar::add_flag(FlagSpec spec) {
    if (find_dest(spec.dest)) return false;
    for (const auto& f : spec.flags)
        if (find_flag(f)) return false;
    flags_.push_back(std::move(spec));
    return true;
}

void Grammar::set_action(std::vector<std::string> choices) {
    ActionSpec a;
    a.choices = std::move(choices);
    action_ = std::move(a);
}

const FlagSpec* Grammar::find_flag(const std::string& flag) const {
    for (const auto& spec : flags_)
        if (std::find(spec.flags.begin(), spec.flags.end(), flag) != spec.flags.end()) return &spec;
    return nullptr;
}

const FlagSpec* Grammar::find_dest(const std::string& dest) const {
    for (const auto& spec : flags_)
        if (spec.dest == dest) return &spec;
    return nullptr;
}

static std::string metavar(const FlagSpec& spec) {
    std::string mv = spec.dest;
    std::transform(mv.begin(), mv.end(), mv.begin(), [](unsigned char c) { return std::toupper(c); });
    return mv;
}

static std::string choices_str(const ActionSpec& a) {
    std::string out = "{";
    for (std::size_t i = 0; i < a.choices.size(); ++i) {
        if (i) out += ",";
        out += a.choices[i];
    }
    return out + "}";
}

std::string Grammar::format_usage() const {
    std::ostringstream ss;
    ss << "usage: " << prog_ << " [-h]";
    for (const auto& spec : flags_) {
        std::string part = spec.flags.front();
        if (!spec.is_toggle()) {
            part += " " + metavar(spec);
            if (spec.takes_many()) part += " [" + metavar(spec) + " ...]";
        }
        ss << " " << (spec.required ? part : "[" + part + "]");
    }
    if (action_) ss << " " << choices_str(*action_);
    return ss.str();
}

std::string Grammar::format_help() const {
    std::ostringstream ss;
    ss << format_usage() << "\n";
    if (!description_.empty()) ss << "\n" << description_ << "\n";

    if (action_) {
        ss << "\npositional arguments:\n";
        ss << "  " << std::left << std::setw(30) << choices_str(*action_) << "\n";
    }

    ss << "\noptions:\n";
    ss << "  " << std::left << std::setw(30) << "-h, --help" << "Show this help message and exit\n";
    for (const auto& spec : flags_) {
        std::string left;
        for (std::size_t i = 0; i < spec.flags.size(); ++i) {
            if (i) left += ", ";
            left += spec.flags[i];
        }
        if (!spec.is_toggle()) {
            left += " " + metavar(spec);
            if (spec.takes_many()) left += " [...]";
        }
        std::string help = spec.help_text;
        if (spec.required) help += help.empty() ? "(required)" : " (required)";
        const std::string shown = value_to_string(spec.default_value);
        if (spec.has_default() && !spec.is_toggle() && !shown.empty())
            help += " [default: " + shown + "]";
        if (left.size() >= 30) {
            ss << "  " << left << "\n  " << std::string(30, ' ') << help << "\n";
        } else {
            ss << "  " << std::left << std::setw(30) << left << help << "\n";
        }
    }
    return ss.str();
}

nlohmann::json Grammar::to_json() const {
    nlohmann::json j;
    j["prog"] = prog_;
    j["description"] = description_;
    j["flags"] = nlohmann::json::array();
    for (const auto& spec : flags_) j["flags"].push_back(spec.to_json());
    if (action_) {
        j["action"] = {{"dest", action_->dest}, {"choices", action_->choices}};
    }
    return j;
}

} // namespace dyn
