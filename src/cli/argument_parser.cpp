// FILE: src/cli/argument_parser.cpp
#include "cli/argument_parser.hpp"

#include <algorithm>
#include <getopt.h>
#include <limits>
#include <map>
#include <stdexcept>

namespace dyn {

namespace {

// getopt_long value for the i-th FlagSpec; stays clear of ASCII option chars.
constexpr int kFlagBase = 1000;

[[noreturn]] void usage_error(const std::string& msg) {
    throw CliError(CliErrc::Usage, msg);
}

YAML::Node coerce(const FlagSpec& spec, const std::string& raw) {
    const std::string& flag = spec.flags.front();
    switch (spec.value_type) {
        case ValueType::Int: {
            std::size_t pos = 0;
            long long v = 0;
            try {
                v = std::stoll(raw, &pos);
            } catch (const std::exception&) {
                pos = 0;
            }
            if (raw.empty() || pos != raw.size() || v < std::numeric_limits<int>::min() ||
                v > std::numeric_limits<int>::max())
                usage_error("argument " + flag + ": invalid int value: '" + raw + "'");
            return YAML::Node(static_cast<int>(v));
        }
        case ValueType::Float: {
            std::size_t pos = 0;
            double v = 0.0;
            try {
                v = std::stod(raw, &pos);
            } catch (const std::exception&) {
                pos = 0;
            }
            if (raw.empty() || pos != raw.size())
                usage_error("argument " + flag + ": invalid float value: '" + raw + "'");
            return YAML::Node(v);
        }
        case ValueType::String:
        case ValueType::None:
            break;
    }
    return YAML::Node(raw);
}

std::string quoted_list(const std::vector<std::string>& items) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i) out += ", ";
        out += "'" + items[i] + "'";
    }
    return out;
}

}  // namespace

bool wants_help(const std::vector<std::string>& args) {
    for (const auto& a : args) {
        if (a == "--") break;
        if (a == "-h" || a == "--help") return true;
    }
    return false;
}

ParsedArgs parse_arguments(const Grammar& grammar, const std::vector<std::string>& args) {
    const auto& specs = grammar.flags();

    std::vector<option> long_opts;
    for (std::size_t i = 0; i < specs.size(); ++i) {
        for (const auto& f : specs[i].flags) {
            // flags are stored as "--name"; getopt wants the bare name
            if (f.size() <= 2 || f.compare(0, 2, "--") != 0) continue;
            long_opts.push_back({f.c_str() + 2, specs[i].is_toggle() ? no_argument : required_argument,
                                 nullptr, kFlagBase + static_cast<int>(i)});
        }
    }
    long_opts.push_back({nullptr, 0, nullptr, 0});

    std::vector<std::string> storage;
    storage.reserve(args.size() + 1);
    storage.push_back(grammar.prog().empty() ? "dynamite" : grammar.prog());
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& s : storage) argv.push_back(&s[0]);
    argv.push_back(nullptr);
    const int argc = static_cast<int>(storage.size());

    std::map<std::size_t, std::vector<std::string>> raw;
    std::vector<bool> toggled(specs.size(), false);
    std::vector<std::string> positionals;
    int open_list = -1;

    // '-' returns non-options in order as opt 1; ':' reports missing values as ':'
    opterr = 0;
    optind = 0;
    int opt;
    while ((opt = getopt_long(argc, argv.data(), "-:", long_opts.data(), nullptr)) != -1) {
        if (opt == 1) {
            if (open_list >= 0) raw[static_cast<std::size_t>(open_list)].push_back(optarg);
            else positionals.push_back(optarg);
            continue;
        }
        open_list = -1;
        if (opt == ':') usage_error("argument " + std::string(argv[optind - 1]) + ": expected one argument");
        if (opt == '?' || opt < kFlagBase) usage_error("unrecognized arguments: " + std::string(argv[optind - 1]));

        const auto index = static_cast<std::size_t>(opt - kFlagBase);
        const FlagSpec& spec = specs[index];
        if (spec.is_toggle()) {
            toggled[index] = true;
        } else if (spec.takes_many()) {
            raw[index] = std::vector<std::string>{optarg};
            open_list = static_cast<int>(index);
        } else {
            raw[index] = std::vector<std::string>{optarg};
        }
    }
    for (int i = optind; i < argc; ++i) positionals.push_back(argv[i]);

    ParsedArgs values(YAML::NodeType::Map);
    std::vector<std::string> missing;
    for (std::size_t i = 0; i < specs.size(); ++i) {
        const FlagSpec& spec = specs[i];
        if (spec.is_toggle()) {
            values[spec.dest] = static_cast<bool>(toggled[i]);
            continue;
        }
        auto it = raw.find(i);
        if (it == raw.end()) {
            if (spec.required) missing.push_back(spec.flags.front());
            else if (spec.has_default()) values[spec.dest] = YAML::Clone(spec.default_value);
            else values[spec.dest] = YAML::Node(YAML::NodeType::Null);
            continue;
        }
        if (spec.takes_many()) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& r : it->second) seq.push_back(coerce(spec, r));
            values[spec.dest] = seq;
        } else {
            values[spec.dest] = coerce(spec, it->second.front());
        }
    }

    const auto& action = grammar.action();
    if (action) {
        if (positionals.empty()) {
            missing.push_back(action->dest);
        } else {
            const std::string& token = positionals.front();
            if (std::find(action->choices.begin(), action->choices.end(), token) == action->choices.end()) {
                usage_error("argument " + action->dest + ": invalid choice: '" + token +
                            "' (choose from " + quoted_list(action->choices) + ")");
            }
            values[action->dest] = token;
            positionals.erase(positionals.begin());
        }
    }
    if (!missing.empty()) {
        std::string msg = "the following arguments are required: ";
        for (std::size_t i = 0; i < missing.size(); ++i) {
            if (i) msg += ", ";
            msg += missing[i];
        }
        usage_error(msg);
    }
    if (!positionals.empty()) {
        std::string msg = "unrecognized arguments:";
        for (const auto& p : positionals) msg += " " + p;
        usage_error(msg);
    }
    return values;
}

} // namespace dyn
