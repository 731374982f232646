#include "config/config_interfaces.hpp"

#include <algorithm>

#include "kernel/param_utils.hpp"

namespace dyn {

namespace {

constexpr char kStatementTerminator = ';';

FlagSpec toggle_flag(const std::string& name, const std::string& help) {
    return map_parameter(make_param(name, SemanticType::boolean(), help));
}

std::string bool_text(bool v) { return v ? "True" : "False"; }

YAML::Node analyzer_node(const Analyzer& a) {
    YAML::Node n;
    n["id"] = a.id;
    n["name"] = a.name;
    n["enabled"] = a.enabled;
    if (a.value) n["value"] = *a.value;
    return n;
}

std::vector<int> selected_ids(const ParsedArgs& args) {
    std::vector<int> ids;
    const YAML::Node v = args["analyzer_ids"];
    if (!v || v.IsNull()) return ids;
    try {
        if (v.IsSequence()) {
            for (const auto& item : v) ids.push_back(item.as<int>());
        } else if (v.IsScalar()) {
            ids.push_back(v.as<int>());
        }
    } catch (const YAML::Exception& e) {
        throw CliError(CliErrc::InvalidValue, std::string("argument --ids: ") + e.what());
    }
    return ids;
}

} // namespace

// ---- AnalyzersInterface ----

Grammar& AnalyzersInterface::build_grammar(const AnalyzersInterface& interface, Grammar& grammar) {
    FlagSpec ids = map_parameter(
        make_param("analyzer_ids", SemanticType::optional_of(SemanticType::list_of(SemanticType::integer())),
                   "A list of analyzer ids to select"));
    ids.flags = {"--ids"};
    ids.default_value = YAML::Node(YAML::NodeType::Sequence);
    grammar.add_flag(std::move(ids));
    grammar.add_flag(toggle_flag("enable", "Enable the selected analyzers"));
    grammar.add_flag(toggle_flag("disable", "Disable the selected analyzers"));
    if (interface.collection_.supports_values()) {
        grammar.add_flag(map_parameter(make_param(
            "value", SemanticType::optional_of(SemanticType::string()),
            "A new value for the selected analyzers")));
    }
    return grammar;
}

Grammar AnalyzersInterface::grammar(const std::string& prog) const {
    Grammar g(prog.empty() ? collection_.name() : prog,
              "Configure " + collection_.name() + " by selecting one or more ids");
    build_grammar(*this, g);
    return g;
}

Report AnalyzersInterface::snapshot() const {
    Report report;
    report.headers = {"Id", "Name", "Enabled", "Value"};
    for (const auto& a : collection_.analyzers()) {
        report.rows.push_back({std::to_string(a.id), a.name, bool_text(a.enabled),
                               a.value && !a.value->empty() ? *a.value : "N/A"});
    }
    return report;
}

MutationResult<AnalyzerCollection> AnalyzersInterface::execute(const ParsedArgs& args) {
    MutationResult<AnalyzerCollection> result;
    const std::vector<int> ids = selected_ids(args);
    if (ids.empty()) {
        result.report = snapshot();
        return result;
    }

    const bool enable = as_bool_flexible(args, "enable", false);
    const bool disable = as_bool_flexible(args, "disable", false);
    std::string value = as_str(args, "value");
    if (!value.empty() && value.back() != kStatementTerminator) value += kStatementTerminator;

    // Ids that match nothing are ignored.
    for (auto& a : collection_.analyzers()) {
        if (std::find(ids.begin(), ids.end(), a.id) == ids.end()) continue;
        YAML::Node before = analyzer_node(a);
        if (enable) {
            a.enabled = true;
        } else if (disable) {
            a.enabled = false;
        }
        if (!value.empty()) a.value = value;
        result.changes.record(std::to_string(a.id), before, analyzer_node(a));
    }
    result.object = &collection_;
    return result;
}

// ---- TargetsInterface ----

TargetsInterface::TargetsInterface(TargetConfigObject& target, YAML::Node defaults)
    : target_(target), defaults_(YAML::Clone(defaults)) {}

bool TargetsInterface::is_defaulted(const std::string& field) const {
    if (!defaults_.IsMap()) return false;
    const YAML::Node v = defaults_[field];
    return v.IsDefined() && !v.IsNull();
}

Grammar& TargetsInterface::build_grammar(const TargetsInterface& interface, Grammar& grammar) {
    const TargetConfigObject& t = interface.target_;
    for (const auto& f : t.fields()) {
        if (f.name == "enabled" || is_reserved_name(f.name)) continue;
        std::string help = f.description;
        std::replace(help.begin(), help.end(), '\n', ' ');
        ParameterDescriptor p = make_param(f.name, SemanticType::optional_of(f.type), help);
        YAML::Node override_default;
        if (interface.defaults_.IsMap()) override_default = interface.defaults_[f.name];
        // A name already taken by an earlier definition is skipped.
        grammar.add_flag(map_parameter(p, override_default));
    }
    grammar.add_flag(toggle_flag("enable", "Enable the " + t.target_name() + " target"));
    grammar.add_flag(toggle_flag("disable", "Disable the " + t.target_name() + " target"));
    return grammar;
}

Grammar TargetsInterface::grammar(const std::string& prog) const {
    Grammar g(prog.empty() ? target_.target_name() : prog,
              "Configure the " + target_.target_name() + " target");
    build_grammar(*this, g);
    return g;
}

MutationResult<TargetConfigObject> TargetsInterface::execute(const ParsedArgs& args) {
    MutationResult<TargetConfigObject> result;
    Report report;
    report.headers = {"Config Option", "Value"};

    if (args.IsMap()) {
        for (const auto& kv : args) {
            const std::string key = kv.first.as<std::string>();
            if (is_reserved_name(key) || key == "enable" || key == "disable") continue;
            if (is_defaulted(key)) continue;
            const FieldSpec* field = target_.find_field(key);
            if (!field || field->name == "enabled") continue;

            if (is_empty_value(kv.second, field->type)) {
                const YAML::Node current = target_.get(key);
                report.rows.push_back({to_flag_name(key),
                                       is_empty_value(current, field->type) ? "N/A"
                                                                            : value_to_string(current)});
                continue;
            }
            YAML::Node before = target_.get(key);
            target_.set(key, kv.second);
            result.changes.record(key, before, target_.get(key));
        }
    }

    const bool enable = as_bool_flexible(args, "enable", false);
    const bool disable = as_bool_flexible(args, "disable", false);
    if (enable || disable) {
        const bool before = target_.enabled();
        target_.set_enabled(enable);
        result.changes.record("enabled", YAML::Node(before), YAML::Node(target_.enabled()));
    }

    if (result.changes.empty()) {
        report.rows.push_back({"enabled", bool_text(target_.enabled())});
        result.report = std::move(report);
        return result;
    }
    result.object = &target_;
    return result;
}

} // namespace dyn
