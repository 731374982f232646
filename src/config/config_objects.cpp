#include "config/config_objects.hpp"

#include "dyn_types.hpp"

namespace dyn {

AnalyzerCollection::AnalyzerCollection(std::string name, bool supports_values, std::vector<Analyzer> items)
    : name_(std::move(name)), supports_values_(supports_values), items_(std::move(items)) {}

Analyzer* AnalyzerCollection::find(int id) {
    for (auto& a : items_)
        if (a.id == id) return &a;
    return nullptr;
}

const Analyzer* AnalyzerCollection::find(int id) const {
    for (const auto& a : items_)
        if (a.id == id) return &a;
    return nullptr;
}

YAML::Node AnalyzerCollection::to_yaml() const {
    YAML::Node root;
    root["supports_values"] = supports_values_;
    YAML::Node arr(YAML::NodeType::Sequence);
    for (const auto& a : items_) {
        YAML::Node n;
        n["id"] = a.id;
        n["name"] = a.name;
        n["enabled"] = a.enabled;
        if (a.value) n["value"] = *a.value;
        arr.push_back(n);
    }
    root["items"] = arr;
    return root;
}

AnalyzerCollection AnalyzerCollection::from_yaml(const std::string& name, const YAML::Node& n) {
    AnalyzerCollection out;
    out.name_ = name;
    if (!n || !n.IsMap()) {
        throw CliError(CliErrc::InvalidYaml, "Analyzer collection '" + name + "' must be a map.");
    }
    try {
        if (n["supports_values"]) out.supports_values_ = n["supports_values"].as<bool>();
        if (n["items"] && n["items"].IsSequence()) {
            for (const auto& item : n["items"]) {
                Analyzer a;
                a.id = item["id"].as<int>();
                a.name = item["name"] ? item["name"].as<std::string>() : std::string();
                a.enabled = item["enabled"] ? item["enabled"].as<bool>() : false;
                if (item["value"] && !item["value"].IsNull()) a.value = item["value"].as<std::string>();
                out.items_.push_back(std::move(a));
            }
        }
    } catch (const YAML::Exception& e) {
        throw CliError(CliErrc::InvalidYaml, "Analyzer collection '" + name + "': " + e.what());
    }
    return out;
}

const FieldSpec* TargetConfigObject::find_field(const std::string& field) const {
    for (const auto& f : fields())
        if (f.name == field) return &f;
    return nullptr;
}

void TargetConfigObject::unknown_field(const std::string& field) const {
    throw CliError(CliErrc::UnknownField, target_name() + " has no field '" + field + "'.");
}

YAML::Node TargetConfigObject::to_yaml() const {
    YAML::Node root;
    root["enabled"] = enabled_;
    for (const auto& f : fields()) {
        YAML::Node v = get(f.name);
        if (v.IsDefined() && !v.IsNull()) root[f.name] = v;
    }
    return root;
}

void TargetConfigObject::load_yaml(const YAML::Node& n) {
    if (!n || !n.IsMap()) return;
    try {
        if (n["enabled"]) enabled_ = n["enabled"].as<bool>();
    } catch (const YAML::Exception& e) {
        throw CliError(CliErrc::InvalidYaml, target_name() + ".enabled: " + e.what());
    }
    for (const auto& f : fields()) {
        if (n[f.name] && !n[f.name].IsNull()) set(f.name, n[f.name]);
    }
}

} // namespace dyn
