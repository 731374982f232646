// Live configuration objects mutated by the config interfaces
#pragma once

#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "descriptor/semantic_type.hpp"

namespace dyn {

// One addressable item: a Zeek script, signature or definition, a Suricata rule.
struct Analyzer {
    int id = -1;
    std::string name;
    bool enabled = false;
    std::optional<std::string> value;
};

/**
 * @brief Ordered list of analyzers owned by a parent configuration.
 *
 * Items keep their position for the lifetime of the collection; they are
 * only toggled or given a new value.
 */
class AnalyzerCollection {
public:
    AnalyzerCollection() = default;
    AnalyzerCollection(std::string name, bool supports_values, std::vector<Analyzer> items = {});

    const std::string& name() const { return name_; }
    // True when items carry a `value` (e.g. Zeek redefinitions).
    bool supports_values() const { return supports_values_; }

    std::vector<Analyzer>& analyzers() { return items_; }
    const std::vector<Analyzer>& analyzers() const { return items_; }

    Analyzer* find(int id);
    const Analyzer* find(int id) const;

    YAML::Node to_yaml() const;
    static AnalyzerCollection from_yaml(const std::string& name, const YAML::Node& n);

private:
    std::string name_;
    bool supports_values_ = false;
    std::vector<Analyzer> items_;
};

struct FieldSpec {
    std::string name;
    SemanticType type;
    std::string description;
};

/**
 * @brief A downstream target (where events get sent) with a closed set of
 * typed fields.
 *
 * Subclasses expose their fields through fields() and an explicit get/set
 * pair. Both throw CliError(CliErrc::UnknownField) for names outside the
 * set, and set() throws CliError(CliErrc::InvalidValue) when the value does
 * not convert to the field's type.
 */
class TargetConfigObject {
public:
    virtual ~TargetConfigObject() = default;

    virtual std::string target_name() const = 0;
    virtual const std::vector<FieldSpec>& fields() const = 0;
    virtual YAML::Node get(const std::string& field) const = 0;
    virtual void set(const std::string& field, const YAML::Node& value) = 0;

    const FieldSpec* find_field(const std::string& field) const;

    bool enabled() const { return enabled_; }
    void set_enabled(bool on) { enabled_ = on; }

    YAML::Node to_yaml() const;
    // Fields missing from `n` keep their current value.
    void load_yaml(const YAML::Node& n);

protected:
    [[noreturn]] void unknown_field(const std::string& field) const;

private:
    bool enabled_ = false;
};

} // namespace dyn
