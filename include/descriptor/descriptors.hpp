// Statically declared descriptors of a target type's constructor and operations
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "descriptor/semantic_type.hpp"
#include "dyn_types.hpp"

namespace dyn {

// Base for every type that can be turned into a command interface.
class Target {
public:
    virtual ~Target() = default;
};

using ConstructorFunc = std::function<std::unique_ptr<Target>(const YAML::Node& args)>;
using OperationFunc = std::function<YAML::Node(Target& self, const YAML::Node& args)>;

struct ParameterDescriptor {
    std::string name;
    SemanticType semantic_type;
    YAML::Node default_value;
    std::string description;
    // Set by the extractor when the name collides with a dispatch key.
    bool is_reserved = false;

    bool has_default() const { return default_value.IsDefined() && !default_value.IsNull(); }
};

inline ParameterDescriptor make_param(std::string name, SemanticType type,
                                      std::string description = {}) {
    ParameterDescriptor p;
    p.name = std::move(name);
    p.semantic_type = type;
    p.description = std::move(description);
    return p;
}

inline ParameterDescriptor make_param(std::string name, SemanticType type,
                                      const YAML::Node& default_value,
                                      std::string description) {
    ParameterDescriptor p = make_param(std::move(name), type, std::move(description));
    p.default_value = YAML::Clone(default_value);
    return p;
}

struct OperationDescriptor {
    std::string name;
    std::string description;
    std::vector<ParameterDescriptor> parameters;
    OperationFunc invoke;
};

/**
 * @brief Everything the assembler and dispatcher need to know about one
 * target type.
 *
 * `constructor` holds the base parameters; `construct` builds an instance
 * from a bag of constructor arguments. `operations` is the flat override
 * table: derived definitions first, then inherited ones that were not
 * redefined.
 */
struct TargetDescriptor {
    std::string name;
    std::string description;
    OperationDescriptor constructor;
    ConstructorFunc construct;
    std::vector<OperationDescriptor> operations;

    const OperationDescriptor* find_operation(const std::string& op_name) const {
        for (const auto& op : operations)
            if (op.name == op_name) return &op;
        return nullptr;
    }
    std::vector<std::string> operation_names() const {
        std::vector<std::string> names;
        names.reserve(operations.size());
        for (const auto& op : operations) names.push_back(op.name);
        return names;
    }
};

} // namespace dyn
