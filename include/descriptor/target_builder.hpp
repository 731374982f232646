// Registration-time manifest builder for target types
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

#include "descriptor/descriptors.hpp"

namespace dyn {

/**
 * @brief Builds a TargetDescriptor for `T` from an explicit manifest.
 *
 * Usage:
 * @code
 *   TargetBuilder<ProcessManager>("logstash.process", "LogStash process manager")
 *       .constructor({make_param("stdout", SemanticType::optional_of(SemanticType::boolean()))},
 *                    [](const YAML::Node& a) { return std::make_unique<ProcessManager>(a); })
 *       .operation("start", {}, [](ProcessManager& m, const YAML::Node&) { return m.start(); })
 *       .inherit(base_descriptor)
 *       .build();
 * @endcode
 *
 * Extraction rules:
 * - a constructor parameter without a declared type throws
 *   CliErrc::MissingTypeAnnotation from build();
 * - an operation with any untyped parameter is skipped;
 * - operations declared on this builder shadow inherited ones of the same
 *   name, and among several parents the first one passed to inherit() wins.
 */
template <typename T>
class TargetBuilder {
    static_assert(std::is_base_of<Target, T>::value, "target types must derive from dyn::Target");

public:
    using Factory = std::function<std::unique_ptr<T>(const YAML::Node&)>;
    using Method = std::function<YAML::Node(T&, const YAML::Node&)>;

    explicit TargetBuilder(std::string name, std::string description = {})
        : name_(std::move(name)), description_(std::move(description)) {}

    TargetBuilder& constructor(std::vector<ParameterDescriptor> params, Factory make) {
        ctor_params_ = std::move(params);
        factory_ = std::move(make);
        has_ctor_ = true;
        return *this;
    }

    TargetBuilder& operation(std::string op_name, std::vector<ParameterDescriptor> params,
                             Method fn, std::string description = {}) {
        OperationDescriptor op;
        op.name = std::move(op_name);
        op.description = std::move(description);
        op.parameters = std::move(params);
        op.invoke = [fn = std::move(fn)](Target& self, const YAML::Node& args) {
            return fn(static_cast<T&>(self), args);
        };
        own_ops_.push_back(std::move(op));
        return *this;
    }

    // Pre-merge the operation table of a parent type of T.
    TargetBuilder& inherit(const TargetDescriptor& parent) {
        parents_.push_back(parent);
        return *this;
    }

    TargetDescriptor build() const {
        TargetDescriptor out;
        out.name = name_;
        out.description = description_;
        out.constructor.name = "__init__";
        out.constructor.parameters = mark_reserved(ctor_params_);
        for (const auto& p : out.constructor.parameters) {
            if (!p.semantic_type.is_specified()) {
                throw CliError(CliErrc::MissingTypeAnnotation,
                               "Constructor parameter '" + p.name + "' of '" + name_ +
                               "' has no declared type.");
            }
        }
        out.construct = make_construct();

        std::unordered_set<std::string> seen;
        auto record = [&](const OperationDescriptor& op) {
            if (seen.count(op.name) || !fully_typed(op)) return;
            seen.insert(op.name);
            OperationDescriptor copy = op;
            copy.parameters = mark_reserved(op.parameters);
            out.operations.push_back(std::move(copy));
        };
        for (const auto& op : own_ops_) record(op);
        for (const auto& parent : parents_)
            for (const auto& op : parent.operations) record(op);
        return out;
    }

private:
    ConstructorFunc make_construct() const {
        if (has_ctor_) {
            Factory f = factory_;
            return [f](const YAML::Node& args) -> std::unique_ptr<Target> { return f(args); };
        }
        if constexpr (std::is_default_constructible<T>::value) {
            return [](const YAML::Node&) -> std::unique_ptr<Target> { return std::make_unique<T>(); };
        } else {
            throw CliError(CliErrc::MissingTypeAnnotation,
                           "Target '" + name_ + "' declares no constructor manifest.");
        }
    }

    static bool fully_typed(const OperationDescriptor& op) {
        for (const auto& p : op.parameters)
            if (!p.semantic_type.is_specified()) return false;
        return true;
    }

    static std::vector<ParameterDescriptor> mark_reserved(std::vector<ParameterDescriptor> params) {
        for (auto& p : params) p.is_reserved = is_reserved_name(p.name);
        return params;
    }

    std::string name_;
    std::string description_;
    bool has_ctor_ = false;
    std::vector<ParameterDescriptor> ctor_params_;
    Factory factory_;
    std::vector<OperationDescriptor> own_ops_;
    std::vector<TargetDescriptor> parents_;
};

} // namespace dyn
