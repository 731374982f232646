// Command-line wrappers that report on or mutate live config objects
#pragma once

#include <optional>
#include <string>

#include "cli/grammar.hpp"
#include "config/change_set.hpp"
#include "config/config_objects.hpp"
#include "dyn_types.hpp"

namespace dyn {

/**
 * @brief Outcome of one pass: either a read-only report (nothing was
 * selected or set) or the mutated object, for the caller to persist.
 */
template <typename T>
struct MutationResult {
    T* object = nullptr;
    std::optional<Report> report;
    ChangeSet changes;

    bool mutated() const { return object != nullptr; }
};

/**
 * @brief Selects analyzers by id and enables, disables or re-values them.
 *
 * Flags: `--ids` (one or more ints), `--enable`, `--disable`, and `--value`
 * when the collection carries values. With no ids the pass only reports.
 */
class AnalyzersInterface {
public:
    explicit AnalyzersInterface(AnalyzerCollection& collection) : collection_(collection) {}

    // Appends this interface's flags to an existing grammar.
    static Grammar& build_grammar(const AnalyzersInterface& interface, Grammar& grammar);
    Grammar grammar(const std::string& prog = {}) const;

    MutationResult<AnalyzerCollection> execute(const ParsedArgs& args);

    Report snapshot() const;

private:
    AnalyzerCollection& collection_;
};

/**
 * @brief Exposes every field of a TargetConfigObject as an optional flag,
 * plus `--enable` / `--disable`.
 *
 * Non-empty values are assigned and recorded; empty ones are reported with
 * the current value. Fields named in `defaults` are fixed by the caller and
 * neither reported nor assigned.
 */
class TargetsInterface {
public:
    explicit TargetsInterface(TargetConfigObject& target, YAML::Node defaults = YAML::Node());

    static Grammar& build_grammar(const TargetsInterface& interface, Grammar& grammar);
    Grammar grammar(const std::string& prog = {}) const;

    MutationResult<TargetConfigObject> execute(const ParsedArgs& args);

private:
    bool is_defaulted(const std::string& field) const;

    TargetConfigObject& target_;
    YAML::Node defaults_;
};

} // namespace dyn
