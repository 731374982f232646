// Declared types of constructor / operation parameters
#pragma once

#include <string>

namespace dyn {

enum class ScalarKind { Unspecified, String, Integer, Float, Boolean };

/**
 * @brief Declared type of one parameter: a scalar kind wrapped by at most
 * one optional<> and one list<>.
 *
 * `optional<list<string>>` is the usual shape of "zero or more paths" in the
 * install manifests. A default-constructed SemanticType is unspecified, which
 * is what a parameter without a declared type looks like to the extractor.
 */
struct SemanticType {
    ScalarKind scalar = ScalarKind::Unspecified;
    bool optional = false;
    bool list = false;

    static SemanticType string() { return {ScalarKind::String, false, false}; }
    static SemanticType integer() { return {ScalarKind::Integer, false, false}; }
    static SemanticType floating() { return {ScalarKind::Float, false, false}; }
    static SemanticType boolean() { return {ScalarKind::Boolean, false, false}; }
    static SemanticType unspecified() { return {}; }

    static SemanticType optional_of(SemanticType inner) {
        inner.optional = true;
        return inner;
    }
    static SemanticType list_of(SemanticType inner) {
        inner.list = true;
        return inner;
    }

    bool is_specified() const { return scalar != ScalarKind::Unspecified; }
    bool is_boolean() const { return scalar == ScalarKind::Boolean; }

    // e.g. "optional<list<int>>"
    std::string to_string() const;

    bool operator==(const SemanticType& o) const {
        return scalar == o.scalar && optional == o.optional && list == o.list;
    }
    bool operator!=(const SemanticType& o) const { return !(*this == o); }
};

const char* scalar_kind_name(ScalarKind kind);

} // namespace dyn
