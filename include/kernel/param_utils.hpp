#pragma once
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "descriptor/semantic_type.hpp"

namespace dyn {

/**
 * @brief Safely extract a bool from a value bag.
 * @param n The bag (parsed arguments or a config node).
 * @param key Key to look up.
 * @param defv Returned when the key is missing, null, or not convertible.
 */
inline bool as_bool_flexible(const YAML::Node& n, const std::string& key, bool defv) {
    if (!n || !n[key] || n[key].IsNull()) return defv;
    try {
        return n[key].as<bool>();
    } catch (const YAML::Exception&) {
        return defv;
    }
}

/**
 * @brief Safely extract a string from a value bag.
 */
inline std::string as_str(const YAML::Node& n, const std::string& key, const std::string& defv = {}) {
    if (!n || !n[key] || n[key].IsNull()) return defv;
    try {
        return n[key].as<std::string>();
    } catch (const YAML::Exception&) {
        return defv;
    }
}

// A scalar is promoted to a one-element list.
inline std::vector<std::string> as_str_list(const YAML::Node& n, const std::string& key) {
    std::vector<std::string> out;
    if (!n || !n[key] || n[key].IsNull()) return out;
    const YAML::Node v = n[key];
    try {
        if (v.IsSequence()) return v.as<std::vector<std::string>>();
        if (v.IsScalar()) out.push_back(v.as<std::string>());
    } catch (const YAML::Exception&) {
        out.clear();
    }
    return out;
}

// True when `v` would be falsy for a value of declared type `type`:
// missing, null, an empty string or list, zero, or false.
bool is_empty_value(const YAML::Node& v, const SemanticType& type);

// Flat display form: scalars verbatim, sequences comma separated, maps as flow YAML.
std::string value_to_string(const YAML::Node& v);

} // namespace dyn
