#include "kernel/param_utils.hpp"

namespace dyn {

bool is_empty_value(const YAML::Node& v, const SemanticType& type) {
    if (!v || v.IsNull()) return true;
    if (v.IsSequence() || v.IsMap()) return v.size() == 0;
    const std::string& text = v.Scalar();
    if (text.empty()) return true;
    if (type.list) return false;
    try {
        switch (type.scalar) {
            case ScalarKind::Integer: return v.as<long long>() == 0;
            case ScalarKind::Float: return v.as<double>() == 0.0;
            case ScalarKind::Boolean: return !v.as<bool>();
            case ScalarKind::String:
            case ScalarKind::Unspecified: break;
        }
    } catch (const YAML::Exception&) {
        // not convertible to the declared kind, but the text is non-empty
        return false;
    }
    return false;
}

std::string value_to_string(const YAML::Node& v) {
    if (!v || v.IsNull()) return "";
    if (v.IsScalar()) return v.Scalar();
    if (v.IsSequence()) {
        std::string out;
        for (std::size_t i = 0; i < v.size(); ++i) {
            if (i) out += ", ";
            out += value_to_string(v[i]);
        }
        return out;
    }
    YAML::Emitter em;
    em << YAML::Flow << v;
    return em.c_str();
}

} // namespace dyn
