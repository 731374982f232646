#include "descriptor/semantic_type.hpp"

namespace dyn {

const char* scalar_kind_name(ScalarKind kind) {
    switch (kind) {
        case ScalarKind::String: return "str";
        case ScalarKind::Integer: return "int";
        case ScalarKind::Float: return "float";
        case ScalarKind::Boolean: return "bool";
        case ScalarKind::Unspecified: break;
    }
    return "unspecified";
}

std::string SemanticType::to_string() const {
    std::string out = scalar_kind_name(scalar);
    if (list) out = "list<" + out + ">";
    if (optional) out = "optional<" + out + ">";
    return out;
}

} // namespace dyn
