// Registry of target descriptors keyed by "<component>.<interface>"
#pragma once

#include <map>
#include <string>
#include <vector>

#include "descriptor/descriptors.hpp"

namespace dyn {

class TargetRegistry {
public:
    // Replaces any descriptor already registered under the same name.
    void register_target(TargetDescriptor descriptor);

    const TargetDescriptor* find(const std::string& name) const;
    const TargetDescriptor& at(const std::string& name) const;

    std::vector<std::string> get_keys() const;

private:
    std::map<std::string, TargetDescriptor> table_;
};

inline std::string make_key(const std::string& component, const std::string& interface_name) {
    return component + "." + interface_name;
}

} // namespace dyn
