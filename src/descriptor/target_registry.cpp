#include "descriptor/target_registry.hpp"

namespace dyn {

void TargetRegistry::register_target(TargetDescriptor descriptor) {
    auto key = descriptor.name;
    table_[key] = std::move(descriptor);
}

const TargetDescriptor* TargetRegistry::find(const std::string& name) const {
    auto it = table_.find(name);
    if (it == table_.end()) return nullptr;
    return &it->second;
}

const TargetDescriptor& TargetRegistry::at(const std::string& name) const {
    const auto* d = find(name);
    if (!d) throw CliError(CliErrc::UnknownOperation, "Target type not registered: " + name);
    return *d;
}

std::vector<std::string> TargetRegistry::get_keys() const {
    std::vector<std::string> keys;
    keys.reserve(table_.size());
    for (const auto& pair : table_) keys.push_back(pair.first);
    return keys;
}

} // namespace dyn
