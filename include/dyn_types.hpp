#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

namespace dyn {
namespace fs = std::filesystem;

// Parsed command-line values, keyed by destination name.
using ParsedArgs = YAML::Node;

#if defined(_WIN32)
    #if defined(DYNAMITE_LIB_BUILD)
        #define DYNAMITE_API __declspec(dllexport)
    #else
        #define DYNAMITE_API __declspec(dllimport)
    #endif
#else // Non-Windows platforms
    #if defined(DYNAMITE_LIB_BUILD)
        #define DYNAMITE_API __attribute__((visibility("default")))
    #else
        #define DYNAMITE_API
    #endif
#endif

enum class CliErrc {
    Unknown = 1, MissingTypeAnnotation, Usage, UnknownOperation,
    UnknownField, InvalidValue, Io, InvalidYaml,
};

struct DYNAMITE_API CliError : public std::runtime_error {
    explicit CliError(const std::string& what)
        : std::runtime_error(what), code_(CliErrc::Unknown) {}
    CliError(CliErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    CliErrc code() const noexcept { return code_; }
private:
    CliErrc code_;
};

// Names used internally for dispatch control; never exposed as user flags.
inline constexpr const char* kActionKey = "action";
inline constexpr const char* kSubInterfaceKey = "sub_interface";

inline bool is_reserved_name(const std::string& name) {
    return name == kActionKey || name == kSubInterfaceKey;
}

inline std::string to_flag_name(const std::string& name) {
    std::string out = name;
    for (auto& c : out) if (c == '_') c = '-';
    return out;
}

inline std::string from_flag_name(const std::string& token) {
    std::string out = token;
    for (auto& c : out) if (c == '-') c = '_';
    return out;
}

} // namespace dyn
