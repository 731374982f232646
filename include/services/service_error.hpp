#pragma once
#include <stdexcept>
#include <string>

#include "dyn_types.hpp"

namespace dyn {

// Raised by the built-in managers; propagates through dispatch unchanged.
struct DYNAMITE_API ServiceError : public std::runtime_error {
    ServiceError(const std::string& service, const std::string& what)
        : std::runtime_error("An error occurred while calling " + service + ": " + what),
          service_(service) {}
    const std::string& service() const noexcept { return service_; }
private:
    std::string service_;
};

} // namespace dyn
