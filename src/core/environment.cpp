/**
 * @file environment.cpp
 * @brief Process environment access.
 */

#include "core/environment.hpp"
#include <cstdlib>

namespace vellumsh::core {

    std::optional<std::string> ProcessEnvironment::get(const std::string& name) const {
        const char* value = std::getenv(name.c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    }

    void ProcessEnvironment::set(const std::string& name, const std::string& value) {
        setenv(name.c_str(), value.c_str(), 1);
    }

}
