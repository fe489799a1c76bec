#include <rail-planner/env.h>

#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

std::string RailPlanner::GetEnvVar(
    const std::string& envVar,
    const std::optional<std::string>& defaultValue
)
{
    const char* value {std::getenv(envVar.c_str())};
    if (value == nullptr && defaultValue == std::nullopt) {
        throw std::runtime_error("Could not find environment variable: " +
                                 envVar);
    }
    return value != nullptr ? value : *defaultValue;
}

unsigned long RailPlanner::GetEnvVarUnsigned(
    const std::string& envVar,
    const std::optional<unsigned long>& defaultValue
)
{
    const char* value {std::getenv(envVar.c_str())};
    if (value == nullptr) {
        if (defaultValue == std::nullopt) {
            throw std::runtime_error("Could not find environment variable: " +
                                     envVar);
        }
        return *defaultValue;
    }
    const std::string text {value};
    if (text.empty() ||
        text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error("Environment variable " + envVar +
                                 " is not a non-negative integer: " + text);
    }
    try {
        return std::stoul(text);
    } catch (const std::out_of_range&) {
        throw std::runtime_error("Environment variable " + envVar +
                                 " is out of range: " + text);
    }
}
