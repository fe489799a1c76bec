#ifndef RAIL_PLANNER_ENV_H
#define RAIL_PLANNER_ENV_H

#include <optional>
#include <string>

namespace RailPlanner {

/*! \brief Get an environment variable, or return a default value.
 *
 *  \throws std::runtime_error if the environment variable cannot be found
 *                             and there is no default value.
 */
std::string GetEnvVar(
    const std::string& envVar,
    const std::optional<std::string>& defaultValue = std::nullopt
);

/*! \brief Get an unsigned integer environment variable.
 *
 *  \throws std::runtime_error if the environment variable cannot be found
 *                             and there is no default value, or if it is not
 *                             a non-negative integer.
 */
unsigned long GetEnvVarUnsigned(
    const std::string& envVar,
    const std::optional<unsigned long>& defaultValue = std::nullopt
);

} // namespace RailPlanner

#endif // RAIL_PLANNER_ENV_H
