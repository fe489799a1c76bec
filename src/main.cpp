#include <rail-planner/env.h>
#include <rail-planner/Errors.h>
#include <rail-planner/FareCalculator.h>
#include <rail-planner/FareTable.h>
#include <rail-planner/Itinerary.h>
#include <rail-planner/RouteFinder.h>
#include <rail-planner/RoutePlanner.h>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using RailPlanner::GetEnvVar;
using RailPlanner::GetEnvVarUnsigned;
using RailPlanner::Itinerary;
using RailPlanner::PassengerCategory;
using RailPlanner::PlanRequest;
using RailPlanner::RailPlannerConfig;
using RailPlanner::RailPlannerException;
using RailPlanner::RailPlannerSetupError;
using RailPlanner::RoutePlanner;
using RailPlanner::SearchLimits;

// Split a comma-separated list, skipping empty items.
static std::vector<std::string> ParseList(
    const std::string& list
)
{
    std::vector<std::string> items {};
    std::istringstream stream {list};
    std::string item {};
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

// Parse a comma-separated list of passenger types.
static std::vector<PassengerCategory> ParsePassengerTypes(
    const std::string& names
)
{
    std::vector<PassengerCategory> categories {};
    for (const auto& name: ParseList(names)) {
        const auto category {RailPlanner::ToPassengerCategory(name)};
        if (category == std::nullopt) {
            throw RailPlanner::InvalidPassengerTypeError(
                "Unknown passenger type " + name
            );
        }
        categories.push_back(*category);
    }
    return categories;
}

int main()
{
    // Logging
    spdlog::set_level(spdlog::level::from_str(
        GetEnvVar("RAIL_PLANNER_LOG_LEVEL", "info")
    ));

    // Planner configuration
    RailPlannerConfig config {};
    try {
        config = RailPlannerConfig {
            GetEnvVar("RAIL_PLANNER_NETWORK_LAYOUT_FILE_PATH", ""),
            GetEnvVar("RAIL_PLANNER_NETWORK_LAYOUT_URL", ""),
            GetEnvVar("RAIL_PLANNER_CACERT_PATH", ""),
            GetEnvVarUnsigned("RAIL_PLANNER_MAX_FRONTIER_POPS", 100000),
        };
    } catch (const std::runtime_error& e) {
        spdlog::error("RailPlanner: Invalid configuration: {}", e.what());
        return -1;
    }

    // Load the network.
    RoutePlanner planner {SearchLimits {config.maxFrontierPops}};
    auto setupError {planner.Configure(config)};
    if (setupError != RailPlannerSetupError::kOk) {
        spdlog::error("RailPlanner: Setup failed: {}", ToString(setupError));
        return -1;
    }

    // Plan the requested journey.
    try {
        PlanRequest request {};
        request.originStationId = GetEnvVar("RAIL_PLANNER_ORIGIN");
        request.destinationStationId = GetEnvVar("RAIL_PLANNER_DESTINATION");
        const auto preference {GetEnvVar("RAIL_PLANNER_PREFERENCE", "fastest")};
        const auto parsedPreference {RailPlanner::ToPreference(preference)};
        if (parsedPreference == std::nullopt) {
            throw RailPlanner::InvalidRequestError("Unknown preference " +
                                                   preference);
        }
        request.preference = *parsedPreference;
        request.passengerTypes = ParsePassengerTypes(
            GetEnvVar("RAIL_PLANNER_PASSENGER_TYPES", "adult")
        );
        request.alternatives = GetEnvVarUnsigned("RAIL_PLANNER_ALTERNATIVES", 3);
        request.groupSize = static_cast<unsigned int>(
            GetEnvVarUnsigned("RAIL_PLANNER_GROUP_SIZE", 1)
        );
        request.isGroup = request.groupSize > 1;
        if (!GetEnvVar("RAIL_PLANNER_MAX_TRANSFERS", "").empty()) {
            request.maxTransfers = static_cast<unsigned int>(
                GetEnvVarUnsigned("RAIL_PLANNER_MAX_TRANSFERS")
            );
        }
        if (!GetEnvVar("RAIL_PLANNER_MAX_WALKING_TIME", "").empty()) {
            request.maxWalkingTime = static_cast<unsigned int>(
                GetEnvVarUnsigned("RAIL_PLANNER_MAX_WALKING_TIME")
            );
        }
        request.avoidLines = ParseList(
            GetEnvVar("RAIL_PLANNER_AVOID_LINES", "")
        );
        request.preferLines = ParseList(
            GetEnvVar("RAIL_PLANNER_PREFER_LINES", "")
        );

        const auto priced {planner.Plan(request)};

        // Fares side by side, for the first passenger type.
        std::vector<Itinerary> itineraries {};
        for (const auto& result: priced) {
            itineraries.push_back(result.itinerary);
        }
        const auto comparison {planner.CompareFares(
            itineraries,
            request.passengerTypes.front(),
            request.isGroup,
            request.groupSize
        )};

        nlohmann::json output {};
        output["itineraries"] = priced;
        output["fare_comparison"] = comparison;
        std::cout << output.dump(2) << std::endl;
    } catch (const RailPlannerException& e) {
        spdlog::error("RailPlanner: {}", e.what());
        return RailPlanner::IsRetryable(e.GetCode()) ? -3 : -2;
    } catch (const std::runtime_error& e) {
        spdlog::error("RailPlanner: Invalid request: {}", e.what());
        return -2;
    }

    return 0;
}
