#include <rail-planner/Alternatives.h>
#include <rail-planner/Errors.h>
#include <rail-planner/FareCalculator.h>
#include <rail-planner/FareTable.h>
#include <rail-planner/FileDownloader.h>
#include <rail-planner/Itinerary.h>
#include <rail-planner/Network.h>
#include <rail-planner/NetworkLayout.h>
#include <rail-planner/RouteFinder.h>
#include <rail-planner/RoutePlanner.h>

#include <boost/bimap.hpp>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <initializer_list>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

using RailPlanner::FareBreakdown;
using RailPlanner::FareComparison;
using RailPlanner::Id;
using RailPlanner::IntegrityError;
using RailPlanner::InvalidPassengerTypeError;
using RailPlanner::InvalidRequestError;
using RailPlanner::Itinerary;
using RailPlanner::ItineraryCmp;
using RailPlanner::NetworkData;
using RailPlanner::NetworkView;
using RailPlanner::NoPathError;
using RailPlanner::PassengerCategory;
using RailPlanner::PlanRequest;
using RailPlanner::PricedItinerary;
using RailPlanner::RailPlannerConfig;
using RailPlanner::RailPlannerSetupError;
using RailPlanner::RoutePlanner;
using RailPlanner::SearchLimits;
using RailPlanner::Snapshot;
using RailPlanner::StationNotFoundError;

// Utility function to generate a boost::bimap.
template <typename L, typename R>
static boost::bimap<L, R> MakeBimap(
    std::initializer_list<typename boost::bimap<L, R>::value_type> list
)
{
    return boost::bimap<L, R>(list.begin(), list.end());
}

// RailPlannerSetupError

static const auto gRailPlannerSetupErrorStrings {
    MakeBimap<RailPlannerSetupError, std::string_view>({
        {RailPlannerSetupError::kOk                             ,
                                "Ok"                             },
        {RailPlannerSetupError::kUndefinedError                 ,
                                "UndefinedError"                 },
        {RailPlannerSetupError::kFailedNetworkConstruction      ,
                                "FailedNetworkConstruction"      },
        {RailPlannerSetupError::kFailedNetworkLayoutFileDownload,
                                "FailedNetworkLayoutFileDownload"},
        {RailPlannerSetupError::kFailedNetworkLayoutFileParsing ,
                                "FailedNetworkLayoutFileParsing" },
        {RailPlannerSetupError::kMissingNetworkLayoutFile       ,
                                "MissingNetworkLayoutFile"       },
    })
};

std::ostream& RailPlanner::operator<<(
    std::ostream& os,
    const RailPlannerSetupError& error
)
{
    return os << ToString(error);
}

std::string RailPlanner::ToString(
    const RailPlannerSetupError& error
)
{
    auto errorIt {gRailPlannerSetupErrorStrings.left.find(error)};
    if (errorIt == gRailPlannerSetupErrorStrings.left.end()) {
        return "UndefinedError";
    }
    return std::string(errorIt->second);
}

// RoutePlanner — Public methods

RoutePlanner::RoutePlanner(
    const SearchLimits& limits
) : limits_ {limits}
{
}

RailPlannerSetupError RoutePlanner::Configure(
    const RailPlannerConfig& config
)
{
    spdlog::info("RoutePlanner: Configure route planner");
    limits_.maxFrontierPops = config.maxFrontierPops;

    // Sanity checks
    if (!config.networkLayoutFile.empty() &&
            !std::filesystem::exists(config.networkLayoutFile)) {
        spdlog::error("RoutePlanner: Could not find {}. Exiting",
                      config.networkLayoutFile.string());
        return RailPlannerSetupError::kMissingNetworkLayoutFile;
    }
    if (config.networkLayoutFile.empty() && config.networkLayoutUrl.empty()) {
        spdlog::error("RoutePlanner: No network layout file or URL. Exiting");
        return RailPlannerSetupError::kMissingNetworkLayoutFile;
    }

    // Download the network layout file if the config does not contain a
    // local filename, then parse the file.
    auto networkLayoutFile {config.networkLayoutFile.empty() ?
        std::filesystem::temp_directory_path() / "rail-network-layout.json" :
        config.networkLayoutFile
    };
    if (config.networkLayoutFile.empty()) {
        spdlog::info("RoutePlanner: Downloading the network layout file to {}",
                     networkLayoutFile.string());
        bool downloaded {DownloadFile(
            config.networkLayoutUrl,
            networkLayoutFile,
            config.caCertFile
        )};
        if (!downloaded) {
            spdlog::error("RoutePlanner: Could not download {}. Exiting",
                          config.networkLayoutUrl);
            return RailPlannerSetupError::kFailedNetworkLayoutFileDownload;
        }
    }
    spdlog::info("RoutePlanner: Loading the network layout file");
    const nlohmann::json parsed = ParseJsonFile(networkLayoutFile);
    if (parsed.empty()) {
        spdlog::error("RoutePlanner: Could not parse {}. Exiting",
                      networkLayoutFile.string());
        return RailPlannerSetupError::kFailedNetworkLayoutFileParsing;
    }

    // Network representation
    try {
        Rebuild(ParseNetworkData(parsed));
    } catch (const std::exception& e) {
        spdlog::error("RoutePlanner: Could not build the network: {}. "
                      "Exiting", e.what());
        return RailPlannerSetupError::kFailedNetworkConstruction;
    }

    spdlog::info("RoutePlanner: Route planner configured");
    return RailPlannerSetupError::kOk;
}

void RoutePlanner::Rebuild(
    const NetworkData& data
)
{
    spdlog::info("RoutePlanner: Rebuilding the network snapshot");

    // Build the new snapshot first. If anything fails, the current snapshot
    // is left untouched.
    auto network {NetworkSnapshot::Build(
        data.stations,
        data.lines,
        data.transferLinks,
        data.companies
    )};
    auto fares {FareTable::Build(
        data.fareRules,
        data.passengerTypes,
        data.groupDiscounts,
        network
    )};
    auto snapshot {std::make_shared<const Snapshot>(Snapshot {
        std::move(network),
        std::move(fares),
    })};

    // Publish.
    std::atomic_store(&snapshot_, std::move(snapshot));
    spdlog::info("RoutePlanner: New network snapshot in effect");
}

std::shared_ptr<const Snapshot> RoutePlanner::GetSnapshot() const
{
    return std::atomic_load(&snapshot_);
}

std::vector<PricedItinerary> RoutePlanner::Plan(
    const PlanRequest& request
) const
{
    // We use the same snapshot for the whole request.
    const auto snapshot {GetSnapshotOrThrow()};
    const auto& network {snapshot->network};

    // Validate the request.
    if (request.alternatives == 0) {
        throw InvalidRequestError("At least one itinerary must be requested");
    }
    if (request.passengerTypes.empty()) {
        throw InvalidRequestError("At least one passenger type is required");
    }
    if (request.originStationId == request.destinationStationId) {
        throw InvalidRequestError("Origin and destination are the same "
                                  "station: " + request.originStationId);
    }
    if (request.maxTransfers &&
            *request.maxTransfers > kMaxTransfersLimit) {
        throw InvalidRequestError("Maximum transfers cannot exceed " +
                                  std::to_string(kMaxTransfersLimit));
    }
    if (request.maxWalkingTime && (*request.maxWalkingTime < 1 ||
            *request.maxWalkingTime > kMaxWalkingTimeLimit)) {
        throw InvalidRequestError("Maximum walking time must be between 1 "
                                  "and " +
                                  std::to_string(kMaxWalkingTimeLimit) +
                                  " minutes");
    }
    for (const auto& stationId: {
        request.originStationId,
        request.destinationStationId,
    }) {
        if (network.FindStation(stationId) == std::nullopt) {
            throw StationNotFoundError("Unknown station " + stationId);
        }
    }
    for (const auto& lineId: request.preferLines) {
        if (network.FindLine(lineId) == nullptr) {
            throw InvalidRequestError("Unknown preferred line " + lineId);
        }
    }
    for (const auto& category: request.passengerTypes) {
        if (snapshot->fares.FindPassengerType(category) == nullptr) {
            throw InvalidPassengerTypeError("No fares for passenger type " +
                                            ToString(category));
        }
    }
    spdlog::info("RoutePlanner: Plan {} -> {} ({}, {} alternatives)",
                 request.originStationId, request.destinationStationId,
                 ToString(request.preference), request.alternatives);

    // Search.
    // Avoided lines are closed like any other line, for this request only.
    auto overlay {request.overlay};
    overlay.closedLines.insert(
        overlay.closedLines.end(),
        request.avoidLines.begin(),
        request.avoidLines.end()
    );
    auto limits {limits_};
    limits.maxTransfers = request.maxTransfers;
    limits.maxWalkingTime = request.maxWalkingTime;
    const NetworkView view {network, overlay};
    auto itineraries {FindAlternatives(
        view,
        request.originStationId,
        request.destinationStationId,
        GetObjective(request.preference),
        std::clamp(request.alternatives, kMinAlternatives, kMaxAlternatives),
        limits
    )};
    std::sort(itineraries.begin(), itineraries.end(), ItineraryCmp {});
    if (!request.preferLines.empty()) {
        std::stable_partition(
            itineraries.begin(),
            itineraries.end(),
            [&request](const Itinerary& itinerary) {
                return std::find_first_of(
                    itinerary.linesUsed.begin(),
                    itinerary.linesUsed.end(),
                    request.preferLines.begin(),
                    request.preferLines.end()
                ) != itinerary.linesUsed.end();
            }
        );
    }
    const auto nResults {std::min(request.alternatives, kMaxAlternatives)};
    if (itineraries.size() > nResults) {
        itineraries.resize(nResults);
    }
    if (itineraries.empty()) {
        throw NoPathError("No path from " + request.originStationId + " to " +
                          request.destinationStationId);
    }

    // Price.
    std::vector<PricedItinerary> priced {};
    priced.reserve(itineraries.size());
    for (auto& itinerary: itineraries) {
        PricedItinerary result {std::move(itinerary), {}};
        result.fares.reserve(request.passengerTypes.size());
        for (const auto& category: request.passengerTypes) {
            result.fares.push_back(RailPlanner::Price(
                snapshot->fares,
                network,
                result.itinerary,
                category,
                request.isGroup,
                request.groupSize
            ));
        }
        priced.push_back(std::move(result));
    }
    spdlog::info("RoutePlanner: Plan {} -> {}: {} itineraries",
                 request.originStationId, request.destinationStationId,
                 priced.size());
    return priced;
}

FareBreakdown RoutePlanner::Price(
    const Itinerary& itinerary,
    PassengerCategory category,
    bool isGroup,
    unsigned int groupSize
) const
{
    const auto snapshot {GetSnapshotOrThrow()};
    return RailPlanner::Price(
        snapshot->fares,
        snapshot->network,
        itinerary,
        category,
        isGroup,
        groupSize
    );
}

std::vector<FareComparison> RoutePlanner::CompareFares(
    const std::vector<Itinerary>& itineraries,
    PassengerCategory category,
    bool isGroup,
    unsigned int groupSize
) const
{
    const auto snapshot {GetSnapshotOrThrow()};
    return RailPlanner::CompareFares(
        snapshot->fares,
        snapshot->network,
        itineraries,
        category,
        isGroup,
        groupSize
    );
}

// RoutePlanner — Private methods

std::shared_ptr<const Snapshot> RoutePlanner::GetSnapshotOrThrow() const
{
    auto snapshot {GetSnapshot()};
    if (snapshot == nullptr) {
        throw IntegrityError("No network loaded");
    }
    return snapshot;
}

// Free functions

void RailPlanner::from_json(
    const nlohmann::json& src,
    PlanRequest& dst
)
{
    dst.originStationId = src.at("origin").get<Id>();
    dst.destinationStationId = src.at("destination").get<Id>();
    const auto preferenceName {
        src.value("preference", std::string {"fastest"})
    };
    const auto preference {ToPreference(preferenceName)};
    if (preference == std::nullopt) {
        throw InvalidRequestError("Unknown preference " + preferenceName);
    }
    dst.preference = *preference;
    if (src.contains("passenger_types")) {
        dst.passengerTypes.clear();
        for (const auto& name: src.at("passenger_types")) {
            const auto category {ToPassengerCategory(name.get<std::string>())};
            if (category == std::nullopt) {
                throw InvalidPassengerTypeError("Unknown passenger type " +
                                                name.get<std::string>());
            }
            dst.passengerTypes.push_back(*category);
        }
    }
    dst.alternatives = src.value("alternatives", dst.alternatives);
    if (src.contains("overlay")) {
        dst.overlay = ParseServiceOverlay(src.at("overlay"));
    }
    dst.isGroup = src.value("is_group", false);
    dst.groupSize = src.value("group_size", 1u);
    if (src.contains("max_transfers")) {
        dst.maxTransfers = src.at("max_transfers").get<unsigned int>();
    }
    if (src.contains("max_walking_time")) {
        dst.maxWalkingTime = src.at("max_walking_time").get<unsigned int>();
    }
    dst.avoidLines = src.value("avoid_lines", std::vector<Id> {});
    dst.preferLines = src.value("prefer_lines", std::vector<Id> {});
}

void RailPlanner::to_json(
    nlohmann::json& dst,
    const PricedItinerary& src
)
{
    dst["itinerary"] = src.itinerary;
    dst["fares"] = src.fares;
}
