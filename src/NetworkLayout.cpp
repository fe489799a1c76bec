#include <rail-planner/Errors.h>
#include <rail-planner/FareTable.h>
#include <rail-planner/Network.h>
#include <rail-planner/NetworkLayout.h>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include <optional>
#include <string>
#include <vector>

using RailPlanner::Company;
using RailPlanner::GroupDiscountBracket;
using RailPlanner::Hop;
using RailPlanner::Id;
using RailPlanner::IntegrityError;
using RailPlanner::InvalidPassengerTypeError;
using RailPlanner::InvalidRequestError;
using RailPlanner::Line;
using RailPlanner::LineFareRule;
using RailPlanner::NetworkData;
using RailPlanner::PassengerType;
using RailPlanner::RailPlannerException;
using RailPlanner::SegmentDelay;
using RailPlanner::ServiceOverlay;
using RailPlanner::Station;
using RailPlanner::StationPair;
using RailPlanner::TransferLink;
using RailPlanner::ZoneFare;

// Get an optional array field, or an empty vector if the field is missing.
template <typename T>
static std::vector<T> GetOptionalArray(
    const nlohmann::json& src,
    const std::string& key
)
{
    if (!src.contains(key)) {
        return {};
    }
    return src.at(key).get<std::vector<T>>();
}

NetworkData RailPlanner::ParseNetworkData(
    const nlohmann::json& src
)
{
    try {
        auto data {src.get<NetworkData>()};
        spdlog::info("NetworkLayout: Parsed {} stations, {} lines, "
                     "{} transfer links",
                     data.stations.size(), data.lines.size(),
                     data.transferLinks.size());
        return data;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("NetworkLayout: Invalid network layout: {}", e.what());
        throw IntegrityError(std::string("Invalid network layout: ") +
                             e.what());
    } catch (const IntegrityError&) {
        throw;
    } catch (const RailPlannerException& e) {
        // An unknown passenger category in a layout is a data error.
        spdlog::error("NetworkLayout: Invalid network layout: {}", e.what());
        throw IntegrityError(std::string("Invalid network layout: ") +
                             e.what());
    }
}

ServiceOverlay RailPlanner::ParseServiceOverlay(
    const nlohmann::json& src
)
{
    try {
        return src.get<ServiceOverlay>();
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("NetworkLayout: Invalid service overlay: {}", e.what());
        throw InvalidRequestError(std::string("Invalid service overlay: ") +
                                  e.what());
    }
}

void RailPlanner::from_json(
    const nlohmann::json& src,
    Company& dst
)
{
    dst.id = src.at("id").get<Id>();
    dst.name = src.value("name", std::string {});
}

void RailPlanner::from_json(
    const nlohmann::json& src,
    Station& dst
)
{
    dst.id = src.at("id").get<Id>();
    dst.name = src.at("name").get<std::string>();
    dst.latitude = src.value("latitude", 0.0);
    dst.longitude = src.value("longitude", 0.0);
    dst.zone = src.value("zone", 1u);
    dst.isInterchange = src.value("is_interchange", false);
    dst.lineId = src.value("line_id", Id {});
}

void RailPlanner::from_json(
    const nlohmann::json& src,
    Hop& dst
)
{
    dst.travelTime = src.at("travel_time").get<unsigned int>();
    dst.baseCost = src.value("base_cost", 0.0);
    dst.distanceKm = src.value("distance_km", 0.0);
}

void RailPlanner::from_json(
    const nlohmann::json& src,
    Line& dst
)
{
    dst.id = src.at("id").get<Id>();
    dst.companyId = src.value("company_id", Id {});
    dst.name = src.value("name", dst.id);
    dst.color = src.value("color", std::string {});
    const auto status {src.value("status", std::string {"active"})};
    const auto lineStatus {ToLineStatus(status)};
    if (lineStatus == std::nullopt) {
        throw IntegrityError("Unknown status for line " + dst.id + ": " +
                             status);
    }
    dst.status = *lineStatus;
    dst.stops = src.at("stops").get<std::vector<Id>>();
    dst.hops = GetOptionalArray<Hop>(src, "hops");
}

void RailPlanner::from_json(
    const nlohmann::json& src,
    TransferLink& dst
)
{
    dst.stationAId = src.at("station_a_id").get<Id>();
    dst.stationBId = src.at("station_b_id").get<Id>();
    dst.walkingTime = src.value("walking_time", 5u);
    dst.walkingDistanceMeters = src.value("walking_distance_meters", 0u);
    dst.transferFee = src.value("transfer_fee", 0.0);
    dst.isActive = src.value("is_active", true);
}

void RailPlanner::from_json(
    const nlohmann::json& src,
    ZoneFare& dst
)
{
    dst.zone = src.at("zone").get<unsigned int>();
    dst.baseFare = src.at("base_fare").get<double>();
    dst.incrementalFare = src.value("incremental_fare", 0.0);
}

void RailPlanner::from_json(
    const nlohmann::json& src,
    LineFareRule& dst
)
{
    dst.lineId = src.at("line_id").get<Id>();
    const auto pricing {src.value("pricing", std::string {"zone"})};
    const auto farePricing {ToFarePricing(pricing)};
    if (farePricing == std::nullopt) {
        throw IntegrityError("Unknown pricing for line " + dst.lineId + ": " +
                             pricing);
    }
    dst.pricing = *farePricing;
    dst.zones = src.at("zones").get<std::vector<ZoneFare>>();
}

void RailPlanner::from_json(
    const nlohmann::json& src,
    PassengerType& dst
)
{
    const auto category {src.at("category").get<std::string>()};
    const auto passengerCategory {ToPassengerCategory(category)};
    if (passengerCategory == std::nullopt) {
        throw InvalidPassengerTypeError("Unknown passenger type " + category);
    }
    dst.category = *passengerCategory;
    dst.discountPercent = src.value("discount_percent", 0.0);
    if (src.contains("min_age") && !src.at("min_age").is_null()) {
        dst.minAge = src.at("min_age").get<unsigned int>();
    }
    if (src.contains("max_age") && !src.at("max_age").is_null()) {
        dst.maxAge = src.at("max_age").get<unsigned int>();
    }
}

void RailPlanner::from_json(
    const nlohmann::json& src,
    GroupDiscountBracket& dst
)
{
    dst.minGroupSize = src.at("min_group_size").get<unsigned int>();
    dst.discountPercent = src.at("discount_percent").get<double>();
}

void RailPlanner::from_json(
    const nlohmann::json& src,
    NetworkData& dst
)
{
    dst.companies = GetOptionalArray<Company>(src, "companies");
    dst.stations = src.at("stations").get<std::vector<Station>>();
    dst.lines = src.at("lines").get<std::vector<Line>>();
    dst.transferLinks = GetOptionalArray<TransferLink>(src, "transfer_links");
    dst.fareRules = GetOptionalArray<LineFareRule>(src, "fare_rules");
    dst.passengerTypes = GetOptionalArray<PassengerType>(
        src, "passenger_types"
    );
    dst.groupDiscounts = GetOptionalArray<GroupDiscountBracket>(
        src, "group_discounts"
    );
}

void RailPlanner::from_json(
    const nlohmann::json& src,
    StationPair& dst
)
{
    dst.stationAId = src.at("station_a_id").get<Id>();
    dst.stationBId = src.at("station_b_id").get<Id>();
}

void RailPlanner::from_json(
    const nlohmann::json& src,
    SegmentDelay& dst
)
{
    dst.stationAId = src.at("station_a_id").get<Id>();
    dst.stationBId = src.at("station_b_id").get<Id>();
    dst.delayMinutes = src.at("delay_minutes").get<unsigned int>();
}

void RailPlanner::from_json(
    const nlohmann::json& src,
    ServiceOverlay& dst
)
{
    dst.closedSegments = GetOptionalArray<StationPair>(
        src, "closed_segments"
    );
    dst.closedLines = GetOptionalArray<Id>(src, "closed_lines");
    dst.closedStations = GetOptionalArray<Id>(src, "closed_stations");
    dst.delays = GetOptionalArray<SegmentDelay>(src, "delays");
}
