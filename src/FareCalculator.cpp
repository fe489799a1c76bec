#include <rail-planner/Errors.h>
#include <rail-planner/FareCalculator.h>
#include <rail-planner/FareTable.h>
#include <rail-planner/Itinerary.h>
#include <rail-planner/Network.h>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using RailPlanner::EdgeKind;
using RailPlanner::FareBreakdown;
using RailPlanner::FareComparison;
using RailPlanner::FareItem;
using RailPlanner::FareRuleMissingError;
using RailPlanner::FarePricing;
using RailPlanner::FareTable;
using RailPlanner::Id;
using RailPlanner::InvalidPassengerTypeError;
using RailPlanner::InvalidRequestError;
using RailPlanner::Itinerary;
using RailPlanner::Money;
using RailPlanner::NetworkSnapshot;
using RailPlanner::PassengerCategory;
using RailPlanner::Segment;
using RailPlanner::StationNotFoundError;

static unsigned int GetZone(
    const NetworkSnapshot& network,
    const Id& stationId
)
{
    const auto station {network.FindStation(stationId)};
    if (station == std::nullopt) {
        throw StationNotFoundError("Unknown station " + stationId);
    }
    return network.GetStation(*station).zone;
}

static FareItem PriceRide(
    const FareTable& fareTable,
    const NetworkSnapshot& network,
    const Segment& segment,
    size_t segmentIndex
)
{
    FareItem item {};
    item.segmentIndex = segmentIndex;
    item.kind = EdgeKind::kRide;
    item.lineId = segment.lineId;
    item.fromStationId = segment.fromStationId;
    item.toStationId = segment.toStationId;

    const auto fromZone {GetZone(network, segment.fromStationId)};
    const auto toZone {GetZone(network, segment.toStationId)};
    const auto pricing {fareTable.GetPricing(segment.lineId)};
    const auto zoneFare {fareTable.FindZoneFare(segment.lineId, fromZone)};
    if (pricing == std::nullopt || zoneFare == nullptr) {
        spdlog::error("FareCalculator: No fare for line {} zone {} ({} -> {})",
                      segment.lineId, fromZone,
                      segment.fromStationId, segment.toStationId);
        throw FareRuleMissingError("No fare for line " + segment.lineId +
                                   " zone " + std::to_string(fromZone));
    }
    switch (*pricing) {
        case FarePricing::kPerStation:
            // Each ride segment advances exactly one station.
            item.increments = 1;
            break;
        case FarePricing::kZone:
        default:
            item.increments = fromZone > toZone ?
                fromZone - toZone : toZone - fromZone;
            break;
    }
    item.baseFare = zoneFare->baseFare;
    item.incrementalFare = zoneFare->incrementalFare;
    item.total = RailPlanner::RoundMoney(
        item.baseFare + item.incrementalFare * item.increments
    );
    return item;
}

static FareItem PriceTransfer(
    const Segment& segment,
    size_t segmentIndex
)
{
    FareItem item {};
    item.segmentIndex = segmentIndex;
    item.kind = EdgeKind::kTransfer;
    item.fromStationId = segment.fromStationId;
    item.toStationId = segment.toStationId;
    item.transferFee = segment.baseCost;
    item.total = RailPlanner::RoundMoney(segment.baseCost);
    return item;
}

Money RailPlanner::RoundMoney(
    Money amount
)
{
    return std::round(amount * 100.0) / 100.0;
}

FareBreakdown RailPlanner::Price(
    const FareTable& fareTable,
    const NetworkSnapshot& network,
    const Itinerary& itinerary,
    PassengerCategory category,
    bool isGroup,
    unsigned int groupSize
)
{
    if (groupSize == 0) {
        throw InvalidRequestError("Group size must be at least 1");
    }
    const auto passengerType {fareTable.FindPassengerType(category)};
    if (passengerType == nullptr) {
        throw InvalidPassengerTypeError("No fares for passenger type " +
                                        ToString(category));
    }

    FareBreakdown breakdown {};
    breakdown.passengerCategory = category;
    breakdown.isGroup = isGroup;
    breakdown.groupSize = groupSize;

    // Per-segment fares
    breakdown.items.reserve(itinerary.segments.size());
    for (size_t idx {0}; idx < itinerary.segments.size(); ++idx) {
        const auto& segment {itinerary.segments[idx]};
        if (segment.kind == EdgeKind::kTransfer) {
            auto item {PriceTransfer(segment, idx)};
            breakdown.transferFees += item.total;
            breakdown.items.push_back(std::move(item));
        } else {
            auto item {PriceRide(fareTable, network, segment, idx)};
            breakdown.rideSubtotal += item.total;
            breakdown.items.push_back(std::move(item));
        }
    }
    breakdown.rideSubtotal = RoundMoney(breakdown.rideSubtotal);
    breakdown.transferFees = RoundMoney(breakdown.transferFees);

    // Passenger discount, on ride fares only.
    breakdown.passengerDiscountPercent = passengerType->discountPercent;
    breakdown.passengerDiscountAmount = RoundMoney(
        breakdown.rideSubtotal * breakdown.passengerDiscountPercent / 100.0
    );
    const auto passengerTotal {RoundMoney(
        breakdown.rideSubtotal - breakdown.passengerDiscountAmount +
        breakdown.transferFees
    )};

    // Group discount, on the post-passenger-discount total.
    if (isGroup) {
        breakdown.groupDiscountPercent =
            fareTable.GetGroupDiscountPercent(groupSize);
        breakdown.groupDiscountAmount = RoundMoney(
            passengerTotal * breakdown.groupDiscountPercent / 100.0
        );
    }
    breakdown.total = RoundMoney(
        passengerTotal - breakdown.groupDiscountAmount
    );
    breakdown.groupTotal = RoundMoney(breakdown.total * groupSize);

    spdlog::debug("FareCalculator: {} -> {} for {}: {:.2f} baht",
                  itinerary.originStationId, itinerary.destinationStationId,
                  ToString(category), breakdown.total);
    return breakdown;
}

std::vector<FareComparison> RailPlanner::CompareFares(
    const FareTable& fareTable,
    const NetworkSnapshot& network,
    const std::vector<Itinerary>& itineraries,
    PassengerCategory category,
    bool isGroup,
    unsigned int groupSize
)
{
    std::vector<FareComparison> comparisons {};
    comparisons.reserve(itineraries.size());
    for (size_t idx {0}; idx < itineraries.size(); ++idx) {
        const auto& itinerary {itineraries[idx]};
        auto breakdown {Price(
            fareTable,
            network,
            itinerary,
            category,
            isGroup,
            groupSize
        )};
        const auto farePerMinute {itinerary.totalTravelTime == 0 ? 0.0 :
            RoundMoney(breakdown.total / itinerary.totalTravelTime)
        };
        comparisons.push_back(FareComparison {
            idx,
            breakdown.total,
            itinerary.totalTravelTime,
            itinerary.transfers,
            farePerMinute,
            itinerary.linesUsed,
            std::move(breakdown),
        });
    }
    std::stable_sort(
        comparisons.begin(),
        comparisons.end(),
        [](const auto& a, const auto& b) {
            return a.total < b.total;
        }
    );
    return comparisons;
}

void RailPlanner::to_json(
    nlohmann::json& dst,
    const FareItem& src
)
{
    dst["segment_index"] = src.segmentIndex;
    dst["kind"] = ToString(src.kind);
    dst["line_id"] = src.lineId;
    dst["from_station_id"] = src.fromStationId;
    dst["to_station_id"] = src.toStationId;
    dst["increments"] = src.increments;
    dst["base_fare"] = src.baseFare;
    dst["incremental_fare"] = src.incrementalFare;
    dst["transfer_fee"] = src.transferFee;
    dst["total"] = src.total;
}

void RailPlanner::to_json(
    nlohmann::json& dst,
    const FareBreakdown& src
)
{
    dst["items"] = src.items;
    dst["ride_subtotal"] = src.rideSubtotal;
    dst["passenger_type"] = ToString(src.passengerCategory);
    dst["passenger_discount_percent"] = src.passengerDiscountPercent;
    dst["passenger_discount_amount"] = src.passengerDiscountAmount;
    dst["transfer_fees"] = src.transferFees;
    dst["is_group"] = src.isGroup;
    dst["group_discount_percent"] = src.groupDiscountPercent;
    dst["group_discount_amount"] = src.groupDiscountAmount;
    dst["total"] = src.total;
    dst["group_size"] = src.groupSize;
    dst["group_total"] = src.groupTotal;
}

void RailPlanner::to_json(
    nlohmann::json& dst,
    const FareComparison& src
)
{
    dst["itinerary_index"] = src.itineraryIndex;
    dst["total"] = src.total;
    dst["total_travel_time"] = src.totalTravelTime;
    dst["transfers"] = src.transfers;
    dst["fare_per_minute"] = src.farePerMinute;
    dst["lines_used"] = src.linesUsed;
    dst["breakdown"] = src.breakdown;
}
