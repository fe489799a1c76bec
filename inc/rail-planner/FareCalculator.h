#ifndef RAIL_PLANNER_FARE_CALCULATOR_H
#define RAIL_PLANNER_FARE_CALCULATOR_H

#include <rail-planner/FareTable.h>
#include <rail-planner/Itinerary.h>
#include <rail-planner/Network.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <vector>

namespace RailPlanner {

/*! \brief Fare of a single itinerary segment.
 *
 *  For ride segments, `total = baseFare + incrementalFare * increments`.
 *  For transfer segments, `total = transferFee`.
 */
struct FareItem {
    size_t segmentIndex {0};
    EdgeKind kind {EdgeKind::kRide};
    Id lineId {};
    Id fromStationId {};
    Id toStationId {};
    unsigned int increments {0};
    Money baseFare {0.0};
    Money incrementalFare {0.0};
    Money transferFee {0.0};
    Money total {0.0};
};

/*! \brief Itemized fare of an itinerary for one passenger type.
 *
 *  total = rideSubtotal - passengerDiscountAmount + transferFees
 *          - groupDiscountAmount
 *
 *  `total` is the fare of a single passenger. `groupTotal` is the fare of the
 *  whole group (`groupSize` passengers).
 */
struct FareBreakdown {
    std::vector<FareItem> items {};
    Money rideSubtotal {0.0};
    PassengerCategory passengerCategory {PassengerCategory::kAdult};
    double passengerDiscountPercent {0.0};
    Money passengerDiscountAmount {0.0};
    Money transferFees {0.0};
    bool isGroup {false};
    double groupDiscountPercent {0.0};
    Money groupDiscountAmount {0.0};
    Money total {0.0};
    unsigned int groupSize {1};
    Money groupTotal {0.0};
};

/*! \brief Round an amount to the nearest 0.01 baht.
 */
Money RoundMoney(
    Money amount
);

/*! \brief Price an itinerary for one passenger type.
 *
 *  \param fareTable The fares. Must have been built for `network`.
 *  \param network   The network the itinerary was planned on.
 *  \param itinerary The itinerary to price.
 *  \param category  Passenger category. Its discount applies to ride fares
 *                   only. Transfer fees are never discounted.
 *  \param isGroup   Whether to apply the group discount schedule.
 *  \param groupSize Number of passengers travelling together. Must not be 0.
 *
 *  \throws InvalidPassengerTypeError if the fare table has no such category.
 *  \throws FareRuleMissingError      if a ride segment has no fare.
 *  \throws StationNotFoundError      if a segment references an unknown
 *                                    station.
 *  \throws InvalidRequestError       if groupSize is 0.
 */
FareBreakdown Price(
    const FareTable& fareTable,
    const NetworkSnapshot& network,
    const Itinerary& itinerary,
    PassengerCategory category,
    bool isGroup = false,
    unsigned int groupSize = 1
);

/*! \brief Fare of one itinerary, next to the others it is compared with.
 *
 *  `itineraryIndex` is the position of the itinerary in the list that was
 *  compared. `farePerMinute` is 0 for an itinerary that takes no time.
 */
struct FareComparison {
    size_t itineraryIndex {0};
    Money total {0.0};
    unsigned int totalTravelTime {0};
    unsigned int transfers {0};
    Money farePerMinute {0.0};
    std::vector<Id> linesUsed {};
    FareBreakdown breakdown {};
};

/*! \brief Price a list of itineraries for the same passengers, cheapest first.
 *
 *  Itineraries with the same fare keep their relative order.
 *
 *  See `Price` for the parameters and the failures.
 */
std::vector<FareComparison> CompareFares(
    const FareTable& fareTable,
    const NetworkSnapshot& network,
    const std::vector<Itinerary>& itineraries,
    PassengerCategory category,
    bool isGroup = false,
    unsigned int groupSize = 1
);

void to_json(
    nlohmann::json& dst,
    const FareItem& src
);

void to_json(
    nlohmann::json& dst,
    const FareBreakdown& src
);

void to_json(
    nlohmann::json& dst,
    const FareComparison& src
);

} // namespace RailPlanner

#endif // RAIL_PLANNER_FARE_CALCULATOR_H
