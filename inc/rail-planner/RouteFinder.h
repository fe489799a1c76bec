#ifndef RAIL_PLANNER_ROUTE_FINDER_H
#define RAIL_PLANNER_ROUTE_FINDER_H

#include <rail-planner/Itinerary.h>
#include <rail-planner/Network.h>

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

namespace RailPlanner {

/*! \brief Optimization preference stated by the caller.
 */
enum class Preference {
    kFastest,
    kCheapest,
    kFewestTransfers,
};

/*! \brief Print operator for the `Preference` class.
 */
std::ostream& operator<<(
    std::ostream& os,
    const Preference& preference
);

/*! \brief Convert `Preference` to string.
 */
std::string ToString(
    const Preference& preference
);

/*! \brief Convert a string to `Preference`.
 *
 *  \returns std::nullopt if the string is not a known preference.
 */
std::optional<Preference> ToPreference(
    const std::string& preference
);

/*! \brief Objective weighting used to score an edge.
 *
 *  Edge score = timeWeight * travel time (minutes)
 *             + costWeight * base cost (baht)
 *             + transferPenalty, if the edge is a transfer.
 */
struct Objective {
    double timeWeight {1.0};
    double costWeight {0.0};
    double transferPenalty {1.0};

    /*! \brief Score for traversing an edge.
     */
    double GetEdgeScore(
        unsigned int travelTime,
        Money baseCost,
        EdgeKind kind
    ) const;
};

/*! \brief Fixed weighting for each preference.
 *
 *  - Fastest: travel time, plus a 1-minute penalty for each transfer so that
 *    equally fast itineraries do not zig-zag between lines.
 *  - Cheapest: base cost only.
 *  - Fewest transfers: a transfer penalty large enough that the number of
 *    transfers always comes first.
 */
Objective GetObjective(
    Preference preference
);

/*! \brief Bounds on the work done by a single search, and on the itineraries
 *         it may return.
 *
 *  `maxTransfers` and `maxWalkingTime` (minutes walked on transfer links, in
 *  total) are hard constraints: An itinerary that exceeds either is never
 *  returned. Unset means unbounded.
 */
struct SearchLimits {
    size_t maxFrontierPops {100000};
    std::optional<unsigned int> maxTransfers {};
    std::optional<unsigned int> maxWalkingTime {};
};

/*! \brief Ranking of itineraries.
 *
 *  Lower score first. Equal scores are ordered by fewer transfers, then lower
 *  total distance, then by the sequence of traversed station IDs. Scores and
 *  distances that differ by less than 1e-6 are equal.
 */
struct ItineraryCmp {
    bool operator()(
        const Itinerary& a,
        const Itinerary& b
    ) const;
};

/*! \brief Find the itinerary with the lowest score between two stations.
 *
 *  The search is deterministic: The same view, stations, and objective always
 *  give the same itinerary.
 *
 *  A transfer is either a walk on a transfer link, or a station where the
 *  itinerary rides on with a different line. Both count towards
 *  `Itinerary::transfers` and pay the objective's transfer penalty.
 *
 *  \throws StationNotFoundError      if either station is not in the network.
 *  \throws InvalidRequestError       if origin and destination are the same.
 *  \throws NoPathError               if the destination cannot be reached
 *                                    within the transfer and walking limits.
 *  \throws SearchBudgetExceededError if the search pops more than
 *                                    `limits.maxFrontierPops` stations from
 *                                    its frontier.
 */
Itinerary FindBest(
    const NetworkView& view,
    const Id& originStationId,
    const Id& destinationStationId,
    const Objective& objective,
    const SearchLimits& limits = {}
);

} // namespace RailPlanner

#endif // RAIL_PLANNER_ROUTE_FINDER_H
