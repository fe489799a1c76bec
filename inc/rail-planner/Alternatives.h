#ifndef RAIL_PLANNER_ALTERNATIVES_H
#define RAIL_PLANNER_ALTERNATIVES_H

#include <rail-planner/Itinerary.h>
#include <rail-planner/Network.h>
#include <rail-planner/RouteFinder.h>

#include <cstddef>
#include <vector>

namespace RailPlanner {

/*! \brief Smallest number of edges by which two alternatives must differ.
 *
 *  The difference is the size of the symmetric difference of the two edge
 *  sets.
 */
constexpr size_t kMinDistinctEdges {1};

/*! \brief Smallest and largest number of alternatives one call may return.
 */
constexpr size_t kMinAlternatives {3};
constexpr size_t kMaxAlternatives {5};

/*! \brief Find up to `maxResults` distinct itineraries between two stations.
 *
 *  The first itinerary is the one returned by `FindBest`. The others are
 *  found by excluding the edges of already accepted itineraries, one at a
 *  time, and searching again. Results are sorted with `ItineraryCmp`.
 *
 *  Fewer than `maxResults` itineraries is not an error: The network may not
 *  have that many distinct paths.
 *
 *  \throws InvalidRequestError       if maxResults is not within
 *                                    [kMinAlternatives, kMaxAlternatives].
 *  \throws NoPathError               if there is no path at all.
 *  \throws StationNotFoundError      if either station is not in the network.
 *  \throws SearchBudgetExceededError if any single search exceeds the limits.
 */
std::vector<Itinerary> FindAlternatives(
    const NetworkView& view,
    const Id& originStationId,
    const Id& destinationStationId,
    const Objective& objective,
    size_t maxResults,
    const SearchLimits& limits = {}
);

/*! \brief Number of edges in one itinerary and not the other.
 */
size_t GetEdgeDifference(
    const Itinerary& a,
    const Itinerary& b
);

} // namespace RailPlanner

#endif // RAIL_PLANNER_ALTERNATIVES_H
