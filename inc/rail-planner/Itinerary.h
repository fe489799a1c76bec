#ifndef RAIL_PLANNER_ITINERARY_H
#define RAIL_PLANNER_ITINERARY_H

#include <rail-planner/Network.h>

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace RailPlanner {

/*! \brief One traversed edge of an itinerary: a ride or a transfer.
 *
 *  `edge` identifies the edge inside the snapshot the itinerary was planned
 *  on. It is not serialized.
 */
struct Segment {
    EdgeKind kind {EdgeKind::kRide};
    Id fromStationId {};
    Id toStationId {};
    Id lineId {};
    unsigned int travelTime {0};
    double distanceKm {0.0};
    Money baseCost {0.0};
    std::string instructions {};
    EdgeIndex edge {0};

    /*! \brief Segment comparison
     *
     *  Two segments are "equal" if they connect the same stations in the same
     *  way, with the same weights.
     */
    bool operator==(const Segment& other) const;
};

/*! \brief Journey from an origin to a destination station.
 *
 *  An Itinerary struct is well formed if:
 *  - `segments` is not empty.
 *  - The first segment departs from `originStationId`.
 *  - The last segment arrives at `destinationStationId`.
 *  - Each segment departs from the station where the previous one arrives.
 *  - `transfers` is the number of transfer segments, plus the number of
 *    stations where two consecutive rides are on different lines.
 */
struct Itinerary {
    Id originStationId {};
    Id destinationStationId {};
    std::vector<Segment> segments {};
    unsigned int totalTravelTime {0};
    double totalDistanceKm {0.0};
    unsigned int transfers {0};
    Money baseCost {0.0};
    double score {0.0};
    std::vector<Id> linesUsed {};

    /*! \brief The snapshot edges traversed by this itinerary, in order.
     */
    std::vector<EdgeIndex> GetEdges() const;

    /*! \brief Check that the segments form a chain from origin to destination.
     */
    bool IsContiguous() const;

    /*! \brief Itinerary comparison
     */
    bool operator==(const Itinerary& other) const;
};

/*! \brief Print operator for the `Itinerary` class.
 */
std::ostream& operator<<(
    std::ostream& os,
    const Itinerary& itinerary
);

void to_json(
    nlohmann::json& dst,
    const Segment& src
);

void from_json(
    const nlohmann::json& src,
    Segment& dst
);

void to_json(
    nlohmann::json& dst,
    const Itinerary& src
);

void from_json(
    const nlohmann::json& src,
    Itinerary& dst
);

} // namespace RailPlanner

#endif // RAIL_PLANNER_ITINERARY_H
