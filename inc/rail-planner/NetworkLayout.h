#ifndef RAIL_PLANNER_NETWORK_LAYOUT_H
#define RAIL_PLANNER_NETWORK_LAYOUT_H

#include <rail-planner/FareTable.h>
#include <rail-planner/Network.h>

#include <nlohmann/json.hpp>

#include <vector>

namespace RailPlanner {

/*! \brief Static topology and fare data of a rail network.
 *
 *  This is the input to `RoutePlanner::Rebuild`. It is usually loaded from a
 *  network layout JSON file with `ParseNetworkData`.
 */
struct NetworkData {
    std::vector<Company> companies {};
    std::vector<Station> stations {};
    std::vector<Line> lines {};
    std::vector<TransferLink> transferLinks {};
    std::vector<LineFareRule> fareRules {};
    std::vector<PassengerType> passengerTypes {};
    std::vector<GroupDiscountBracket> groupDiscounts {};
};

/*! \brief Parse a network layout JSON document.
 *
 *  The document is an object with the arrays `companies`, `stations`,
 *  `lines`, `transfer_links`, `fare_rules`, `passenger_types` and
 *  `group_discounts`. Only `stations` and `lines` are required.
 *
 *  Parsing does not check the consistency of the data. That happens when the
 *  network is built.
 *
 *  \throws IntegrityError if the document does not have the expected shape,
 *                         or names an unknown status, pricing or passenger
 *                         category.
 */
NetworkData ParseNetworkData(
    const nlohmann::json& src
);

/*! \brief Parse a service overlay JSON document.
 *
 *  The document is an object with the optional arrays `closed_segments`,
 *  `closed_lines`, `closed_stations` and `delays`.
 *
 *  \throws InvalidRequestError if the document does not have the expected
 *                              shape.
 */
ServiceOverlay ParseServiceOverlay(
    const nlohmann::json& src
);

void from_json(const nlohmann::json& src, Company& dst);
void from_json(const nlohmann::json& src, Station& dst);
void from_json(const nlohmann::json& src, Hop& dst);
void from_json(const nlohmann::json& src, Line& dst);
void from_json(const nlohmann::json& src, TransferLink& dst);
void from_json(const nlohmann::json& src, ZoneFare& dst);
void from_json(const nlohmann::json& src, LineFareRule& dst);
void from_json(const nlohmann::json& src, PassengerType& dst);
void from_json(const nlohmann::json& src, GroupDiscountBracket& dst);
void from_json(const nlohmann::json& src, NetworkData& dst);
void from_json(const nlohmann::json& src, StationPair& dst);
void from_json(const nlohmann::json& src, SegmentDelay& dst);
void from_json(const nlohmann::json& src, ServiceOverlay& dst);

} // namespace RailPlanner

#endif // RAIL_PLANNER_NETWORK_LAYOUT_H
