#include <rail-planner/Errors.h>
#include <rail-planner/Network.h>

#include <boost/bimap.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

using RailPlanner::Edge;
using RailPlanner::EdgeIndex;
using RailPlanner::EdgeKind;
using RailPlanner::Id;
using RailPlanner::IntegrityError;
using RailPlanner::InvalidRequestError;
using RailPlanner::Line;
using RailPlanner::LineStatus;
using RailPlanner::NetworkSnapshot;
using RailPlanner::NetworkView;
using RailPlanner::ServiceOverlay;
using RailPlanner::Station;
using RailPlanner::StationIndex;
using RailPlanner::StationNotFoundError;
using RailPlanner::TransferLink;

// Utility function to generate a boost::bimap.
template <typename L, typename R>
static boost::bimap<L, R> MakeBimap(
    std::initializer_list<typename boost::bimap<L, R>::value_type> list
)
{
    return boost::bimap<L, R>(list.begin(), list.end());
}

// Station — Public methods

bool Station::operator==(const Station& other) const
{
    return id == other.id;
}

// Line — Public methods

bool Line::operator==(const Line& other) const
{
    return id == other.id;
}

// LineStatus

static const auto gLineStatusStrings {
    MakeBimap<LineStatus, std::string_view>({
        {LineStatus::kActive     , "active"     },
        {LineStatus::kMaintenance, "maintenance"},
        {LineStatus::kInactive   , "inactive"   },
    })
};

std::ostream& RailPlanner::operator<<(
    std::ostream& os,
    const LineStatus& status
)
{
    return os << ToString(status);
}

std::string RailPlanner::ToString(
    const LineStatus& status
)
{
    auto statusIt {gLineStatusStrings.left.find(status)};
    if (statusIt == gLineStatusStrings.left.end()) {
        return "LineStatus::kInvalid";
    }
    return std::string(statusIt->second);
}

std::optional<LineStatus> RailPlanner::ToLineStatus(
    const std::string& status
)
{
    auto statusIt {gLineStatusStrings.right.find(status)};
    if (statusIt == gLineStatusStrings.right.end()) {
        return std::nullopt;
    }
    return statusIt->second;
}

// EdgeKind

static const auto gEdgeKindStrings {
    MakeBimap<EdgeKind, std::string_view>({
        {EdgeKind::kRide    , "ride"    },
        {EdgeKind::kTransfer, "transfer"},
    })
};

std::ostream& RailPlanner::operator<<(
    std::ostream& os,
    const EdgeKind& kind
)
{
    return os << ToString(kind);
}

std::string RailPlanner::ToString(
    const EdgeKind& kind
)
{
    auto kindIt {gEdgeKindStrings.left.find(kind)};
    if (kindIt == gEdgeKindStrings.left.end()) {
        return "EdgeKind::kInvalid";
    }
    return std::string(kindIt->second);
}

std::optional<EdgeKind> RailPlanner::ToEdgeKind(
    const std::string& kind
)
{
    auto kindIt {gEdgeKindStrings.right.find(kind)};
    if (kindIt == gEdgeKindStrings.right.end()) {
        return std::nullopt;
    }
    return kindIt->second;
}

// Free functions

double RailPlanner::GetDistanceKm(
    const Station& stationA,
    const Station& stationB
)
{
    // Haversine formula.
    static constexpr double kEarthRadiusKm {6371.0};
    static constexpr double kPi {3.14159265358979323846};
    auto toRadians {[](double degrees) {
        return degrees * kPi / 180.0;
    }};
    const auto dLat {toRadians(stationB.latitude - stationA.latitude)};
    const auto dLon {toRadians(stationB.longitude - stationA.longitude)};
    const auto a {
        std::sin(dLat / 2) * std::sin(dLat / 2) +
        std::cos(toRadians(stationA.latitude)) *
        std::cos(toRadians(stationB.latitude)) *
        std::sin(dLon / 2) * std::sin(dLon / 2)
    };
    const auto c {2 * std::atan2(std::sqrt(a), std::sqrt(1 - a))};
    return kEarthRadiusKm * c;
}

// NetworkSnapshot — Public methods

NetworkSnapshot NetworkSnapshot::Build(
    const std::vector<Station>& stations,
    const std::vector<Line>& lines,
    const std::vector<TransferLink>& transferLinks,
    const std::vector<Company>& companies
)
{
    NetworkSnapshot snapshot {};

    // First, add the companies, so that lines can reference them.
    snapshot.companies_.reserve(companies.size());
    for (const auto& company: companies) {
        if (snapshot.companyIndices_.count(company.id) > 0) {
            throw IntegrityError("Duplicate company " + company.id);
        }
        snapshot.companyIndices_.emplace(
            company.id,
            snapshot.companies_.size()
        );
        snapshot.companies_.push_back(company);
    }

    // Then, add all the stations.
    snapshot.nodes_.reserve(stations.size());
    for (const auto& station: stations) {
        snapshot.AddStation(station);
    }

    // Then, add the lines, with one edge in each direction for every hop.
    snapshot.lines_.reserve(lines.size());
    for (const auto& line: lines) {
        snapshot.AddLine(line);
    }

    // A station can only be owned by a line that exists.
    for (const auto& node: snapshot.nodes_) {
        const auto& lineId {node.station.lineId};
        if (!lineId.empty() && snapshot.FindLine(lineId) == nullptr) {
            throw IntegrityError("Station " + node.station.id +
                                 " references unknown line " + lineId);
        }
    }

    // Finally, add the transfer links.
    for (const auto& link: transferLinks) {
        snapshot.AddTransferLink(link);
    }

    spdlog::info("NetworkSnapshot: Built {} stations, {} lines, {} edges",
                 snapshot.nodes_.size(), snapshot.lines_.size(),
                 snapshot.edges_.size());
    return snapshot;
}

std::optional<StationIndex> NetworkSnapshot::FindStation(
    const Id& stationId
) const
{
    auto stationIt {stationIndices_.find(stationId)};
    if (stationIt == stationIndices_.end()) {
        return std::nullopt;
    }
    return stationIt->second;
}

const Station& NetworkSnapshot::GetStation(
    StationIndex station
) const
{
    return nodes_.at(station).station;
}

size_t NetworkSnapshot::GetStationCount() const
{
    return nodes_.size();
}

const Line* NetworkSnapshot::FindLine(
    const Id& lineId
) const
{
    auto lineIt {lineIndices_.find(lineId)};
    if (lineIt == lineIndices_.end()) {
        return nullptr;
    }
    return &lines_[lineIt->second];
}

const std::vector<Line>& NetworkSnapshot::GetLines() const
{
    return lines_;
}

const RailPlanner::Company* NetworkSnapshot::FindCompany(
    const Id& companyId
) const
{
    auto companyIt {companyIndices_.find(companyId)};
    if (companyIt == companyIndices_.end()) {
        return nullptr;
    }
    return &companies_[companyIt->second];
}

const Edge& NetworkSnapshot::GetEdge(
    EdgeIndex edge
) const
{
    return edges_.at(edge);
}

size_t NetworkSnapshot::GetEdgeCount() const
{
    return edges_.size();
}

const std::vector<EdgeIndex>& NetworkSnapshot::GetOutgoingEdges(
    StationIndex station
) const
{
    return nodes_.at(station).edges;
}

std::vector<EdgeIndex> NetworkSnapshot::FindEdges(
    StationIndex stationA,
    StationIndex stationB
) const
{
    std::vector<EdgeIndex> edges {};
    for (const auto& edgeIdx: GetOutgoingEdges(stationA)) {
        if (edges_[edgeIdx].to == stationB) {
            edges.push_back(edgeIdx);
        }
    }
    return edges;
}

// NetworkSnapshot — Private methods

void NetworkSnapshot::AddStation(
    const Station& station
)
{
    // Cannot add a station that is already in the network.
    if (FindStation(station.id) != std::nullopt) {
        throw IntegrityError("Duplicate station " + station.id);
    }
    if (station.zone == 0) {
        throw IntegrityError("Station " + station.id + " has no zone");
    }
    stationIndices_.emplace(station.id, nodes_.size());
    nodes_.push_back(GraphNode {
        station,
        {} // We start with no edges.
    });
}

void NetworkSnapshot::AddLine(
    const Line& line
)
{
    // Cannot add a line that is already in the network.
    if (FindLine(line.id) != nullptr) {
        throw IntegrityError("Duplicate line " + line.id);
    }
    if (!companies_.empty() && FindCompany(line.companyId) == nullptr) {
        throw IntegrityError("Line " + line.id +
                             " references unknown company " + line.companyId);
    }

    // We first gather the list of stations.
    // All stations must already be in the network, and appear only once.
    std::vector<StationIndex> stops {};
    stops.reserve(line.stops.size());
    std::unordered_set<StationIndex> seenStops {};
    for (const auto& stopId: line.stops) {
        const auto station {FindStation(stopId)};
        if (station == std::nullopt) {
            throw IntegrityError("Line " + line.id +
                                 " references unknown station " + stopId);
        }
        if (!seenStops.insert(*station).second) {
            throw IntegrityError("Line " + line.id +
                                 " serves station " + stopId + " twice");
        }
        stops.push_back(*station);
    }

    lineIndices_.emplace(line.id, lines_.size());
    lines_.push_back(line);

    // Lines that are not running do not contribute to the graph.
    if (line.status != LineStatus::kActive) {
        spdlog::info("NetworkSnapshot: Line {} is {}. Skipping its edges",
                     line.id, ToString(line.status));
        return;
    }
    if (stops.size() < 2) {
        throw IntegrityError("Active line " + line.id +
                             " has fewer than 2 stations");
    }
    if (line.hops.size() != stops.size() - 1) {
        throw IntegrityError("Line " + line.id + " has " +
                             std::to_string(line.hops.size()) + " hops for " +
                             std::to_string(stops.size()) + " stops");
    }

    // Walk the station nodes to add an edge for each direction of travel.
    for (size_t idx {0}; idx < stops.size() - 1; ++idx) {
        const auto& hop {line.hops[idx]};
        if (hop.baseCost < 0.0 || hop.distanceKm < 0.0) {
            throw IntegrityError("Line " + line.id +
                                 " has a negative cost or distance");
        }
        const auto& thisStop {stops[idx]};
        const auto& nextStop {stops[idx + 1]};
        const auto distanceKm {hop.distanceKm > 0.0 ? hop.distanceKm :
            GetDistanceKm(nodes_[thisStop].station, nodes_[nextStop].station)
        };
        AddEdge(Edge {
            thisStop,
            nextStop,
            EdgeKind::kRide,
            line.id,
            hop.travelTime,
            distanceKm,
            hop.baseCost,
        });
        AddEdge(Edge {
            nextStop,
            thisStop,
            EdgeKind::kRide,
            line.id,
            hop.travelTime,
            distanceKm,
            hop.baseCost,
        });
    }
}

void NetworkSnapshot::AddTransferLink(
    const TransferLink& link
)
{
    const auto stationA {FindStation(link.stationAId)};
    const auto stationB {FindStation(link.stationBId)};
    if (stationA == std::nullopt || stationB == std::nullopt) {
        throw IntegrityError("Transfer link " + link.stationAId + " <-> " +
                             link.stationBId +
                             " references an unknown station");
    }
    if (*stationA == *stationB) {
        throw IntegrityError("Transfer link from station " + link.stationAId +
                             " to itself");
    }
    if (link.transferFee < 0.0) {
        throw IntegrityError("Transfer link " + link.stationAId + " <-> " +
                             link.stationBId + " has a negative fee");
    }
    if (!link.isActive) {
        return;
    }

    // The two directions share the same weight and fee.
    const auto distanceKm {link.walkingDistanceMeters / 1000.0};
    AddEdge(Edge {
        *stationA,
        *stationB,
        EdgeKind::kTransfer,
        {},
        link.walkingTime,
        distanceKm,
        link.transferFee,
    });
    AddEdge(Edge {
        *stationB,
        *stationA,
        EdgeKind::kTransfer,
        {},
        link.walkingTime,
        distanceKm,
        link.transferFee,
    });
}

void NetworkSnapshot::AddEdge(
    Edge&& edge
)
{
    nodes_[edge.from].edges.push_back(edges_.size());
    edges_.emplace_back(std::move(edge));
}

// ServiceOverlay — Public methods

bool ServiceOverlay::Empty() const
{
    return closedSegments.empty() && closedLines.empty() &&
        closedStations.empty() && delays.empty();
}

// NetworkView — Public methods

NetworkView::NetworkView(
    const NetworkSnapshot& snapshot
) : snapshot_ {&snapshot},
    closed_(snapshot.GetEdgeCount(), false),
    delays_(snapshot.GetEdgeCount(), 0)
{
}

NetworkView::NetworkView(
    const NetworkSnapshot& snapshot,
    const ServiceOverlay& overlay
) : NetworkView(snapshot)
{
    for (const auto& lineId: overlay.closedLines) {
        if (snapshot.FindLine(lineId) == nullptr) {
            throw InvalidRequestError("Cannot close unknown line " + lineId);
        }
        for (EdgeIndex edgeIdx {0}; edgeIdx < closed_.size(); ++edgeIdx) {
            if (snapshot.GetEdge(edgeIdx).lineId == lineId) {
                closed_[edgeIdx] = true;
            }
        }
    }
    for (const auto& stationId: overlay.closedStations) {
        const auto station {snapshot.FindStation(stationId)};
        if (station == std::nullopt) {
            throw StationNotFoundError("Cannot close unknown station " +
                                       stationId);
        }
        for (EdgeIndex edgeIdx {0}; edgeIdx < closed_.size(); ++edgeIdx) {
            const auto& edge {snapshot.GetEdge(edgeIdx)};
            if (edge.from == *station || edge.to == *station) {
                closed_[edgeIdx] = true;
            }
        }
    }
    for (const auto& segment: overlay.closedSegments) {
        for (const auto& edgeIdx: GetOverlayEdges(
            segment.stationAId,
            segment.stationBId
        )) {
            closed_[edgeIdx] = true;
        }
    }
    for (const auto& delay: overlay.delays) {
        for (const auto& edgeIdx: GetOverlayEdges(
            delay.stationAId,
            delay.stationBId
        )) {
            delays_[edgeIdx] += delay.delayMinutes;
        }
    }
    if (!overlay.Empty()) {
        spdlog::debug("NetworkView: Overlay closes {} of {} edges",
                      std::count(closed_.begin(), closed_.end(), true),
                      closed_.size());
    }
}

const NetworkSnapshot& NetworkView::GetSnapshot() const
{
    return *snapshot_;
}

bool NetworkView::IsOpen(
    EdgeIndex edge
) const
{
    return !closed_.at(edge);
}

unsigned int NetworkView::GetTravelTime(
    EdgeIndex edge
) const
{
    return snapshot_->GetEdge(edge).travelTime + delays_.at(edge);
}

NetworkView NetworkView::Excluding(
    const std::vector<EdgeIndex>& edges
) const
{
    NetworkView view {*this};
    for (const auto& edgeIdx: edges) {
        view.closed_.at(edgeIdx) = true;
    }
    return view;
}

// NetworkView — Private methods

std::vector<EdgeIndex> NetworkView::GetOverlayEdges(
    const Id& stationAId,
    const Id& stationBId
) const
{
    const auto stationA {snapshot_->FindStation(stationAId)};
    const auto stationB {snapshot_->FindStation(stationBId)};
    if (stationA == std::nullopt) {
        throw StationNotFoundError("Overlay references unknown station " +
                                   stationAId);
    }
    if (stationB == std::nullopt) {
        throw StationNotFoundError("Overlay references unknown station " +
                                   stationBId);
    }

    // Both directions of travel.
    auto edges {snapshot_->FindEdges(*stationA, *stationB)};
    const auto reverseEdges {snapshot_->FindEdges(*stationB, *stationA)};
    edges.insert(edges.end(), reverseEdges.begin(), reverseEdges.end());
    if (edges.empty()) {
        throw InvalidRequestError("Stations " + stationAId + " and " +
                                  stationBId + " are not directly connected");
    }
    return edges;
}
