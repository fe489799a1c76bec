#ifndef RAIL_PLANNER_NETWORK_H
#define RAIL_PLANNER_NETWORK_H

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace RailPlanner {

/*! \brief A station, line, or company ID.
 */
using Id = std::string;

/*! \brief A monetary amount, in baht.
 */
using Money = double;

/*! \brief Index of a station inside a snapshot.
 */
using StationIndex = size_t;

/*! \brief Index of an edge inside a snapshot.
 *
 *  Edge indices are assigned in build order and are stable for the lifetime
 *  of the snapshot.
 */
using EdgeIndex = size_t;

/*! \brief Train operating company.
 */
struct Company {
    Id id {};
    std::string name {};
};

/*! \brief Network station
 *
 *  A Station struct is well formed if:
 *  - `id` is unique across all stations in the network.
 *  - `zone` is at least 1.
 *  - `lineId`, if not empty, is the ID of a line in the network.
 *
 *  The same physical interchange is usually represented by one station per
 *  line, connected by a transfer link.
 */
struct Station {
    Id id {};
    std::string name {};
    double latitude {0.0};
    double longitude {0.0};
    unsigned int zone {1};
    bool isInterchange {false};
    Id lineId {};

    /*! \brief Station comparison
     *
     *  Two stations are "equal" if they have the same ID.
     */
    bool operator==(const Station& other) const;
};

/*! \brief Operating status of a line.
 *
 *  Only active lines contribute edges to the network.
 */
enum class LineStatus {
    kActive,
    kMaintenance,
    kInactive,
};

/*! \brief Print operator for the `LineStatus` class.
 */
std::ostream& operator<<(
    std::ostream& os,
    const LineStatus& status
);

/*! \brief Convert `LineStatus` to string.
 */
std::string ToString(
    const LineStatus& status
);

/*! \brief Convert a string to `LineStatus`.
 *
 *  \returns std::nullopt if the string is not a known line status.
 */
std::optional<LineStatus> ToLineStatus(
    const std::string& status
);

/*! \brief Connection between two consecutive stops of a line.
 *
 *  A `distanceKm` of 0 means that the distance is derived from the station
 *  coordinates.
 */
struct Hop {
    unsigned int travelTime {0};
    Money baseCost {0.0};
    double distanceKm {0.0};
};

/*! \brief Network line
 *
 *  A line serves an ordered sequence of stations. Trains run in both
 *  directions.
 *
 *  A Line struct is well formed if:
 *  - `id` is unique across all lines in the network.
 *  - Every station in `stops` exists and appears only once.
 *  - If the line is active, `stops` has at least 2 stops and `hops` has
 *    exactly one item for each pair of consecutive stops.
 */
struct Line {
    Id id {};
    Id companyId {};
    std::string name {};
    std::string color {};
    LineStatus status {LineStatus::kActive};
    std::vector<Id> stops {};
    std::vector<Hop> hops {};

    /*! \brief Line comparison
     *
     *  Two lines are "equal" if they have the same ID.
     */
    bool operator==(const Line& other) const;
};

/*! \brief Walk-only connection between two interchange stations.
 *
 *  A transfer link is bidirectional: It becomes two directed edges with the
 *  same walking time, distance, and fee.
 */
struct TransferLink {
    Id stationAId {};
    Id stationBId {};
    unsigned int walkingTime {5};
    unsigned int walkingDistanceMeters {0};
    Money transferFee {0.0};
    bool isActive {true};
};

/*! \brief Kind of a network edge.
 */
enum class EdgeKind {
    kRide,
    kTransfer,
};

/*! \brief Print operator for the `EdgeKind` class.
 */
std::ostream& operator<<(
    std::ostream& os,
    const EdgeKind& kind
);

/*! \brief Convert `EdgeKind` to string.
 */
std::string ToString(
    const EdgeKind& kind
);

/*! \brief Convert a string to `EdgeKind`.
 *
 *  \returns std::nullopt if the string is not a known edge kind.
 */
std::optional<EdgeKind> ToEdgeKind(
    const std::string& kind
);

/*! \brief Directed network edge.
 *
 *  For a transfer edge, `lineId` is empty and `baseCost` is the transfer fee.
 */
struct Edge {
    StationIndex from {0};
    StationIndex to {0};
    EdgeKind kind {EdgeKind::kRide};
    Id lineId {};
    unsigned int travelTime {0};
    double distanceKm {0.0};
    Money baseCost {0.0};
};

/*! \brief Great-circle distance between two stations, in km.
 */
double GetDistanceKm(
    const Station& stationA,
    const Station& stationB
);

/*! \brief Immutable routable network.
 *
 *  A snapshot is created once by `Build` and is never modified afterwards.
 *  It is safe to read the same snapshot from multiple threads.
 */
class NetworkSnapshot {
public:
    /*! \brief Build a network snapshot from its topology.
     *
     *  \param companies Optional list of companies. If not empty, every line
     *                   must reference one of these companies.
     *
     *  \throws IntegrityError if the topology is not internally consistent:
     *                         duplicate IDs, references to unknown stations,
     *                         active lines with fewer than 2 stops, hops not
     *                         matching the stops, negative costs.
     */
    static NetworkSnapshot Build(
        const std::vector<Station>& stations,
        const std::vector<Line>& lines,
        const std::vector<TransferLink>& transferLinks,
        const std::vector<Company>& companies = {}
    );

    /*! \brief Find the index of a station.
     *
     *  \returns std::nullopt if the station is not in the network.
     */
    std::optional<StationIndex> FindStation(
        const Id& stationId
    ) const;

    /*! \brief Get a station by index.
     */
    const Station& GetStation(
        StationIndex station
    ) const;

    /*! \brief Number of stations in the network.
     */
    size_t GetStationCount() const;

    /*! \brief Find a line by ID.
     *
     *  \returns nullptr if the line is not in the network.
     */
    const Line* FindLine(
        const Id& lineId
    ) const;

    /*! \brief All the lines in the network, in build order.
     */
    const std::vector<Line>& GetLines() const;

    /*! \brief Find a company by ID.
     *
     *  \returns nullptr if the company is not in the network.
     */
    const Company* FindCompany(
        const Id& companyId
    ) const;

    /*! \brief Get an edge by index.
     */
    const Edge& GetEdge(
        EdgeIndex edge
    ) const;

    /*! \brief Number of edges in the network.
     */
    size_t GetEdgeCount() const;

    /*! \brief Edges leaving a station.
     */
    const std::vector<EdgeIndex>& GetOutgoingEdges(
        StationIndex station
    ) const;

    /*! \brief All the edges that connect station A to station B directly.
     */
    std::vector<EdgeIndex> FindEdges(
        StationIndex stationA,
        StationIndex stationB
    ) const;

private:
    NetworkSnapshot() = default;

    // Graph node
    // We use this as the internal station representation.
    struct GraphNode {
        Station station {};
        std::vector<EdgeIndex> edges {};
    };

    std::vector<GraphNode> nodes_ {};
    std::vector<Edge> edges_ {};
    std::vector<Line> lines_ {};
    std::vector<Company> companies_ {};

    // Map stations, lines, and companies by ID.
    std::unordered_map<Id, StationIndex> stationIndices_ {};
    std::unordered_map<Id, size_t> lineIndices_ {};
    std::unordered_map<Id, size_t> companyIndices_ {};

    void AddStation(
        const Station& station
    );

    void AddLine(
        const Line& line
    );

    void AddTransferLink(
        const TransferLink& link
    );

    void AddEdge(
        Edge&& edge
    );
};

/*! \brief Pair of adjacent stations.
 */
struct StationPair {
    Id stationAId {};
    Id stationBId {};
};

/*! \brief Extra travel time on the connection between two stations.
 */
struct SegmentDelay {
    Id stationAId {};
    Id stationBId {};
    unsigned int delayMinutes {0};
};

/*! \brief Real-time service information for a single planning call.
 *
 *  Closures and delays between a pair of stations apply to both directions of
 *  travel, and to all the edges connecting the two stations.
 */
struct ServiceOverlay {
    std::vector<StationPair> closedSegments {};
    std::vector<Id> closedLines {};
    std::vector<Id> closedStations {};
    std::vector<SegmentDelay> delays {};

    /*! \brief Whether the overlay changes nothing.
     */
    bool Empty() const;
};

/*! \brief Filtered and weight-adjusted view over a network snapshot.
 *
 *  The view does not own the snapshot: The snapshot must outlive the view.
 *  Creating or changing a view never modifies the snapshot.
 */
class NetworkView {
public:
    /*! \brief View of the whole snapshot, with no closures and no delays.
     */
    explicit NetworkView(
        const NetworkSnapshot& snapshot
    );

    /*! \brief View of the snapshot with a real-time overlay applied.
     *
     *  \throws StationNotFoundError if the overlay references an unknown
     *                               station.
     *  \throws InvalidRequestError  if the overlay references an unknown line
     *                               or a pair of stations that are not
     *                               directly connected.
     */
    NetworkView(
        const NetworkSnapshot& snapshot,
        const ServiceOverlay& overlay
    );

    /*! \brief The underlying snapshot.
     */
    const NetworkSnapshot& GetSnapshot() const;

    /*! \brief Whether an edge can be traversed in this view.
     */
    bool IsOpen(
        EdgeIndex edge
    ) const;

    /*! \brief Travel time of an edge, including any delay.
     */
    unsigned int GetTravelTime(
        EdgeIndex edge
    ) const;

    /*! \brief Get a copy of this view with some more edges closed.
     */
    NetworkView Excluding(
        const std::vector<EdgeIndex>& edges
    ) const;

private:
    const NetworkSnapshot* snapshot_ {nullptr};
    std::vector<bool> closed_ {};
    std::vector<unsigned int> delays_ {};

    // Get the edges between two stations of the overlay.
    std::vector<EdgeIndex> GetOverlayEdges(
        const Id& stationAId,
        const Id& stationBId
    ) const;
};

} // namespace RailPlanner

#endif // RAIL_PLANNER_NETWORK_H
