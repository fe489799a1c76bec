#include <rail-planner/Errors.h>
#include <rail-planner/Itinerary.h>
#include <rail-planner/Network.h>
#include <rail-planner/RouteFinder.h>

#include <boost/bimap.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <map>
#include <optional>
#include <ostream>
#include <queue>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

using RailPlanner::EdgeIndex;
using RailPlanner::EdgeKind;
using RailPlanner::Id;
using RailPlanner::Itinerary;
using RailPlanner::ItineraryCmp;
using RailPlanner::InvalidRequestError;
using RailPlanner::Money;
using RailPlanner::NetworkSnapshot;
using RailPlanner::NetworkView;
using RailPlanner::NoPathError;
using RailPlanner::Objective;
using RailPlanner::Preference;
using RailPlanner::SearchBudgetExceededError;
using RailPlanner::SearchLimits;
using RailPlanner::Segment;
using RailPlanner::StationIndex;
using RailPlanner::StationNotFoundError;

// Utility function to generate a boost::bimap.
template <typename L, typename R>
static boost::bimap<L, R> MakeBimap(
    std::initializer_list<typename boost::bimap<L, R>::value_type> list
)
{
    return boost::bimap<L, R>(list.begin(), list.end());
}

// Scores and distances are sums of doubles. Two sums that only differ by
// rounding errors compare equal.
static long long QuantizeSum(
    double value
)
{
    constexpr double kResolution {1e-6};
    return std::llround(value / kResolution);
}

// Preference

static const auto gPreferenceStrings {
    MakeBimap<Preference, std::string_view>({
        {Preference::kFastest        , "fastest"         },
        {Preference::kCheapest       , "cheapest"        },
        {Preference::kFewestTransfers, "fewest-transfers"},
    })
};

std::ostream& RailPlanner::operator<<(
    std::ostream& os,
    const Preference& preference
)
{
    return os << ToString(preference);
}

std::string RailPlanner::ToString(
    const Preference& preference
)
{
    auto preferenceIt {gPreferenceStrings.left.find(preference)};
    if (preferenceIt == gPreferenceStrings.left.end()) {
        return "Preference::kInvalid";
    }
    return std::string(preferenceIt->second);
}

std::optional<Preference> RailPlanner::ToPreference(
    const std::string& preference
)
{
    auto preferenceIt {gPreferenceStrings.right.find(preference)};
    if (preferenceIt == gPreferenceStrings.right.end()) {
        return std::nullopt;
    }
    return preferenceIt->second;
}

// Objective — Public methods

double Objective::GetEdgeScore(
    unsigned int travelTime,
    Money baseCost,
    EdgeKind kind
) const
{
    return timeWeight * travelTime +
        costWeight * baseCost +
        (kind == EdgeKind::kTransfer ? transferPenalty : 0.0);
}

// Free functions

Objective RailPlanner::GetObjective(
    Preference preference
)
{
    switch (preference) {
        case Preference::kCheapest:
            return Objective {0.0, 1.0, 0.0};
        case Preference::kFewestTransfers:
            return Objective {0.0, 0.0, 1000.0};
        case Preference::kFastest:
        default:
            return Objective {1.0, 0.0, 1.0};
    }
}

bool ItineraryCmp::operator()(
    const Itinerary& a,
    const Itinerary& b
) const
{
    const auto scoreA {QuantizeSum(a.score)};
    const auto scoreB {QuantizeSum(b.score)};
    if (scoreA != scoreB) {
        return scoreA < scoreB;
    }
    if (a.transfers != b.transfers) {
        return a.transfers < b.transfers;
    }
    const auto distanceA {QuantizeSum(a.totalDistanceKm)};
    const auto distanceB {QuantizeSum(b.totalDistanceKm)};
    if (distanceA != distanceB) {
        return distanceA < distanceB;
    }
    return std::lexicographical_compare(
        a.segments.begin(), a.segments.end(),
        b.segments.begin(), b.segments.end(),
        [](const Segment& segA, const Segment& segB) {
            return std::tie(segA.toStationId, segA.lineId) <
                std::tie(segB.toStationId, segB.lineId);
        }
    );
}

// Dijkstra's algorithm

namespace {

// Accumulated cost of the best known path to a search state.
// Labels are compared lexicographically: score, transfers, distance.
struct Label {
    double score {0.0};
    unsigned int transfers {0};
    double distanceKm {0.0};

    bool operator<(const Label& other) const
    {
        return std::make_tuple(QuantizeSum(score), transfers,
                               QuantizeSum(distanceKm)) <
            std::make_tuple(QuantizeSum(other.score), other.transfers,
                            QuantizeSum(other.distanceKm));
    }

    bool operator==(const Label& other) const
    {
        return QuantizeSum(score) == QuantizeSum(other.score) &&
            transfers == other.transfers &&
            QuantizeSum(distanceKm) == QuantizeSum(other.distanceKm);
    }
};

// A station, and the line we are on when we reach it. The line is empty at
// the origin and after a walk.
// With a transfer or walking limit, the transfers and walking minutes used so
// far are part of the state. A slower path with more slack left is then kept
// next to the faster one.
struct StateKey {
    StationIndex station {0};
    Id lineId {};
    unsigned int transfers {0};
    unsigned int walkingTime {0};

    bool operator<(const StateKey& other) const
    {
        return std::tie(station, lineId, transfers, walkingTime) <
            std::tie(other.station, other.lineId, other.transfers,
                     other.walkingTime);
    }
};

struct SearchState {
    StateKey key {};
    std::optional<Label> label {};
    // The state and edge we came from in the best path.
    std::optional<size_t> previousState {};
    std::optional<EdgeIndex> previousEdge {};
    bool settled {false};
};

struct StateLabel {
    size_t state {0};
    Label label {};
};

// The priority queue keeps the lowest label on top. States with the same
// label are visited in station ID order, then line ID order.
class StateLabelCmp {
public:
    StateLabelCmp(
        const NetworkSnapshot& snapshot,
        const std::vector<SearchState>& states
    ) : snapshot_ {&snapshot},
        states_ {&states}
    {
    }

    bool operator()(const StateLabel& a, const StateLabel& b) const
    {
        if (!(a.label == b.label)) {
            return b.label < a.label;
        }
        const auto& keyA {(*states_)[a.state].key};
        const auto& keyB {(*states_)[b.state].key};
        const auto& idA {snapshot_->GetStation(keyA.station).id};
        const auto& idB {snapshot_->GetStation(keyB.station).id};
        return std::tie(idB, keyB.lineId, keyB.transfers, keyB.walkingTime) <
            std::tie(idA, keyA.lineId, keyA.transfers, keyA.walkingTime);
    }

private:
    const NetworkSnapshot* snapshot_ {nullptr};
    const std::vector<SearchState>* states_ {nullptr};
};

std::string GetInstructions(
    const NetworkSnapshot& snapshot,
    const Segment& segment
)
{
    const auto& from {snapshot.GetStation(*snapshot.FindStation(
        segment.fromStationId
    )).name};
    const auto& to {snapshot.GetStation(*snapshot.FindStation(
        segment.toStationId
    )).name};
    if (segment.kind == EdgeKind::kTransfer) {
        return fmt::format("Walk {} minutes from {} to {}",
                           segment.travelTime, from, to);
    }
    const auto line {snapshot.FindLine(segment.lineId)};
    return fmt::format("Take {} from {} to {}",
                       line != nullptr ? line->name : segment.lineId, from, to);
}

} // namespace

Itinerary RailPlanner::FindBest(
    const NetworkView& view,
    const Id& originStationId,
    const Id& destinationStationId,
    const Objective& objective,
    const SearchLimits& limits
)
{
    const auto& snapshot {view.GetSnapshot()};

    // Find the stations.
    const auto origin {snapshot.FindStation(originStationId)};
    if (origin == std::nullopt) {
        throw StationNotFoundError("Unknown origin station " +
                                   originStationId);
    }
    const auto destination {snapshot.FindStation(destinationStationId)};
    if (destination == std::nullopt) {
        throw StationNotFoundError("Unknown destination station " +
                                   destinationStationId);
    }
    if (*origin == *destination) {
        throw InvalidRequestError("Origin and destination are the same "
                                  "station: " + originStationId);
    }
    spdlog::debug("FindBest: {} -> {}", originStationId, destinationStationId);

    // Supporting data structures for Dijkstra's algorithm.
    // - All the states we have reached so far, and their index.
    std::vector<SearchState> states {};
    std::map<StateKey, size_t> stateIndices {};
    auto getState {[&states, &stateIndices](const StateKey& key) {
        auto stateIt {stateIndices.find(key)};
        if (stateIt != stateIndices.end()) {
            return stateIt->second;
        }
        const auto stateIdx {states.size()};
        stateIndices.emplace(key, stateIdx);
        states.push_back(SearchState {key});
        return stateIdx;
    }};
    const auto originState {getState(StateKey {*origin})};
    states[originState].label = Label {};
    // - The priority queue of states to visit.
    std::priority_queue<
        StateLabel,
        std::vector<StateLabel>,
        StateLabelCmp
    > statesToVisit {StateLabelCmp {snapshot, states}};
    statesToVisit.push({originState, Label {}});

    std::optional<size_t> destinationState {};
    size_t nPops {0};
    while (!statesToVisit.empty()) {
        // Remove the state from the priority queue.
        const auto [currState, currLabel] = statesToVisit.top();
        statesToVisit.pop();
        if (++nPops > limits.maxFrontierPops) {
            spdlog::warn("FindBest: {} -> {}: Search budget of {} exceeded",
                         originStationId, destinationStationId,
                         limits.maxFrontierPops);
            throw SearchBudgetExceededError(
                "More than " + std::to_string(limits.maxFrontierPops) +
                " frontier pops from " + originStationId + " to " +
                destinationStationId
            );
        }
        if (states[currState].settled) {
            // Stale entry: we already found a better path to this state.
            continue;
        }
        states[currState].settled = true;

        // Early exit: the first destination state we settle is the best.
        const auto currKey {states[currState].key};
        if (currKey.station == *destination) {
            destinationState = currState;
            break;
        }

        // Explore the neighborhood.
        for (const auto& edgeIdx: snapshot.GetOutgoingEdges(currKey.station)) {
            if (!view.IsOpen(edgeIdx)) {
                continue;
            }
            const auto& edge {snapshot.GetEdge(edgeIdx)};
            if (edge.to == *origin) {
                // Coming back to the origin never beats starting there.
                continue;
            }
            const auto travelTime {view.GetTravelTime(edgeIdx)};

            // Staying on board while the train changes line is a transfer
            // too, even without a walk.
            const bool isWalk {edge.kind == EdgeKind::kTransfer};
            const bool isLineChange {
                !isWalk &&
                !currKey.lineId.empty() &&
                edge.lineId != currKey.lineId
            };
            const auto transfers {
                currLabel.transfers + (isWalk || isLineChange ? 1u : 0u)
            };
            const auto walkingTime {
                currKey.walkingTime + (isWalk ? travelTime : 0u)
            };
            if (limits.maxTransfers && transfers > *limits.maxTransfers) {
                continue;
            }
            if (limits.maxWalkingTime &&
                    walkingTime > *limits.maxWalkingTime) {
                continue;
            }
            const StateKey neighborKey {
                edge.to,
                isWalk ? Id {} : edge.lineId,
                limits.maxTransfers ? transfers : 0u,
                limits.maxWalkingTime ? walkingTime : 0u,
            };

            // Calculate the label of the neighbor through this edge.
            const Label neighborLabel {
                currLabel.score +
                    objective.GetEdgeScore(travelTime, edge.baseCost,
                                           edge.kind) +
                    (isLineChange ? objective.transferPenalty : 0.0),
                transfers,
                currLabel.distanceKm + edge.distanceKm,
            };

            // Update our records of the best way to get to the neighbor.
            const auto neighborState {getState(neighborKey)};
            auto& neighbor {states[neighborState]};
            if (neighbor.settled) {
                continue;
            }
            if (neighbor.label == std::nullopt ||
                    neighborLabel < *neighbor.label) {
                neighbor.label = neighborLabel;
                neighbor.previousState = currState;
                neighbor.previousEdge = edgeIdx;
                statesToVisit.push({neighborState, neighborLabel});
            } else if (neighborLabel == *neighbor.label) {
                // Equivalent path: prefer the predecessor with the lower
                // station ID, then the lower line ID.
                const auto& knownKey {states[*neighbor.previousState].key};
                const auto& knownId {snapshot.GetStation(knownKey.station).id};
                const auto& currId {snapshot.GetStation(currKey.station).id};
                if (std::tie(currId, currKey.lineId) <
                        std::tie(knownId, knownKey.lineId)) {
                    neighbor.previousState = currState;
                    neighbor.previousEdge = edgeIdx;
                }
            }
        }
    }

    // Check if we found no valid path between origin and destination.
    if (destinationState == std::nullopt) {
        spdlog::info("FindBest: No path {} -> {}",
                     originStationId, destinationStationId);
        throw NoPathError("No path from " + originStationId + " to " +
                          destinationStationId);
    }

    // Assemble the path.
    // Note: We go in reverse order, from the destination to the origin,
    //       because this is how the predecessor records are structured.
    std::vector<EdgeIndex> path {};
    for (auto state {*destinationState}; state != originState;) {
        path.push_back(*states[state].previousEdge);
        state = *states[state].previousState;
    }
    std::reverse(path.begin(), path.end());

    const auto& finalLabel {*states[*destinationState].label};
    Itinerary itinerary {
        originStationId,
        destinationStationId,
        {},
        0,
        finalLabel.distanceKm,
        finalLabel.transfers,
        0.0,
        finalLabel.score,
        {},
    };
    itinerary.segments.reserve(path.size());
    for (const auto& edgeIdx: path) {
        const auto& edge {snapshot.GetEdge(edgeIdx)};
        Segment segment {
            edge.kind,
            snapshot.GetStation(edge.from).id,
            snapshot.GetStation(edge.to).id,
            edge.lineId,
            view.GetTravelTime(edgeIdx),
            edge.distanceKm,
            edge.baseCost,
            {},
            edgeIdx,
        };
        segment.instructions = GetInstructions(snapshot, segment);
        itinerary.totalTravelTime += segment.travelTime;
        itinerary.baseCost += segment.baseCost;
        if (!edge.lineId.empty() &&
            std::find(
                itinerary.linesUsed.begin(),
                itinerary.linesUsed.end(),
                edge.lineId
            ) == itinerary.linesUsed.end()) {
            itinerary.linesUsed.push_back(edge.lineId);
        }
        itinerary.segments.push_back(std::move(segment));
    }
    return itinerary;
}
