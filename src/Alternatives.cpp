#include <rail-planner/Alternatives.h>
#include <rail-planner/Errors.h>
#include <rail-planner/Itinerary.h>
#include <rail-planner/Network.h>
#include <rail-planner/RouteFinder.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <queue>
#include <set>
#include <string>
#include <vector>

using RailPlanner::EdgeIndex;
using RailPlanner::Id;
using RailPlanner::InvalidRequestError;
using RailPlanner::Itinerary;
using RailPlanner::ItineraryCmp;
using RailPlanner::NetworkView;
using RailPlanner::NoPathError;
using RailPlanner::Objective;
using RailPlanner::SearchLimits;

namespace {

using EdgeSet = std::vector<EdgeIndex>;

// A potential alternative, with the edges that were excluded to find it.
struct Candidate {
    Itinerary itinerary {};
    EdgeSet excluded {};
};

// The priority queue keeps the best candidate on top.
struct CandidateCmp {
    bool operator()(const Candidate& a, const Candidate& b) const
    {
        return ItineraryCmp {}(b.itinerary, a.itinerary);
    }
};

EdgeSet GetSortedEdges(const Itinerary& itinerary)
{
    auto edges {itinerary.GetEdges()};
    std::sort(edges.begin(), edges.end());
    edges.erase(std::unique(edges.begin(), edges.end()), edges.end());
    return edges;
}

} // namespace

size_t RailPlanner::GetEdgeDifference(
    const Itinerary& a,
    const Itinerary& b
)
{
    const auto edgesA {GetSortedEdges(a)};
    const auto edgesB {GetSortedEdges(b)};
    EdgeSet difference {};
    std::set_symmetric_difference(
        edgesA.begin(), edgesA.end(),
        edgesB.begin(), edgesB.end(),
        std::back_inserter(difference)
    );
    return difference.size();
}

std::vector<Itinerary> RailPlanner::FindAlternatives(
    const NetworkView& view,
    const Id& originStationId,
    const Id& destinationStationId,
    const Objective& objective,
    const size_t maxResults,
    const SearchLimits& limits
)
{
    if (maxResults < kMinAlternatives || maxResults > kMaxAlternatives) {
        throw InvalidRequestError(
            "Number of alternatives must be between " +
            std::to_string(kMinAlternatives) + " and " +
            std::to_string(kMaxAlternatives) + ", got " +
            std::to_string(maxResults)
        );
    }

    // Start by finding the best itinerary in the network.
    // If there is none, there are no alternatives either.
    auto best {FindBest(
        view,
        originStationId,
        destinationStationId,
        objective,
        limits
    )};

    // Supporting data structures
    // - Accepted itineraries.
    std::vector<Itinerary> accepted {};
    // - Potential itineraries. We always extract the best one found so far.
    std::priority_queue<
        Candidate,
        std::vector<Candidate>,
        CandidateCmp
    > candidates {};
    // - Exclusion sets we already searched, so that we never repeat a search.
    std::set<EdgeSet> searched {};
    searched.insert(EdgeSet {});

    // Queue one child search for each edge of an accepted itinerary.
    auto expand {[&](const Itinerary& parent, const EdgeSet& excluded) {
        for (const auto& edge: parent.GetEdges()) {
            EdgeSet childExcluded {excluded};
            auto position {std::lower_bound(
                childExcluded.begin(),
                childExcluded.end(),
                edge
            )};
            if (position != childExcluded.end() && *position == edge) {
                continue;
            }
            childExcluded.insert(position, edge);
            if (!searched.insert(childExcluded).second) {
                continue;
            }
            try {
                auto child {FindBest(
                    view.Excluding(childExcluded),
                    originStationId,
                    destinationStationId,
                    objective,
                    limits
                )};
                candidates.push({std::move(child), std::move(childExcluded)});
            } catch (const NoPathError&) {
                // Removing this edge disconnects the stations. This branch
                // has nothing to offer.
                continue;
            }
        }
    }};

    accepted.push_back(best);
    expand(best, {});
    while (accepted.size() < maxResults && !candidates.empty()) {
        auto candidate {candidates.top()};
        candidates.pop();
        const bool isDistinct {std::all_of(
            accepted.begin(),
            accepted.end(),
            [&candidate](const auto& itinerary) {
                return GetEdgeDifference(candidate.itinerary, itinerary) >=
                    kMinDistinctEdges;
            }
        )};
        if (!isDistinct) {
            continue;
        }
        accepted.push_back(candidate.itinerary);
        expand(candidate.itinerary, candidate.excluded);
    }

    std::sort(accepted.begin(), accepted.end(), ItineraryCmp {});
    spdlog::debug("FindAlternatives: {} -> {}: {} itineraries",
                  originStationId, destinationStationId, accepted.size());
    return accepted;
}
