#include "TestNetworks.h"

#include <rail-planner/Errors.h>
#include <rail-planner/Itinerary.h>
#include <rail-planner/Network.h>
#include <rail-planner/RouteFinder.h>

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <functional>
#include <optional>
#include <string>
#include <vector>

using RailPlanner::EdgeKind;
using RailPlanner::GetObjective;
using RailPlanner::Id;
using RailPlanner::InvalidRequestError;
using RailPlanner::Itinerary;
using RailPlanner::ItineraryCmp;
using RailPlanner::NetworkData;
using RailPlanner::NetworkView;
using RailPlanner::NoPathError;
using RailPlanner::Objective;
using RailPlanner::Preference;
using RailPlanner::SearchBudgetExceededError;
using RailPlanner::SearchLimits;
using RailPlanner::Segment;
using RailPlanner::ServiceOverlay;
using RailPlanner::StationNotFoundError;
using RailPlanner::StationPair;
using RailPlanner::TransferLink;
using RailPlanner::Tests::BuildNetwork;
using RailPlanner::Tests::GetInterchangeNetwork;
using RailPlanner::Tests::GetLineNetwork;
using RailPlanner::Tests::GetTwoPathNetwork;
using RailPlanner::Tests::MakeLine;
using RailPlanner::Tests::MakeStation;

// Use this to set a timeout on tests that may hang.
using timeout = boost::unit_test::timeout;

namespace {

// Score of every simple path between two stations, by exhaustive search.
std::vector<double> GetAllPathScores(
    const NetworkView& view,
    const Id& originId,
    const Id& destinationId,
    const Objective& objective
)
{
    const auto& nw {view.GetSnapshot()};
    const auto origin {*nw.FindStation(originId)};
    const auto destination {*nw.FindStation(destinationId)};
    std::vector<double> scores {};
    std::vector<bool> visited(nw.GetStationCount(), false);
    std::function<void(size_t, double)> visit {
        [&](size_t station, double score) {
            if (station == destination) {
                scores.push_back(score);
                return;
            }
            visited[station] = true;
            for (const auto& edgeIdx: nw.GetOutgoingEdges(station)) {
                const auto& edge {nw.GetEdge(edgeIdx)};
                if (!view.IsOpen(edgeIdx) || visited[edge.to]) {
                    continue;
                }
                visit(edge.to, score + objective.GetEdgeScore(
                    view.GetTravelTime(edgeIdx),
                    edge.baseCost,
                    edge.kind
                ));
            }
            visited[station] = false;
        }
    };
    visit(origin, 0.0);
    return scores;
}

// A small Bangkok-like network with two routes from N8 to S2.
// - Sukhumvit line N8 - N3 - SIAM_SUK, transfer to Silom line SIAM_SIL - S2.
// - Blue line BL10 - BL26, transfer at both ends. Faster, but pricier.
NetworkData GetCityNetwork()
{
    NetworkData data {};
    data.stations = {
        MakeStation("N8", "SUK"),
        MakeStation("N3", "SUK"),
        MakeStation("SIAM_SUK", "SUK"),
        MakeStation("SIAM_SIL", "SIL"),
        MakeStation("S2", "SIL"),
        MakeStation("BL10", "BL"),
        MakeStation("BL26", "BL"),
    };
    data.lines = {
        MakeLine("SUK", {"N8", "N3", "SIAM_SUK"}, 6, 15.0),
        MakeLine("SIL", {"SIAM_SIL", "S2"}, 4, 15.0),
        MakeLine("BL", {"BL10", "BL26"}, 12, 40.0),
    };
    data.transferLinks = {
        TransferLink {"SIAM_SUK", "SIAM_SIL", 3, 100, 0.0, true},
        TransferLink {"N8", "BL10", 2, 200, 5.0, true},
        TransferLink {"BL26", "S2", 2, 200, 5.0, true},
    };
    return data;
}

// Line L1 A - X - B, 10 minutes per hop, and a short line L2 X - B that
// shares both its stations with L1.
NetworkData GetSharedStationNetwork()
{
    NetworkData data {};
    data.stations = {
        MakeStation("A", "L1"),
        MakeStation("X", "L1"),
        MakeStation("B", "L1"),
    };
    data.lines = {
        MakeLine("L1", {"A", "X", "B"}, 10),
        MakeLine("L2", {"X", "B"}, 2),
    };
    return data;
}

} // namespace

BOOST_AUTO_TEST_SUITE(rail_planner);

BOOST_AUTO_TEST_SUITE(enum_class_Preference);

BOOST_AUTO_TEST_CASE(strings)
{
    BOOST_CHECK_EQUAL(ToString(Preference::kFewestTransfers),
                      "fewest-transfers");
    BOOST_CHECK(RailPlanner::ToPreference("cheapest") == Preference::kCheapest);
    BOOST_CHECK(RailPlanner::ToPreference("scenic") == std::nullopt);
}

BOOST_AUTO_TEST_CASE(objectives)
{
    const auto fastest {GetObjective(Preference::kFastest)};
    BOOST_CHECK_EQUAL(fastest.GetEdgeScore(5, 10.0, EdgeKind::kRide), 5.0);
    BOOST_CHECK_EQUAL(fastest.GetEdgeScore(3, 5.0, EdgeKind::kTransfer), 4.0);

    const auto cheapest {GetObjective(Preference::kCheapest)};
    BOOST_CHECK_EQUAL(cheapest.GetEdgeScore(5, 10.0, EdgeKind::kRide), 10.0);
    BOOST_CHECK_EQUAL(cheapest.GetEdgeScore(3, 5.0, EdgeKind::kTransfer), 5.0);

    const auto fewest {GetObjective(Preference::kFewestTransfers)};
    BOOST_CHECK_EQUAL(fewest.GetEdgeScore(5, 10.0, EdgeKind::kRide), 0.0);
    BOOST_CHECK_EQUAL(fewest.GetEdgeScore(3, 5.0, EdgeKind::kTransfer),
                      1000.0);
}

BOOST_AUTO_TEST_SUITE_END(); // enum_class_Preference

BOOST_AUTO_TEST_SUITE(FindBest);

BOOST_AUTO_TEST_CASE(single_line, *timeout {1})
{
    const auto nw {BuildNetwork(GetLineNetwork())};
    const NetworkView view {nw};
    const auto itinerary {RailPlanner::FindBest(
        view, "A", "C", GetObjective(Preference::kFastest)
    )};
    BOOST_CHECK(itinerary.IsContiguous());
    BOOST_REQUIRE_EQUAL(itinerary.segments.size(), 2);
    BOOST_CHECK_EQUAL(itinerary.totalTravelTime, 10);
    BOOST_CHECK_EQUAL(itinerary.baseCost, 20.0);
    BOOST_CHECK_EQUAL(itinerary.transfers, 0);
    BOOST_CHECK_CLOSE(itinerary.totalDistanceKm, 2.0, 0.001);
    BOOST_CHECK_EQUAL(itinerary.score, 10.0);
    BOOST_REQUIRE_EQUAL(itinerary.linesUsed.size(), 1);
    BOOST_CHECK_EQUAL(itinerary.linesUsed[0], "L1");
    BOOST_CHECK_EQUAL(itinerary.segments[0].fromStationId, "A");
    BOOST_CHECK_EQUAL(itinerary.segments[0].toStationId, "B");
    BOOST_CHECK_EQUAL(itinerary.segments[0].instructions,
                      "Take Line L1 from Station A to Station B");

    // Reverse direction.
    const auto reverse {RailPlanner::FindBest(
        view, "C", "A", GetObjective(Preference::kFastest)
    )};
    BOOST_CHECK(reverse.IsContiguous());
    BOOST_CHECK_EQUAL(reverse.totalTravelTime, 10);
}

BOOST_AUTO_TEST_CASE(interchange, *timeout {1})
{
    const auto nw {BuildNetwork(GetInterchangeNetwork())};
    const NetworkView view {nw};
    const auto itinerary {RailPlanner::FindBest(
        view, "A", "D", GetObjective(Preference::kFastest)
    )};
    BOOST_CHECK(itinerary.IsContiguous());
    BOOST_REQUIRE_EQUAL(itinerary.segments.size(), 3);
    BOOST_CHECK(itinerary.segments[0].kind == EdgeKind::kRide);
    BOOST_CHECK(itinerary.segments[1].kind == EdgeKind::kTransfer);
    BOOST_CHECK(itinerary.segments[2].kind == EdgeKind::kRide);
    BOOST_CHECK_EQUAL(itinerary.segments[1].fromStationId, "B");
    BOOST_CHECK_EQUAL(itinerary.segments[1].toStationId, "B2");
    BOOST_CHECK_EQUAL(itinerary.segments[1].instructions,
                      "Walk 3 minutes from Station B to Station B2");
    BOOST_CHECK_EQUAL(itinerary.transfers, 1);
    BOOST_CHECK_EQUAL(itinerary.totalTravelTime, 13);
    BOOST_CHECK_EQUAL(itinerary.score, 14.0);
    BOOST_REQUIRE_EQUAL(itinerary.linesUsed.size(), 2);
    BOOST_CHECK_EQUAL(itinerary.linesUsed[0], "L1");
    BOOST_CHECK_EQUAL(itinerary.linesUsed[1], "L2");
}

BOOST_AUTO_TEST_CASE(preferences, *timeout {1})
{
    const auto nw {BuildNetwork(GetCityNetwork())};
    const NetworkView view {nw};

    // Fastest: blue line, 2 + 12 + 2 = 16 minutes, 2 transfers (score 18)
    // against 6 + 6 + 3 + 4 = 19 minutes, 1 transfer (score 20).
    const auto fastest {RailPlanner::FindBest(
        view, "N8", "S2", GetObjective(Preference::kFastest)
    )};
    BOOST_CHECK_EQUAL(fastest.totalTravelTime, 16);
    BOOST_CHECK_EQUAL(fastest.transfers, 2);
    BOOST_CHECK(std::find(
        fastest.linesUsed.begin(), fastest.linesUsed.end(), "BL"
    ) != fastest.linesUsed.end());

    // Cheapest: 15 + 15 + 0 + 15 = 45 baht against 5 + 40 + 5 = 50 baht.
    const auto cheapest {RailPlanner::FindBest(
        view, "N8", "S2", GetObjective(Preference::kCheapest)
    )};
    BOOST_CHECK_EQUAL(cheapest.baseCost, 45.0);
    BOOST_CHECK_EQUAL(cheapest.transfers, 1);

    // Fewest transfers.
    const auto fewest {RailPlanner::FindBest(
        view, "N8", "S2", GetObjective(Preference::kFewestTransfers)
    )};
    BOOST_CHECK_EQUAL(fewest.transfers, 1);
}

BOOST_AUTO_TEST_CASE(optimality, *timeout {2})
{
    const auto nw {BuildNetwork(GetCityNetwork())};
    const NetworkView view {nw};
    const std::vector<Id> stations {
        "N8", "N3", "SIAM_SUK", "SIAM_SIL", "S2", "BL10", "BL26",
    };
    for (const auto& preference: {
        Preference::kFastest,
        Preference::kCheapest,
        Preference::kFewestTransfers,
    }) {
        const auto objective {GetObjective(preference)};
        for (const auto& origin: stations) {
            for (const auto& destination: stations) {
                if (origin == destination) {
                    continue;
                }
                const auto itinerary {RailPlanner::FindBest(
                    view, origin, destination, objective
                )};
                BOOST_CHECK(itinerary.IsContiguous());
                const auto scores {GetAllPathScores(
                    view, origin, destination, objective
                )};
                BOOST_REQUIRE(!scores.empty());
                const auto minScore {
                    *std::min_element(scores.begin(), scores.end())
                };
                BOOST_CHECK_CLOSE(itinerary.score + 1.0, minScore + 1.0,
                                  0.0001);
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(deterministic_ties, *timeout {1})
{
    // Two paths with the same time, transfers and distance: A - B - D and
    // A - C - D. The lower station ID wins.
    auto data {GetTwoPathNetwork()};
    data.lines[1] = MakeLine("L2", {"A", "C", "D"}, 5);
    const auto nw {BuildNetwork(data)};
    const NetworkView view {nw};
    const auto first {RailPlanner::FindBest(
        view, "A", "D", GetObjective(Preference::kFastest)
    )};
    BOOST_REQUIRE_EQUAL(first.segments.size(), 2);
    BOOST_CHECK_EQUAL(first.segments[0].toStationId, "B");
    for (int idx {0}; idx < 10; ++idx) {
        const auto again {RailPlanner::FindBest(
            view, "A", "D", GetObjective(Preference::kFastest)
        )};
        BOOST_CHECK(again == first);
    }
}

BOOST_AUTO_TEST_CASE(overlay_delay, *timeout {1})
{
    const auto nw {BuildNetwork(GetTwoPathNetwork())};
    ServiceOverlay overlay {};
    overlay.delays = {{"B", "D", 10}};
    const NetworkView view {nw, overlay};

    // The delay makes the path through C faster: 14 < 5 + 15.
    const auto itinerary {RailPlanner::FindBest(
        view, "A", "D", GetObjective(Preference::kFastest)
    )};
    BOOST_CHECK_EQUAL(itinerary.segments[0].toStationId, "C");
    BOOST_CHECK_EQUAL(itinerary.totalTravelTime, 14);
}

BOOST_AUTO_TEST_CASE(overlay_closure, *timeout {1})
{
    const auto nw {BuildNetwork(GetTwoPathNetwork())};
    ServiceOverlay overlay {};
    overlay.closedSegments = {StationPair {"A", "B"}};
    const NetworkView view {nw, overlay};
    const auto itinerary {RailPlanner::FindBest(
        view, "A", "D", GetObjective(Preference::kFastest)
    )};
    BOOST_CHECK_EQUAL(itinerary.segments[0].toStationId, "C");
    BOOST_CHECK_EQUAL(itinerary.totalTravelTime, 14);
}

BOOST_AUTO_TEST_CASE(disconnected, *timeout {1})
{
    auto data {GetInterchangeNetwork()};
    data.transferLinks.clear();
    const auto nw {BuildNetwork(data)};
    const NetworkView view {nw};
    BOOST_CHECK_THROW(
        RailPlanner::FindBest(view, "A", "D", GetObjective(Preference::kFastest)),
        NoPathError
    );
}

BOOST_AUTO_TEST_CASE(closed_line, *timeout {1})
{
    const auto nw {BuildNetwork(GetInterchangeNetwork())};
    ServiceOverlay overlay {};
    overlay.closedLines = {"L2"};
    const NetworkView view {nw, overlay};
    BOOST_CHECK_THROW(
        RailPlanner::FindBest(view, "A", "D", GetObjective(Preference::kFastest)),
        NoPathError
    );
}

BOOST_AUTO_TEST_CASE(unknown_station, *timeout {1})
{
    const auto nw {BuildNetwork(GetLineNetwork())};
    const NetworkView view {nw};
    BOOST_CHECK_THROW(
        RailPlanner::FindBest(view, "A", "X", GetObjective(Preference::kFastest)),
        StationNotFoundError
    );
    BOOST_CHECK_THROW(
        RailPlanner::FindBest(view, "X", "A", GetObjective(Preference::kFastest)),
        StationNotFoundError
    );
}

BOOST_AUTO_TEST_CASE(same_station, *timeout {1})
{
    const auto nw {BuildNetwork(GetLineNetwork())};
    const NetworkView view {nw};
    BOOST_CHECK_THROW(
        RailPlanner::FindBest(view, "A", "A", GetObjective(Preference::kFastest)),
        InvalidRequestError
    );
}

BOOST_AUTO_TEST_CASE(search_budget, *timeout {1})
{
    const auto nw {BuildNetwork(GetLineNetwork())};
    const NetworkView view {nw};
    BOOST_CHECK_THROW(
        RailPlanner::FindBest(
            view, "A", "C", GetObjective(Preference::kFastest),
            SearchLimits {1}
        ),
        SearchBudgetExceededError
    );
    BOOST_CHECK_NO_THROW(
        RailPlanner::FindBest(
            view, "A", "C", GetObjective(Preference::kFastest),
            SearchLimits {3}
        )
    );
}

BOOST_AUTO_TEST_CASE(line_change_is_transfer, *timeout {1})
{
    const auto nw {BuildNetwork(GetSharedStationNetwork())};
    const NetworkView view {nw};

    // Fastest: change to L2 at X without leaving the station.
    const auto fastest {RailPlanner::FindBest(
        view, "A", "B", GetObjective(Preference::kFastest)
    )};
    BOOST_CHECK_EQUAL(fastest.totalTravelTime, 12);
    BOOST_CHECK_EQUAL(fastest.transfers, 1);
    BOOST_CHECK_EQUAL(fastest.score, 13.0);
    BOOST_REQUIRE_EQUAL(fastest.linesUsed.size(), 2);
    BOOST_CHECK_EQUAL(fastest.linesUsed[0], "L1");
    BOOST_CHECK_EQUAL(fastest.linesUsed[1], "L2");

    // Fewest transfers: stay on L1.
    const auto fewest {RailPlanner::FindBest(
        view, "A", "B", GetObjective(Preference::kFewestTransfers)
    )};
    BOOST_CHECK_EQUAL(fewest.totalTravelTime, 20);
    BOOST_CHECK_EQUAL(fewest.transfers, 0);
    BOOST_REQUIRE_EQUAL(fewest.linesUsed.size(), 1);
    BOOST_CHECK_EQUAL(fewest.linesUsed[0], "L1");

    // Starting on L2 is not a change.
    const auto direct {RailPlanner::FindBest(
        view, "X", "B", GetObjective(Preference::kFastest)
    )};
    BOOST_CHECK_EQUAL(direct.totalTravelTime, 2);
    BOOST_CHECK_EQUAL(direct.transfers, 0);
}

BOOST_AUTO_TEST_CASE(rounding_ties, *timeout {1})
{
    // A - M - D costs 0.1 + 0.2 on L1. Walking to X and riding L2 to D costs
    // 0 + 0.3. In floating point 0.1 + 0.2 > 0.3, but the two are the same
    // price: the ride without a transfer wins.
    NetworkData data {};
    data.stations = {
        MakeStation("A", "L1"),
        MakeStation("M", "L1"),
        MakeStation("D", "L1"),
        MakeStation("X", "L2"),
    };
    auto line1 {MakeLine("L1", {"A", "M", "D"})};
    line1.hops[0].baseCost = 0.1;
    line1.hops[1].baseCost = 0.2;
    auto line2 {MakeLine("L2", {"X", "D"})};
    line2.hops[0].baseCost = 0.3;
    data.lines = {line1, line2};
    data.transferLinks = {TransferLink {"A", "X", 1, 50, 0.0, true}};
    const auto nw {BuildNetwork(data)};
    const NetworkView view {nw};
    BOOST_REQUIRE(0.1 + 0.2 != 0.3);

    const auto cheapest {RailPlanner::FindBest(
        view, "A", "D", GetObjective(Preference::kCheapest)
    )};
    BOOST_CHECK_EQUAL(cheapest.transfers, 0);
    BOOST_REQUIRE_EQUAL(cheapest.segments.size(), 2);
    BOOST_CHECK_EQUAL(cheapest.segments[0].toStationId, "M");
}

BOOST_AUTO_TEST_CASE(max_transfers, *timeout {1})
{
    const auto nw {BuildNetwork(GetSharedStationNetwork())};
    const NetworkView view {nw};
    const auto objective {GetObjective(Preference::kFastest)};

    SearchLimits limits {};
    limits.maxTransfers = 0;
    const auto itinerary {RailPlanner::FindBest(
        view, "A", "B", objective, limits
    )};
    BOOST_CHECK_EQUAL(itinerary.totalTravelTime, 20);
    BOOST_CHECK_EQUAL(itinerary.transfers, 0);

    limits.maxTransfers = 1;
    BOOST_CHECK_EQUAL(RailPlanner::FindBest(
        view, "A", "B", objective, limits
    ).totalTravelTime, 12);

    // The interchange needs a walk.
    const auto interchange {BuildNetwork(GetInterchangeNetwork())};
    limits.maxTransfers = 0;
    BOOST_CHECK_THROW(
        RailPlanner::FindBest(
            NetworkView {interchange}, "A", "D", objective, limits
        ),
        NoPathError
    );
}

BOOST_AUTO_TEST_CASE(max_walking_time, *timeout {1})
{
    const auto nw {BuildNetwork(GetCityNetwork())};
    const NetworkView view {nw};
    const auto objective {GetObjective(Preference::kFastest)};

    // The blue line needs 2 + 2 minutes of walking, the Siam interchange 3.
    SearchLimits limits {};
    limits.maxWalkingTime = 3;
    const auto itinerary {RailPlanner::FindBest(
        view, "N8", "S2", objective, limits
    )};
    BOOST_CHECK_EQUAL(itinerary.totalTravelTime, 19);
    BOOST_CHECK_EQUAL(itinerary.transfers, 1);

    limits.maxWalkingTime = 4;
    BOOST_CHECK_EQUAL(RailPlanner::FindBest(
        view, "N8", "S2", objective, limits
    ).totalTravelTime, 16);

    limits.maxWalkingTime = 2;
    BOOST_CHECK_THROW(
        RailPlanner::FindBest(view, "N8", "S2", objective, limits),
        NoPathError
    );
}

BOOST_AUTO_TEST_SUITE_END(); // FindBest

BOOST_AUTO_TEST_SUITE(class_ItineraryCmp);

BOOST_AUTO_TEST_CASE(order)
{
    Itinerary a {};
    a.score = 10.0;
    a.transfers = 1;
    Itinerary b {a};
    b.score = 11.0;
    b.transfers = 0;
    BOOST_CHECK(ItineraryCmp {}(a, b));
    BOOST_CHECK(!ItineraryCmp {}(b, a));

    // Same score: fewer transfers first.
    b.score = 10.0;
    BOOST_CHECK(ItineraryCmp {}(b, a));

    // Same score and transfers: shorter first.
    b.transfers = 1;
    b.totalDistanceKm = 1.0;
    a.totalDistanceKm = 2.0;
    BOOST_CHECK(ItineraryCmp {}(b, a));

    // Everything else equal: station IDs.
    a.totalDistanceKm = 1.0;
    a.segments = {Segment {EdgeKind::kRide, "S", "A", "L1"}};
    b.segments = {Segment {EdgeKind::kRide, "S", "B", "L1"}};
    BOOST_CHECK(ItineraryCmp {}(a, b));
    BOOST_CHECK(!ItineraryCmp {}(a, a));
}

BOOST_AUTO_TEST_CASE(rounding)
{
    // Sums that only differ by rounding errors have the same score.
    Itinerary a {};
    a.score = 0.1 + 0.2;
    a.transfers = 0;
    Itinerary b {a};
    b.score = 0.3;
    b.transfers = 1;
    BOOST_CHECK(ItineraryCmp {}(a, b));
    BOOST_CHECK(!ItineraryCmp {}(b, a));

    b.transfers = 0;
    a.totalDistanceKm = 0.7 + 0.1;
    b.totalDistanceKm = 0.8;
    BOOST_CHECK(!ItineraryCmp {}(a, b));
    BOOST_CHECK(!ItineraryCmp {}(b, a));
}

BOOST_AUTO_TEST_SUITE_END(); // class_ItineraryCmp

BOOST_AUTO_TEST_SUITE_END(); // rail_planner
