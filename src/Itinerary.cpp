#include <rail-planner/Itinerary.h>
#include <rail-planner/Network.h>

#include <nlohmann/json.hpp>

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

using RailPlanner::EdgeIndex;
using RailPlanner::Id;
using RailPlanner::Itinerary;
using RailPlanner::Segment;

// Segment — Public methods

bool Segment::operator==(const Segment& other) const
{
    return kind == other.kind &&
        fromStationId == other.fromStationId &&
        toStationId == other.toStationId &&
        lineId == other.lineId &&
        travelTime == other.travelTime &&
        distanceKm == other.distanceKm &&
        baseCost == other.baseCost;
}

// Itinerary — Public methods

std::vector<EdgeIndex> Itinerary::GetEdges() const
{
    std::vector<EdgeIndex> edges {};
    edges.reserve(segments.size());
    for (const auto& segment: segments) {
        edges.push_back(segment.edge);
    }
    return edges;
}

bool Itinerary::IsContiguous() const
{
    if (segments.empty()) {
        return false;
    }
    if (segments.front().fromStationId != originStationId ||
        segments.back().toStationId != destinationStationId) {
        return false;
    }
    for (size_t idx {1}; idx < segments.size(); ++idx) {
        if (segments[idx - 1].toStationId != segments[idx].fromStationId) {
            return false;
        }
    }
    return true;
}

bool Itinerary::operator==(const Itinerary& other) const
{
    return originStationId == other.originStationId &&
        destinationStationId == other.destinationStationId &&
        totalTravelTime == other.totalTravelTime &&
        transfers == other.transfers &&
        segments == other.segments;
}

// Free functions

std::ostream& RailPlanner::operator<<(
    std::ostream& os,
    const Itinerary& itinerary
)
{
    os << nlohmann::json(itinerary);
    return os;
}

void RailPlanner::to_json(
    nlohmann::json& dst,
    const Segment& src
)
{
    dst["kind"] = ToString(src.kind);
    dst["from_station_id"] = src.fromStationId;
    dst["to_station_id"] = src.toStationId;
    dst["line_id"] = src.lineId;
    dst["travel_time"] = src.travelTime;
    dst["distance_km"] = src.distanceKm;
    dst["base_cost"] = src.baseCost;
    dst["instructions"] = src.instructions;
}

void RailPlanner::from_json(
    const nlohmann::json& src,
    Segment& dst
)
{
    const auto kind {ToEdgeKind(src.at("kind").get<std::string>())};
    if (kind == std::nullopt) {
        throw std::runtime_error("Unknown segment kind: " +
                                 src.at("kind").get<std::string>());
    }
    dst.kind = *kind;
    dst.fromStationId = src.at("from_station_id").get<Id>();
    dst.toStationId = src.at("to_station_id").get<Id>();
    dst.lineId = src.value("line_id", Id {});
    dst.travelTime = src.at("travel_time").get<unsigned int>();
    dst.distanceKm = src.value("distance_km", 0.0);
    dst.baseCost = src.value("base_cost", 0.0);
    dst.instructions = src.value("instructions", std::string {});
}

void RailPlanner::to_json(
    nlohmann::json& dst,
    const Itinerary& src
)
{
    dst["origin_station_id"] = src.originStationId;
    dst["destination_station_id"] = src.destinationStationId;
    dst["total_travel_time"] = src.totalTravelTime;
    dst["total_distance_km"] = src.totalDistanceKm;
    dst["transfers"] = src.transfers;
    dst["base_cost"] = src.baseCost;
    dst["score"] = src.score;
    dst["lines_used"] = src.linesUsed;
    dst["segments"] = src.segments;
}

void RailPlanner::from_json(
    const nlohmann::json& src,
    Itinerary& dst
)
{
    dst.originStationId = src.at("origin_station_id").get<Id>();
    dst.destinationStationId = src.at("destination_station_id").get<Id>();
    dst.totalTravelTime = src.at("total_travel_time").get<unsigned int>();
    dst.totalDistanceKm = src.value("total_distance_km", 0.0);
    dst.transfers = src.at("transfers").get<unsigned int>();
    dst.baseCost = src.value("base_cost", 0.0);
    dst.score = src.value("score", 0.0);
    dst.linesUsed = src.value("lines_used", std::vector<Id> {});
    dst.segments = src.at("segments").get<std::vector<Segment>>();
}
