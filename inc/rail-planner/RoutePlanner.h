#ifndef RAIL_PLANNER_ROUTE_PLANNER_H
#define RAIL_PLANNER_ROUTE_PLANNER_H

#include <rail-planner/FareCalculator.h>
#include <rail-planner/FareTable.h>
#include <rail-planner/Itinerary.h>
#include <rail-planner/Network.h>
#include <rail-planner/NetworkLayout.h>
#include <rail-planner/RouteFinder.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace RailPlanner {

/*! \brief Configuration structure for the rail planner process.
 *
 *  If `networkLayoutFile` is empty, the network layout is downloaded from
 *  `networkLayoutUrl`.
 */
struct RailPlannerConfig {
    std::filesystem::path networkLayoutFile {};
    std::string networkLayoutUrl {};
    std::filesystem::path caCertFile {};
    size_t maxFrontierPops {100000};
};

/*! \brief Error codes for the setup of the rail planner.
 */
enum class RailPlannerSetupError {
    kOk = 0,
    kUndefinedError,
    kFailedNetworkConstruction,
    kFailedNetworkLayoutFileDownload,
    kFailedNetworkLayoutFileParsing,
    kMissingNetworkLayoutFile,
};

/*! \brief Print operator for the `RailPlannerSetupError` class.
 */
std::ostream& operator<<(
    std::ostream& os,
    const RailPlannerSetupError& error
);

/*! \brief Convert `RailPlannerSetupError` to string.
 */
std::string ToString(
    const RailPlannerSetupError& error
);

/*! \brief Network and fares that are valid together.
 *
 *  A snapshot never changes after it has been built.
 */
struct Snapshot {
    NetworkSnapshot network;
    FareTable fares;
};

/*! \brief Upper bound accepted for `PlanRequest::maxTransfers`.
 */
constexpr unsigned int kMaxTransfersLimit {5};

/*! \brief Upper bound accepted for `PlanRequest::maxWalkingTime`, in minutes.
 */
constexpr unsigned int kMaxWalkingTimeLimit {60};

/*! \brief A journey planning request.
 *
 *  `alternatives` is the number of itineraries the caller would like to
 *  receive. At most 5 are returned.
 *
 *  Optional constraints:
 *  - `maxTransfers`: 0 to 5 transfers.
 *  - `maxWalkingTime`: 1 to 60 minutes of walking on transfer links.
 *  - `avoidLines`: lines the itineraries must not use. They are closed for
 *    this request only.
 *  - `preferLines`: itineraries that use at least one of these lines come
 *    first. Each group keeps the preference order.
 */
struct PlanRequest {
    Id originStationId {};
    Id destinationStationId {};
    Preference preference {Preference::kFastest};
    std::vector<PassengerCategory> passengerTypes {PassengerCategory::kAdult};
    size_t alternatives {3};
    ServiceOverlay overlay {};
    bool isGroup {false};
    unsigned int groupSize {1};
    std::optional<unsigned int> maxTransfers {};
    std::optional<unsigned int> maxWalkingTime {};
    std::vector<Id> avoidLines {};
    std::vector<Id> preferLines {};
};

/*! \brief An itinerary with one fare breakdown per requested passenger type.
 */
struct PricedItinerary {
    Itinerary itinerary {};
    std::vector<FareBreakdown> fares {};
};

/*! \brief Route planning and fare engine.
 *
 *  The planner holds the current snapshot. `Plan` and `Price` may be called
 *  concurrently from any number of threads, also while another thread calls
 *  `Rebuild`. Each call uses the snapshot that was current when it started.
 */
class RoutePlanner {
public:
    /*! \brief Construct a planner with no network loaded.
     */
    explicit RoutePlanner(
        const SearchLimits& limits = {}
    );

    /*! \brief Load the network layout and build the first snapshot.
     *
     *  This function downloads the layout file if needed, parses it and
     *  calls `Rebuild`.
     */
    RailPlannerSetupError Configure(
        const RailPlannerConfig& config
    );

    /*! \brief Build a new snapshot and make it the current one.
     *
     *  \throws IntegrityError if the data is not consistent. The current
     *                         snapshot stays in effect.
     */
    void Rebuild(
        const NetworkData& data
    );

    /*! \brief The current snapshot.
     *
     *  \returns nullptr if no network has been loaded yet.
     */
    std::shared_ptr<const Snapshot> GetSnapshot() const;

    /*! \brief Plan and price itineraries between two stations.
     *
     *  \returns Between 1 and min(request.alternatives, 5) itineraries, sorted
     *           from best to worst for the requested preference. Itineraries
     *           on a preferred line come first.
     *
     *  \throws IntegrityError            if no network has been loaded.
     *  \throws InvalidRequestError       if the request is malformed, or
     *                                    names an unknown line.
     *  \throws StationNotFoundError      if either station does not exist.
     *  \throws InvalidPassengerTypeError if a passenger type has no fares.
     *  \throws NoPathError               if the stations are not connected.
     *  \throws SearchBudgetExceededError if a search exceeds its budget.
     *  \throws FareRuleMissingError      if a ride cannot be priced.
     */
    std::vector<PricedItinerary> Plan(
        const PlanRequest& request
    ) const;

    /*! \brief Price an itinerary against the current snapshot.
     *
     *  \throws IntegrityError if no network has been loaded.
     *
     *  See `RailPlanner::Price` for the other failures.
     */
    FareBreakdown Price(
        const Itinerary& itinerary,
        PassengerCategory category,
        bool isGroup = false,
        unsigned int groupSize = 1
    ) const;

    /*! \brief Compare the fares of itineraries against the current snapshot.
     *
     *  \throws IntegrityError if no network has been loaded.
     *
     *  See `RailPlanner::CompareFares` for the other failures.
     */
    std::vector<FareComparison> CompareFares(
        const std::vector<Itinerary>& itineraries,
        PassengerCategory category,
        bool isGroup = false,
        unsigned int groupSize = 1
    ) const;

private:
    SearchLimits limits_ {};
    std::shared_ptr<const Snapshot> snapshot_ {nullptr};

    std::shared_ptr<const Snapshot> GetSnapshotOrThrow() const;
};

void from_json(
    const nlohmann::json& src,
    PlanRequest& dst
);

void to_json(
    nlohmann::json& dst,
    const PricedItinerary& src
);

} // namespace RailPlanner

#endif // RAIL_PLANNER_ROUTE_PLANNER_H
