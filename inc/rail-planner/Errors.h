#ifndef RAIL_PLANNER_ERRORS_H
#define RAIL_PLANNER_ERRORS_H

#include <ostream>
#include <stdexcept>
#include <string>

namespace RailPlanner {

/*! \brief Error codes for the route planning and fare engine.
 */
enum class RailPlannerError {
    kOk = 0,
    kUndefinedError,
    kFareRuleMissing,
    kIntegrityError,
    kInvalidPassengerType,
    kInvalidRequest,
    kNoPath,
    kSearchBudgetExceeded,
    kStationNotFound,
};

/*! \brief Print operator for the `RailPlannerError` class.
 */
std::ostream& operator<<(
    std::ostream& os,
    const RailPlannerError& error
);

/*! \brief Convert `RailPlannerError` to string.
 */
std::string ToString(
    const RailPlannerError& error
);

/*! \brief Whether the caller may retry a failed request.
 *
 *  The engine never retries on its own: A search is deterministic, so only a
 *  change in its input (a new overlay, a new snapshot, a larger search budget)
 *  can produce a different result.
 */
bool IsRetryable(
    const RailPlannerError& error
);

/*! \brief Base class for all the failures reported by the engine.
 */
class RailPlannerException: public std::runtime_error {
public:
    RailPlannerException(
        RailPlannerError code,
        const std::string& message
    );

    /*! \brief The error code for this failure.
     */
    RailPlannerError GetCode() const;

private:
    RailPlannerError code_ {RailPlannerError::kUndefinedError};
};

/*! \brief Malformed topology or fare data at build time.
 *
 *  The rebuild that raised it has no effect: The previous snapshot stays in
 *  use.
 */
class IntegrityError: public RailPlannerException {
public:
    explicit IntegrityError(const std::string& message);
};

/*! \brief A request references a station that is not in the snapshot.
 */
class StationNotFoundError: public RailPlannerException {
public:
    explicit StationNotFoundError(const std::string& message);
};

/*! \brief No path between origin and destination under the current closures.
 */
class NoPathError: public RailPlannerException {
public:
    explicit NoPathError(const std::string& message);
};

/*! \brief The requested passenger type is not in the fare table.
 */
class InvalidPassengerTypeError: public RailPlannerException {
public:
    explicit InvalidPassengerTypeError(const std::string& message);
};

/*! \brief A fare rule lookup failed while pricing an itinerary.
 *
 *  This is an operational data gap, not a user error.
 */
class FareRuleMissingError: public RailPlannerException {
public:
    explicit FareRuleMissingError(const std::string& message);
};

/*! \brief A search exceeded its frontier-pop budget.
 */
class SearchBudgetExceededError: public RailPlannerException {
public:
    explicit SearchBudgetExceededError(const std::string& message);
};

/*! \brief The request itself is malformed (same origin and destination, no
 *         passenger types, invalid number of alternatives, ...).
 */
class InvalidRequestError: public RailPlannerException {
public:
    explicit InvalidRequestError(const std::string& message);
};

} // namespace RailPlanner

#endif // RAIL_PLANNER_ERRORS_H
