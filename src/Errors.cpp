#include <rail-planner/Errors.h>

#include <boost/bimap.hpp>

#include <initializer_list>
#include <ostream>
#include <string>
#include <string_view>

using RailPlanner::FareRuleMissingError;
using RailPlanner::IntegrityError;
using RailPlanner::InvalidPassengerTypeError;
using RailPlanner::InvalidRequestError;
using RailPlanner::NoPathError;
using RailPlanner::RailPlannerError;
using RailPlanner::RailPlannerException;
using RailPlanner::SearchBudgetExceededError;
using RailPlanner::StationNotFoundError;

// Utility function to generate a boost::bimap.
template <typename L, typename R>
static boost::bimap<L, R> MakeBimap(
    std::initializer_list<typename boost::bimap<L, R>::value_type> list
)
{
    return boost::bimap<L, R>(list.begin(), list.end());
}

// RailPlannerError

static const auto gRailPlannerErrorStrings {
    MakeBimap<RailPlannerError, std::string_view>({
        {RailPlannerError::kOk                  , "Ok"                  },
        {RailPlannerError::kUndefinedError      , "UndefinedError"      },
        {RailPlannerError::kFareRuleMissing     , "FareRuleMissing"     },
        {RailPlannerError::kIntegrityError      , "IntegrityError"      },
        {RailPlannerError::kInvalidPassengerType, "InvalidPassengerType"},
        {RailPlannerError::kInvalidRequest      , "InvalidRequest"      },
        {RailPlannerError::kNoPath              , "NoPath"              },
        {RailPlannerError::kSearchBudgetExceeded, "SearchBudgetExceeded"},
        {RailPlannerError::kStationNotFound     , "StationNotFound"     },
    })
};

std::ostream& RailPlanner::operator<<(
    std::ostream& os,
    const RailPlannerError& error
)
{
    return os << ToString(error);
}

std::string RailPlanner::ToString(
    const RailPlannerError& error
)
{
    static const auto undefinedError {std::string(
        gRailPlannerErrorStrings.left.at(RailPlannerError::kUndefinedError)
    )};
    auto errorIt {gRailPlannerErrorStrings.left.find(error)};
    if (errorIt == gRailPlannerErrorStrings.left.end()) {
        return undefinedError;
    }
    return std::string(errorIt->second);
}

bool RailPlanner::IsRetryable(
    const RailPlannerError& error
)
{
    switch (error) {
        case RailPlannerError::kNoPath:
        case RailPlannerError::kSearchBudgetExceeded:
            return true;
        default:
            return false;
    }
}

// RailPlannerException

RailPlannerException::RailPlannerException(
    RailPlannerError code,
    const std::string& message
) : std::runtime_error(ToString(code) + ": " + message),
    code_ {code}
{
}

RailPlannerError RailPlannerException::GetCode() const
{
    return code_;
}

IntegrityError::IntegrityError(const std::string& message)
    : RailPlannerException(RailPlannerError::kIntegrityError, message)
{
}

StationNotFoundError::StationNotFoundError(const std::string& message)
    : RailPlannerException(RailPlannerError::kStationNotFound, message)
{
}

NoPathError::NoPathError(const std::string& message)
    : RailPlannerException(RailPlannerError::kNoPath, message)
{
}

InvalidPassengerTypeError::InvalidPassengerTypeError(
    const std::string& message
) : RailPlannerException(RailPlannerError::kInvalidPassengerType, message)
{
}

FareRuleMissingError::FareRuleMissingError(const std::string& message)
    : RailPlannerException(RailPlannerError::kFareRuleMissing, message)
{
}

SearchBudgetExceededError::SearchBudgetExceededError(
    const std::string& message
) : RailPlannerException(RailPlannerError::kSearchBudgetExceeded, message)
{
}

InvalidRequestError::InvalidRequestError(const std::string& message)
    : RailPlannerException(RailPlannerError::kInvalidRequest, message)
{
}
