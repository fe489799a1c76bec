#include <rail-planner/Errors.h>

#include <boost/test/unit_test.hpp>

#include <sstream>
#include <string>

using RailPlanner::FareRuleMissingError;
using RailPlanner::IntegrityError;
using RailPlanner::InvalidPassengerTypeError;
using RailPlanner::InvalidRequestError;
using RailPlanner::IsRetryable;
using RailPlanner::NoPathError;
using RailPlanner::RailPlannerError;
using RailPlanner::RailPlannerException;
using RailPlanner::SearchBudgetExceededError;
using RailPlanner::StationNotFoundError;

BOOST_AUTO_TEST_SUITE(rail_planner);

BOOST_AUTO_TEST_SUITE(enum_class_RailPlannerError);

BOOST_AUTO_TEST_CASE(ostream)
{
    std::stringstream invalidSs;
    invalidSs << RailPlannerError::kUndefinedError;
    auto invalid {invalidSs.str()};
    for (const auto& error: {
        RailPlannerError::kOk,
        RailPlannerError::kFareRuleMissing,
        RailPlannerError::kIntegrityError,
        RailPlannerError::kInvalidPassengerType,
        RailPlannerError::kInvalidRequest,
        RailPlannerError::kNoPath,
        RailPlannerError::kSearchBudgetExceeded,
        RailPlannerError::kStationNotFound,
    }) {
        std::stringstream ss {};
        ss << error;
        BOOST_CHECK(invalid != ss.str());
    }
    BOOST_CHECK_EQUAL(ToString(RailPlannerError::kNoPath), "NoPath");
}

BOOST_AUTO_TEST_CASE(retryable)
{
    BOOST_CHECK(IsRetryable(RailPlannerError::kNoPath));
    BOOST_CHECK(IsRetryable(RailPlannerError::kSearchBudgetExceeded));
    BOOST_CHECK(!IsRetryable(RailPlannerError::kIntegrityError));
    BOOST_CHECK(!IsRetryable(RailPlannerError::kStationNotFound));
    BOOST_CHECK(!IsRetryable(RailPlannerError::kInvalidRequest));
    BOOST_CHECK(!IsRetryable(RailPlannerError::kInvalidPassengerType));
    BOOST_CHECK(!IsRetryable(RailPlannerError::kFareRuleMissing));
}

BOOST_AUTO_TEST_SUITE_END(); // enum_class_RailPlannerError

BOOST_AUTO_TEST_SUITE(class_RailPlannerException);

BOOST_AUTO_TEST_CASE(codes)
{
    BOOST_CHECK(IntegrityError("").GetCode() ==
                RailPlannerError::kIntegrityError);
    BOOST_CHECK(StationNotFoundError("").GetCode() ==
                RailPlannerError::kStationNotFound);
    BOOST_CHECK(NoPathError("").GetCode() == RailPlannerError::kNoPath);
    BOOST_CHECK(InvalidPassengerTypeError("").GetCode() ==
                RailPlannerError::kInvalidPassengerType);
    BOOST_CHECK(FareRuleMissingError("").GetCode() ==
                RailPlannerError::kFareRuleMissing);
    BOOST_CHECK(SearchBudgetExceededError("").GetCode() ==
                RailPlannerError::kSearchBudgetExceeded);
    BOOST_CHECK(InvalidRequestError("").GetCode() ==
                RailPlannerError::kInvalidRequest);
}

BOOST_AUTO_TEST_CASE(catch_as_base)
{
    try {
        throw NoPathError("No path from A to B");
    } catch (const RailPlannerException& e) {
        BOOST_CHECK(e.GetCode() == RailPlannerError::kNoPath);
        const std::string what {e.what()};
        BOOST_CHECK(what.find("NoPath") != std::string::npos);
        BOOST_CHECK(what.find("No path from A to B") != std::string::npos);
    }
}

BOOST_AUTO_TEST_SUITE_END(); // class_RailPlannerException

BOOST_AUTO_TEST_SUITE_END(); // rail_planner
