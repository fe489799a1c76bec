#include <rail-planner/Errors.h>
#include <rail-planner/FareTable.h>
#include <rail-planner/Network.h>

#include <boost/bimap.hpp>
#include <boost/container_hash/hash.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

using RailPlanner::FarePricing;
using RailPlanner::FareTable;
using RailPlanner::GroupDiscountBracket;
using RailPlanner::Id;
using RailPlanner::IntegrityError;
using RailPlanner::LineFareRule;
using RailPlanner::LineStatus;
using RailPlanner::NetworkSnapshot;
using RailPlanner::PassengerCategory;
using RailPlanner::PassengerType;
using RailPlanner::ZoneFare;

// Utility function to generate a boost::bimap.
template <typename L, typename R>
static boost::bimap<L, R> MakeBimap(
    std::initializer_list<typename boost::bimap<L, R>::value_type> list
)
{
    return boost::bimap<L, R>(list.begin(), list.end());
}

static bool IsValidPercent(double percent)
{
    return percent >= 0.0 && percent <= 100.0;
}

// PassengerCategory

static const auto gPassengerCategoryStrings {
    MakeBimap<PassengerCategory, std::string_view>({
        {PassengerCategory::kAdult  , "adult"  },
        {PassengerCategory::kChild  , "child"  },
        {PassengerCategory::kSenior , "senior" },
        {PassengerCategory::kStudent, "student"},
    })
};

std::ostream& RailPlanner::operator<<(
    std::ostream& os,
    const PassengerCategory& category
)
{
    return os << ToString(category);
}

std::string RailPlanner::ToString(
    const PassengerCategory& category
)
{
    auto categoryIt {gPassengerCategoryStrings.left.find(category)};
    if (categoryIt == gPassengerCategoryStrings.left.end()) {
        return "PassengerCategory::kInvalid";
    }
    return std::string(categoryIt->second);
}

std::optional<PassengerCategory> RailPlanner::ToPassengerCategory(
    const std::string& category
)
{
    auto categoryIt {gPassengerCategoryStrings.right.find(category)};
    if (categoryIt == gPassengerCategoryStrings.right.end()) {
        return std::nullopt;
    }
    return categoryIt->second;
}

// PassengerType — Public methods

bool PassengerType::IsEligible(
    unsigned int age
) const
{
    if (minAge && age < *minAge) {
        return false;
    }
    if (maxAge && age > *maxAge) {
        return false;
    }
    return true;
}

// FarePricing

static const auto gFarePricingStrings {
    MakeBimap<FarePricing, std::string_view>({
        {FarePricing::kZone      , "zone"       },
        {FarePricing::kPerStation, "per_station"},
    })
};

std::ostream& RailPlanner::operator<<(
    std::ostream& os,
    const FarePricing& pricing
)
{
    return os << ToString(pricing);
}

std::string RailPlanner::ToString(
    const FarePricing& pricing
)
{
    auto pricingIt {gFarePricingStrings.left.find(pricing)};
    if (pricingIt == gFarePricingStrings.left.end()) {
        return "FarePricing::kInvalid";
    }
    return std::string(pricingIt->second);
}

std::optional<FarePricing> RailPlanner::ToFarePricing(
    const std::string& pricing
)
{
    auto pricingIt {gFarePricingStrings.right.find(pricing)};
    if (pricingIt == gFarePricingStrings.right.end()) {
        return std::nullopt;
    }
    return pricingIt->second;
}

// FareTable — Public methods

FareTable FareTable::Build(
    const std::vector<LineFareRule>& fareRules,
    const std::vector<PassengerType>& passengerTypes,
    const std::vector<GroupDiscountBracket>& groupDiscounts,
    const NetworkSnapshot& network
)
{
    FareTable table {};

    // Line fares
    for (const auto& rule: fareRules) {
        if (network.FindLine(rule.lineId) == nullptr) {
            throw IntegrityError("Fare rule for unknown line " + rule.lineId);
        }
        if (!table.pricing_.emplace(rule.lineId, rule.pricing).second) {
            throw IntegrityError("Duplicate fare rule for line " +
                                 rule.lineId);
        }
        for (const auto& zoneFare: rule.zones) {
            if (zoneFare.baseFare < 0.0 || zoneFare.incrementalFare < 0.0) {
                throw IntegrityError("Negative fare for line " + rule.lineId);
            }
            auto inserted {table.zoneFares_.emplace(
                ZoneKey {rule.lineId, zoneFare.zone},
                zoneFare
            ).second};
            if (!inserted) {
                throw IntegrityError("Duplicate fare for line " + rule.lineId +
                                     " zone " + std::to_string(zoneFare.zone));
            }
        }
    }

    // Every zone served by an active line must have a fare. We check this now
    // so that a gap in the data never shows up as a free ride later on.
    for (const auto& line: network.GetLines()) {
        if (line.status != LineStatus::kActive) {
            continue;
        }
        for (const auto& stopId: line.stops) {
            const auto station {network.FindStation(stopId)};
            if (station == std::nullopt) {
                // Unexpected: the network checks its own stops.
                throw IntegrityError("Unknown station " + stopId);
            }
            const auto zone {network.GetStation(*station).zone};
            if (table.FindZoneFare(line.id, zone) == nullptr) {
                throw IntegrityError("No fare for line " + line.id +
                                     " zone " + std::to_string(zone));
            }
        }
    }

    // Passenger types
    for (const auto& type: passengerTypes) {
        if (!IsValidPercent(type.discountPercent)) {
            throw IntegrityError("Invalid discount for passenger type " +
                                 ToString(type.category));
        }
        if (type.minAge && type.maxAge && *type.minAge > *type.maxAge) {
            throw IntegrityError("Invalid age range for passenger type " +
                                 ToString(type.category));
        }
        if (!table.passengerTypes_.emplace(type.category, type).second) {
            throw IntegrityError("Duplicate passenger type " +
                                 ToString(type.category));
        }
    }

    // Group discounts
    // Larger groups never get a smaller discount.
    table.groupDiscounts_ = groupDiscounts;
    std::sort(
        table.groupDiscounts_.begin(),
        table.groupDiscounts_.end(),
        [](const auto& a, const auto& b) {
            return a.minGroupSize < b.minGroupSize;
        }
    );
    for (size_t idx {0}; idx < table.groupDiscounts_.size(); ++idx) {
        const auto& bracket {table.groupDiscounts_[idx]};
        if (bracket.minGroupSize == 0 ||
            !IsValidPercent(bracket.discountPercent)) {
            throw IntegrityError("Invalid group discount bracket");
        }
        if (idx == 0) {
            continue;
        }
        const auto& previous {table.groupDiscounts_[idx - 1]};
        if (previous.minGroupSize == bracket.minGroupSize) {
            throw IntegrityError("Duplicate group discount bracket for " +
                                 std::to_string(bracket.minGroupSize) +
                                 " passengers");
        }
        if (previous.discountPercent > bracket.discountPercent) {
            throw IntegrityError("Group discounts must not decrease with the "
                                 "group size");
        }
    }

    spdlog::info("FareTable: Built {} zone fares, {} passenger types, "
                 "{} group brackets",
                 table.zoneFares_.size(), table.passengerTypes_.size(),
                 table.groupDiscounts_.size());
    return table;
}

const ZoneFare* FareTable::FindZoneFare(
    const Id& lineId,
    unsigned int zone
) const
{
    auto fareIt {zoneFares_.find(ZoneKey {lineId, zone})};
    if (fareIt == zoneFares_.end()) {
        return nullptr;
    }
    return &fareIt->second;
}

std::optional<FarePricing> FareTable::GetPricing(
    const Id& lineId
) const
{
    auto pricingIt {pricing_.find(lineId)};
    if (pricingIt == pricing_.end()) {
        return std::nullopt;
    }
    return pricingIt->second;
}

const PassengerType* FareTable::FindPassengerType(
    PassengerCategory category
) const
{
    auto typeIt {passengerTypes_.find(category)};
    if (typeIt == passengerTypes_.end()) {
        return nullptr;
    }
    return &typeIt->second;
}

double FareTable::GetGroupDiscountPercent(
    unsigned int groupSize
) const
{
    // Brackets are sorted: the last one that fits is the largest.
    double discountPercent {0.0};
    for (const auto& bracket: groupDiscounts_) {
        if (bracket.minGroupSize > groupSize) {
            break;
        }
        discountPercent = bracket.discountPercent;
    }
    return discountPercent;
}

const std::vector<GroupDiscountBracket>& FareTable::GetGroupDiscounts() const
{
    return groupDiscounts_;
}

// FareTable — Private methods

bool FareTable::ZoneKey::operator==(
    const FareTable::ZoneKey& other
) const
{
    return lineId == other.lineId && zone == other.zone;
}

size_t FareTable::ZoneKeyHash::operator()(
    const FareTable::ZoneKey& key
) const
{
    size_t seed {0};
    boost::hash_combine(seed, key.lineId);
    boost::hash_combine(seed, key.zone);
    return seed;
}
