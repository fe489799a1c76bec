#ifndef RAIL_PLANNER_FARE_TABLE_H
#define RAIL_PLANNER_FARE_TABLE_H

#include <rail-planner/Network.h>

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace RailPlanner {

/*! \brief Passenger category.
 */
enum class PassengerCategory {
    kAdult,
    kChild,
    kSenior,
    kStudent,
};

/*! \brief Print operator for the `PassengerCategory` class.
 */
std::ostream& operator<<(
    std::ostream& os,
    const PassengerCategory& category
);

/*! \brief Convert `PassengerCategory` to string.
 */
std::string ToString(
    const PassengerCategory& category
);

/*! \brief Convert a string to `PassengerCategory`.
 *
 *  \returns std::nullopt if the string is not a known passenger category.
 */
std::optional<PassengerCategory> ToPassengerCategory(
    const std::string& category
);

/*! \brief Passenger type and its discount.
 *
 *  The age range is informational: Callers use it to check eligibility. The
 *  fare calculator applies the discount to whoever claims the type.
 */
struct PassengerType {
    PassengerCategory category {PassengerCategory::kAdult};
    double discountPercent {0.0};
    std::optional<unsigned int> minAge {};
    std::optional<unsigned int> maxAge {};

    /*! \brief Check if a passenger of the given age qualifies for this type.
     */
    bool IsEligible(
        unsigned int age
    ) const;
};

/*! \brief How a line charges for the stations traversed.
 *
 *  - Zone pricing charges the incremental fare once for each zone boundary
 *    crossed.
 *  - Per-station pricing charges the incremental fare once for each station
 *    advanced.
 */
enum class FarePricing {
    kZone,
    kPerStation,
};

/*! \brief Print operator for the `FarePricing` class.
 */
std::ostream& operator<<(
    std::ostream& os,
    const FarePricing& pricing
);

/*! \brief Convert `FarePricing` to string.
 */
std::string ToString(
    const FarePricing& pricing
);

/*! \brief Convert a string to `FarePricing`.
 *
 *  \returns std::nullopt if the string is not a known pricing scheme.
 */
std::optional<FarePricing> ToFarePricing(
    const std::string& pricing
);

/*! \brief Fare for boarding a line in a given zone.
 */
struct ZoneFare {
    unsigned int zone {1};
    Money baseFare {0.0};
    Money incrementalFare {0.0};
};

/*! \brief All the zone fares of a line.
 */
struct LineFareRule {
    Id lineId {};
    FarePricing pricing {FarePricing::kZone};
    std::vector<ZoneFare> zones {};
};

/*! \brief Group discount for groups of at least `minGroupSize` passengers.
 */
struct GroupDiscountBracket {
    unsigned int minGroupSize {1};
    double discountPercent {0.0};
};

/*! \brief Immutable fare lookup table.
 *
 *  Line fares are flattened into a table keyed by (line, zone) when the table
 *  is built.
 */
class FareTable {
public:
    /*! \brief Build a fare table for a network.
     *
     *  \param network The network the fares apply to. The table does not keep
     *                 a reference to it.
     *
     *  Group brackets are sorted by `minGroupSize`. Once sorted, their
     *  discount percentages must be non-decreasing, so a larger group never
     *  pays more per head than a smaller one. Equal percentages in
     *  consecutive brackets are allowed. Brackets may be given in any order.
     *
     *  \throws IntegrityError if a rule references an unknown line, if a zone
     *                         of a station served by an active line has no
     *                         fare, if a passenger type is duplicated or has
     *                         an invalid discount, if two group brackets have
     *                         the same or a zero `minGroupSize`, or if a
     *                         bracket for larger groups has a lower discount
     *                         than one for smaller groups.
     */
    static FareTable Build(
        const std::vector<LineFareRule>& fareRules,
        const std::vector<PassengerType>& passengerTypes,
        const std::vector<GroupDiscountBracket>& groupDiscounts,
        const NetworkSnapshot& network
    );

    /*! \brief Find the fare for boarding a line in a zone.
     *
     *  \returns nullptr if there is no such fare.
     */
    const ZoneFare* FindZoneFare(
        const Id& lineId,
        unsigned int zone
    ) const;

    /*! \brief Get the pricing scheme of a line.
     *
     *  \returns std::nullopt if the line has no fare rule.
     */
    std::optional<FarePricing> GetPricing(
        const Id& lineId
    ) const;

    /*! \brief Find a passenger type by category.
     *
     *  \returns nullptr if the category has no passenger type.
     */
    const PassengerType* FindPassengerType(
        PassengerCategory category
    ) const;

    /*! \brief Discount percentage for a group of the given size.
     *
     *  \returns 0 if the group is smaller than the smallest bracket.
     */
    double GetGroupDiscountPercent(
        unsigned int groupSize
    ) const;

    /*! \brief Group discount brackets, sorted by group size.
     */
    const std::vector<GroupDiscountBracket>& GetGroupDiscounts() const;

private:
    FareTable() = default;

    struct ZoneKey {
        Id lineId {};
        unsigned int zone {0};

        bool operator==(const ZoneKey& other) const;
    };

    struct ZoneKeyHash {
        size_t operator()(const ZoneKey& key) const;
    };

    std::unordered_map<ZoneKey, ZoneFare, ZoneKeyHash> zoneFares_ {};
    std::unordered_map<Id, FarePricing> pricing_ {};
    std::unordered_map<PassengerCategory, PassengerType> passengerTypes_ {};
    std::vector<GroupDiscountBracket> groupDiscounts_ {};
};

} // namespace RailPlanner

#endif // RAIL_PLANNER_FARE_TABLE_H
