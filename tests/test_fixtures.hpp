#ifndef SPL_TEST_FIXTURES_HPP
#define SPL_TEST_FIXTURES_HPP

#include "core/balance_aggregator.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace spl_test {

// Display amount in ETH to base units.
inline spl::Money eth(const std::string& display) {
    return spl::Money::from_decimal(display, 18);
}

inline spl::Group make_group(spl::GroupId id, const std::vector<spl::MemberKey>& members) {
    spl::Group group;
    group.id = id;
    group.name = "Trip Fund";
    group.creator = members.front();
    group.members = members;
    return group;
}

inline spl::Expense make_expense(spl::RecordId id, spl::GroupId group_id, const spl::MemberKey& payer,
                                 const spl::Money& amount, const std::vector<spl::MemberKey>& participants) {
    spl::Expense expense;
    expense.id = id;
    expense.group_id = group_id;
    expense.payer = payer;
    expense.amount = amount;
    expense.description = "expense " + std::to_string(id);
    expense.participants = participants;
    return expense;
}

inline spl::Settlement make_settlement(spl::RecordId id, spl::GroupId group_id, const spl::MemberKey& from,
                                       const spl::MemberKey& to, const spl::Money& amount) {
    spl::Settlement settlement;
    settlement.id = id;
    settlement.group_id = group_id;
    settlement.from = from;
    settlement.to = to;
    settlement.amount = amount;
    settlement.external_ref = "ref-" + std::to_string(id);
    return settlement;
}

} // namespace spl_test

#endif // SPL_TEST_FIXTURES_HPP
