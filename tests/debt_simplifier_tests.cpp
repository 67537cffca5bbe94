#include "core/debt_simplifier.hpp"
#include "core/errors.hpp"
#include "test_fixtures.hpp"

#include <boost/test/unit_test.hpp>

#include <map>

using namespace spl;
using namespace spl_test;

namespace {

BalanceSnapshot snapshot(const std::vector<std::pair<MemberKey, std::int64_t>>& balances) {
    std::vector<BalanceSnapshot::Entry> entries;
    for (const auto& pair : balances) {
        entries.push_back({pair.first, Money(pair.second)});
    }
    return BalanceSnapshot(1, entries);
}

void check_debt(const SimplifiedDebt& debt, const MemberKey& from, const MemberKey& to, std::int64_t amount) {
    BOOST_CHECK_EQUAL(debt.from, from);
    BOOST_CHECK_EQUAL(debt.to, to);
    BOOST_CHECK_EQUAL(debt.amount, Money(amount));
}

// Applying the plan must zero every balance.
void check_plan_settles(const BalanceSnapshot& balances, const std::vector<SimplifiedDebt>& debts) {
    std::map<MemberKey, Money> remaining;
    for (const auto& entry : balances.entries()) {
        remaining[entry.member] = entry.balance;
    }
    for (const auto& debt : debts) {
        BOOST_CHECK(debt.amount.is_positive());
        BOOST_CHECK(debt.from != debt.to);
        remaining[debt.from] += debt.amount;
        remaining[debt.to] -= debt.amount;
    }
    for (const auto& pair : remaining) {
        BOOST_CHECK_MESSAGE(pair.second.is_zero(), pair.first << " left at " << pair.second);
    }
}

} // namespace

BOOST_AUTO_TEST_SUITE(debt_simplifier_tests)

BOOST_AUTO_TEST_CASE(one_creditor_two_debtors)
{
    BalanceSnapshot balances = snapshot({{"alice", 100}, {"bob", -50}, {"charlie", -50}});

    std::vector<SimplifiedDebt> debts = simplify_debts(balances);
    BOOST_REQUIRE_EQUAL(debts.size(), 2u);
    check_debt(debts[0], "bob", "alice", 50);
    check_debt(debts[1], "charlie", "alice", 50);
}

BOOST_AUTO_TEST_CASE(largest_debtor_pays_first)
{
    BalanceSnapshot balances = snapshot({{"alice", 80}, {"bob", -10}, {"charlie", -70}});

    std::vector<SimplifiedDebt> debts = simplify_debts(balances);
    BOOST_REQUIRE_EQUAL(debts.size(), 2u);
    check_debt(debts[0], "charlie", "alice", 70);
    check_debt(debts[1], "bob", "alice", 10);
}

BOOST_AUTO_TEST_CASE(all_zero_gives_empty_plan)
{
    BOOST_CHECK(simplify_debts(snapshot({{"alice", 0}, {"bob", 0}})).empty());
    BOOST_CHECK(simplify_debts(snapshot({})).empty());
}

BOOST_AUTO_TEST_CASE(ties_resolve_by_enumeration_order)
{
    BalanceSnapshot balances = snapshot({{"dave", -30}, {"alice", 30}, {"carol", -30}, {"bob", 30}});

    std::vector<SimplifiedDebt> debts = simplify_debts(balances);
    BOOST_REQUIRE_EQUAL(debts.size(), 2u);
    check_debt(debts[0], "dave", "alice", 30);
    check_debt(debts[1], "carol", "bob", 30);

    // Same input, same plan.
    std::vector<SimplifiedDebt> again = simplify_debts(balances);
    BOOST_CHECK(debts == again);
}

BOOST_AUTO_TEST_CASE(plan_is_bounded_and_conserves_value)
{
    BalanceSnapshot balances = snapshot({
        {"a", 120}, {"b", -45}, {"c", 33}, {"d", -61}, {"e", -17}, {"f", 9}, {"g", -39}
    });

    std::vector<SimplifiedDebt> debts = simplify_debts(balances);
    BOOST_CHECK_LE(debts.size(), balances.nonzero_count() - 1);
    check_plan_settles(balances, debts);

    Money credited;
    for (const auto& debt : debts) credited += debt.amount;
    BOOST_CHECK_EQUAL(credited, Money(162));
}

BOOST_AUTO_TEST_CASE(arbitrary_precision_amounts)
{
    Money huge = Money::from_string("340282366920938463463374607431768211456");
    std::vector<BalanceSnapshot::Entry> entries{{"alice", huge}, {"bob", -huge}};

    std::vector<SimplifiedDebt> debts = simplify_debts(BalanceSnapshot(7, entries));
    BOOST_REQUIRE_EQUAL(debts.size(), 1u);
    BOOST_CHECK_EQUAL(debts[0].amount, huge);
}

BOOST_AUTO_TEST_CASE(unbalanced_snapshot_is_corruption)
{
    BOOST_CHECK_THROW(simplify_debts(snapshot({{"alice", 100}, {"bob", -99}})), LedgerCorruption);
}

BOOST_AUTO_TEST_CASE(filter_by_member_keeps_plan_order)
{
    BalanceSnapshot balances = snapshot({{"alice", 80}, {"bob", -10}, {"charlie", -70}});
    std::vector<SimplifiedDebt> debts = simplify_debts(balances);

    std::vector<SimplifiedDebt> bob_only = debts_involving(debts, "bob");
    BOOST_REQUIRE_EQUAL(bob_only.size(), 1u);
    check_debt(bob_only[0], "bob", "alice", 10);

    BOOST_CHECK_EQUAL(debts_involving(debts, "alice").size(), 2u);
    BOOST_CHECK(debts_involving(debts, "mallory").empty());
}

BOOST_AUTO_TEST_SUITE_END()
