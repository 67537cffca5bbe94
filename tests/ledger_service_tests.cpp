#include "core/errors.hpp"
#include "core/ledger_service.hpp"
#include "core/memory_store.hpp"

#include <boost/test/unit_test.hpp>

using namespace spl;

namespace {

const std::string ALICE = "0xaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa";
const std::string BOB = "0xbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb";
const std::string CHARLIE = "0xcccccccccccccccccccccccccccccccccccccccc";
const std::string OUTSIDER = "0xdddddddddddddddddddddddddddddddddddddddd";

struct ServiceFixture {
    ServiceFixture() : service(store) {
        group_id = service.create_group("Beach Trip", ALICE, {BOB, CHARLIE}).id;
    }

    std::vector<MemberKey> everyone() const { return {ALICE, BOB, CHARLIE}; }

    MemoryStore store;
    LedgerService service;
    GroupId group_id = 0;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(ledger_service_tests, ServiceFixture)

BOOST_AUTO_TEST_CASE(member_keys_are_normalized)
{
    BOOST_CHECK_EQUAL(normalize_member_key("0xAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA"), ALICE);
    BOOST_CHECK_EQUAL(normalize_member_key("Alice"), "alice");
    BOOST_CHECK_THROW(normalize_member_key(""), InvalidRecord);
    BOOST_CHECK_THROW(normalize_member_key("0x1234"), InvalidRecord);
    BOOST_CHECK_THROW(normalize_member_key("0xzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzz"), InvalidRecord);
}

BOOST_AUTO_TEST_CASE(creator_comes_first_and_duplicates_are_dropped)
{
    Group group = service.create_group("Roommates", BOB, {ALICE, "0xBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBBB", ALICE});
    BOOST_REQUIRE_EQUAL(group.members.size(), 2u);
    BOOST_CHECK_EQUAL(group.members[0], BOB);
    BOOST_CHECK_EQUAL(group.members[1], ALICE);
    BOOST_CHECK_EQUAL(group.creator, BOB);

    BOOST_CHECK_THROW(service.create_group("", ALICE, {}), InvalidRecord);
}

BOOST_AUTO_TEST_CASE(group_lookup_and_membership)
{
    Group group = service.get_group(group_id);
    BOOST_CHECK_EQUAL(group.name, "Beach Trip");
    BOOST_CHECK_EQUAL(group.members.size(), 3u);
    BOOST_CHECK(group.active);

    BOOST_CHECK_THROW(service.get_group(999), UnknownGroup);
    BOOST_CHECK_EQUAL(service.members_of(group_id).front(), ALICE);
    BOOST_CHECK_THROW(service.members_of(999), UnknownGroup);

    service.add_member(group_id, OUTSIDER);
    BOOST_CHECK_EQUAL(service.get_group(group_id).members.back(), OUTSIDER);
    BOOST_CHECK_EXCEPTION(service.add_member(group_id, BOB), InvalidRecord,
                          [](const InvalidRecord& e) { return std::string(e.what()) == "Already a member"; });
    BOOST_CHECK_THROW(service.add_member(999, BOB), UnknownGroup);

    service.create_group("Second", CHARLIE, {});
    BOOST_CHECK_EQUAL(service.groups_for(CHARLIE).size(), 2u);
    BOOST_CHECK_EQUAL(service.groups_for(ALICE).size(), 1u);
}

BOOST_AUTO_TEST_CASE(expenses_drive_balances_and_debts)
{
    service.add_expense(group_id, ALICE, Money(150), "Hotel", everyone());

    BalanceSnapshot balances = service.get_balances(group_id);
    BOOST_CHECK_EQUAL(balances.balance_of(ALICE), Money(100));
    BOOST_CHECK_EQUAL(balances.balance_of(BOB), Money(-50));
    BOOST_CHECK_EQUAL(balances.balance_of(CHARLIE), Money(-50));

    std::vector<SimplifiedDebt> debts = service.get_simplified_debts(group_id);
    BOOST_REQUIRE_EQUAL(debts.size(), 2u);
    BOOST_CHECK_EQUAL(debts[0].from, BOB);
    BOOST_CHECK_EQUAL(debts[1].from, CHARLIE);

    service.add_expense(group_id, BOB, Money(60), "Dinner", everyone());
    debts = service.get_simplified_debts(group_id);
    BOOST_REQUIRE_EQUAL(debts.size(), 2u);
    BOOST_CHECK_EQUAL(debts[0].from, CHARLIE);
    BOOST_CHECK_EQUAL(debts[0].amount, Money(70));
    BOOST_CHECK_EQUAL(debts[1].from, BOB);
    BOOST_CHECK_EQUAL(debts[1].amount, Money(10));

    std::vector<SimplifiedDebt> bobs = service.get_simplified_debts(group_id, BOB);
    BOOST_REQUIRE_EQUAL(bobs.size(), 1u);
    BOOST_CHECK_EQUAL(bobs[0].to, ALICE);
    BOOST_CHECK_THROW(service.get_simplified_debts(group_id, OUTSIDER), NotAGroupMember);

    BOOST_CHECK_EQUAL(service.list_expenses(group_id).size(), 2u);
}

BOOST_AUTO_TEST_CASE(rejected_expense_leaves_no_trace)
{
    BOOST_CHECK_THROW(service.add_expense(group_id, OUTSIDER, Money(10), "Dinner", {ALICE}), NotAGroupMember);
    BOOST_CHECK_THROW(service.add_expense(group_id, ALICE, Money(10), "Dinner", {OUTSIDER}), NotAGroupMember);
    BOOST_CHECK_THROW(service.add_expense(group_id, ALICE, Money(0), "Dinner", {BOB}), InvalidAmount);
    BOOST_CHECK_THROW(service.add_expense(999, ALICE, Money(10), "Dinner", {BOB}), UnknownGroup);

    BOOST_CHECK(service.list_expenses(group_id).empty());
    BOOST_CHECK_EQUAL(service.get_balances(group_id).nonzero_count(), 0u);
}

BOOST_AUTO_TEST_CASE(settlement_clears_debt)
{
    service.add_expense(group_id, ALICE, Money(150), "Hotel", everyone());
    service.record_settlement(group_id, BOB, ALICE, Money(50), std::string("0xfeed"));

    BalanceSnapshot balances = service.get_balances(group_id);
    BOOST_CHECK_EQUAL(balances.balance_of(BOB), Money(0));
    BOOST_CHECK_EQUAL(balances.balance_of(ALICE), Money(50));

    std::vector<SimplifiedDebt> debts = service.get_simplified_debts(group_id);
    BOOST_REQUIRE_EQUAL(debts.size(), 1u);
    BOOST_CHECK_EQUAL(debts[0].from, CHARLIE);

    BOOST_CHECK_THROW(service.record_settlement(group_id, BOB, ALICE, Money(50), std::string("0xfeed")),
                      DuplicateReference);
    BOOST_CHECK_EQUAL(service.list_settlements(group_id).size(), 1u);
    BOOST_CHECK(service.verify_settlements(group_id).intact);
}

BOOST_AUTO_TEST_CASE(rounding_report_lists_uncredited_units)
{
    service.add_expense(group_id, ALICE, Money(100), "Taxi", everyone());
    service.add_expense(group_id, BOB, Money(90), "Lunch", everyone());

    RoundingReport report = service.rounding_report(group_id);
    BOOST_REQUIRE_EQUAL(report.entries.size(), 1u);
    BOOST_CHECK_EQUAL(report.entries[0].remainder, Money(1));
    BOOST_CHECK_EQUAL(report.total_remainder, Money(1));
    BOOST_CHECK_EQUAL(service.get_balances(group_id).total(), Money(0));
}

BOOST_AUTO_TEST_SUITE_END()
