#include "core/errors.hpp"
#include "core/memory_store.hpp"

#include <boost/test/unit_test.hpp>

using namespace spl;

namespace {

struct StoreFixture {
    StoreFixture() {
        Group group;
        group.name = "Flat";
        group.creator = "alice";
        group.members = {"alice", "bob"};
        group_id = store.create_group(group).id;
    }

    MemoryStore store;
    GroupId group_id = 0;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(memory_store_tests, StoreFixture)

BOOST_AUTO_TEST_CASE(directory_view)
{
    std::vector<MemberKey> members = store.list_members(group_id);
    BOOST_REQUIRE_EQUAL(members.size(), 2u);
    BOOST_CHECK_EQUAL(members[0], "alice");

    BOOST_CHECK(store.is_member(group_id, "bob"));
    BOOST_CHECK(!store.is_member(group_id, "carol"));
    BOOST_CHECK(!store.is_member(42, "bob"));
    BOOST_CHECK_THROW(store.list_members(42), UnknownGroup);
}

BOOST_AUTO_TEST_CASE(roster_grows_in_join_order)
{
    BOOST_CHECK(store.add_member(group_id, "carol"));
    BOOST_CHECK(!store.add_member(group_id, "carol"));
    BOOST_CHECK_EQUAL(store.list_members(group_id).back(), "carol");
    BOOST_CHECK_THROW(store.add_member(42, "carol"), UnknownGroup);

    BOOST_CHECK_EQUAL(store.list_groups_for("carol").size(), 1u);
    BOOST_CHECK(store.list_groups_for("dave").empty());
}

BOOST_AUTO_TEST_CASE(records_are_appended_with_ids)
{
    Expense expense;
    expense.group_id = group_id;
    expense.payer = "alice";
    expense.amount = Money(10);
    expense.participants = {"alice", "bob"};

    Expense first = store.append_expense(expense);
    Expense second = store.append_expense(expense);
    BOOST_CHECK(first.id < second.id);
    BOOST_CHECK(first.created_at > 0);
    BOOST_CHECK_EQUAL(store.list_expenses(group_id).size(), 2u);
    BOOST_CHECK(store.list_expenses(42).empty());

    expense.group_id = 42;
    BOOST_CHECK_THROW(store.append_expense(expense), UnknownGroup);
}

BOOST_AUTO_TEST_CASE(settlement_references_are_unique)
{
    Settlement settlement;
    settlement.group_id = group_id;
    settlement.from = "bob";
    settlement.to = "alice";
    settlement.amount = Money(5);
    settlement.external_ref = std::string("0x01");

    Settlement stored = store.append_settlement(settlement);
    BOOST_CHECK_THROW(store.append_settlement(settlement), DuplicateReference);

    BOOST_REQUIRE(store.find_settlement_by_reference("0x01"));
    BOOST_CHECK_EQUAL(store.find_settlement_by_reference("0x01")->id, stored.id);
    BOOST_CHECK(!store.find_settlement_by_reference("0x02"));
    BOOST_CHECK_EQUAL(store.list_settlements(group_id).size(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()
