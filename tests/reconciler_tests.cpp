#include "core/errors.hpp"
#include "core/ledger_service.hpp"
#include "core/memory_store.hpp"
#include "core/mirror_contract.hpp"
#include "core/reconciler.hpp"
#include "core/wallet_book.hpp"

#include <boost/test/unit_test.hpp>

using namespace spl;

namespace {

const MemberKey ALICE = "0xaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa";
const MemberKey BOB = "0xbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb";
const MemberKey CHARLIE = "0xcccccccccccccccccccccccccccccccccccccccc";

// Same group on both sides, same history.
struct ReconcileFixture {
    ReconcileFixture() : service(store), mirror(wallets) {
        wallets.fund(BOB, Money(1000));
        wallets.fund(CHARLIE, Money(1000));

        group_id = service.create_group("Trip", ALICE, {BOB, CHARLIE}).id;
        GroupId mirrored = mirror.create_group(ALICE, "Trip", {BOB, CHARLIE});
        BOOST_REQUIRE_EQUAL(group_id, mirrored);

        service.add_expense(group_id, ALICE, Money(150), "Hotel", {ALICE, BOB, CHARLIE});
        mirror.add_expense(ALICE, group_id, Money(150), "Hotel", {ALICE, BOB, CHARLIE});
    }

    MemoryStore store;
    LedgerService service;
    WalletBook wallets;
    MirrorContract mirror;
    GroupId group_id = 0;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(reconciler_tests, ReconcileFixture)

BOOST_AUTO_TEST_CASE(projects_mirror_settlements_onto_the_ledger)
{
    Reconciler reconciler(mirror, service);
    TransferReceipt receipt = mirror.settle(BOB, group_id, ALICE, Money(50));

    BOOST_CHECK(!reconciler.cross_check(group_id).consistent());

    ReconcileReport report = reconciler.run();
    BOOST_CHECK_EQUAL(report.events_seen, 1u);
    BOOST_CHECK_EQUAL(report.recorded, 1u);
    BOOST_CHECK_EQUAL(report.already_present, 0u);
    BOOST_CHECK(!report.halted_on);
    BOOST_CHECK(report.cursor > 0u);
    BOOST_CHECK_EQUAL(reconciler.cursor(), report.cursor);

    std::vector<Settlement> settlements = service.list_settlements(group_id);
    BOOST_REQUIRE_EQUAL(settlements.size(), 1u);
    BOOST_CHECK_EQUAL(settlements[0].from, BOB);
    BOOST_CHECK_EQUAL(settlements[0].to, ALICE);
    BOOST_REQUIRE(settlements[0].external_ref);
    BOOST_CHECK_EQUAL(*settlements[0].external_ref, receipt.reference);

    CrossCheckReport check = reconciler.cross_check(group_id);
    BOOST_CHECK(check.consistent());
}

BOOST_AUTO_TEST_CASE(second_run_sees_nothing_new)
{
    Reconciler reconciler(mirror, service);
    mirror.settle(BOB, group_id, ALICE, Money(50));
    reconciler.run();

    ReconcileReport again = reconciler.run();
    BOOST_CHECK_EQUAL(again.events_seen, 0u);
    BOOST_CHECK_EQUAL(again.recorded, 0u);
    BOOST_CHECK_EQUAL(service.list_settlements(group_id).size(), 1u);
}

BOOST_AUTO_TEST_CASE(replay_from_the_start_is_idempotent)
{
    mirror.settle(BOB, group_id, ALICE, Money(50));
    mirror.settle(CHARLIE, group_id, ALICE, Money(20));

    Reconciler first(mirror, service);
    BOOST_CHECK_EQUAL(first.run().recorded, 2u);

    // A fresh reconciler with a lost cursor replays everything.
    Reconciler restarted(mirror, service);
    ReconcileReport report = restarted.run();
    BOOST_CHECK_EQUAL(report.events_seen, 2u);
    BOOST_CHECK_EQUAL(report.recorded, 0u);
    BOOST_CHECK_EQUAL(report.already_present, 2u);
    BOOST_CHECK_EQUAL(report.cursor, first.cursor());

    BOOST_CHECK_EQUAL(service.list_settlements(group_id).size(), 2u);
    BOOST_CHECK(restarted.cross_check(group_id).consistent());
}

BOOST_AUTO_TEST_CASE(halts_on_failure_and_resumes_later)
{
    GroupId orphan = mirror.create_group(ALICE, "Orphan", {BOB});
    mirror.add_expense(ALICE, orphan, Money(100), "Rent", {ALICE, BOB});
    mirror.settle(BOB, orphan, ALICE, Money(50));
    mirror.settle(CHARLIE, group_id, ALICE, Money(50));

    Reconciler reconciler(mirror, service);
    ReconcileReport halted = reconciler.run();
    BOOST_CHECK_EQUAL(halted.events_seen, 1u);
    BOOST_CHECK_EQUAL(halted.recorded, 0u);
    BOOST_CHECK(halted.halted_on);
    BOOST_CHECK_EQUAL(halted.cursor, 0u);
    BOOST_CHECK(service.list_settlements(group_id).empty());

    // Once the advisory side knows the group the same events go through.
    GroupId created = service.create_group("Orphan", ALICE, {BOB}).id;
    BOOST_REQUIRE_EQUAL(created, orphan);

    ReconcileReport resumed = reconciler.run();
    BOOST_CHECK_EQUAL(resumed.recorded, 2u);
    BOOST_CHECK(!resumed.halted_on);
    BOOST_CHECK_EQUAL(service.list_settlements(group_id).size(), 1u);
    BOOST_CHECK_EQUAL(service.list_settlements(orphan).size(), 1u);
}

BOOST_AUTO_TEST_CASE(cross_check_reports_each_divergent_member)
{
    service.add_expense(group_id, BOB, Money(60), "Dinner", {ALICE, BOB, CHARLIE});

    Reconciler reconciler(mirror, service);
    CrossCheckReport report = reconciler.cross_check(group_id);
    BOOST_CHECK(!report.consistent());
    BOOST_CHECK_EQUAL(report.group_id, group_id);
    BOOST_REQUIRE_EQUAL(report.mismatches.size(), 3u);
    BOOST_CHECK_EQUAL(report.mismatches[1].member, BOB);
    BOOST_CHECK_EQUAL(report.mismatches[1].advisory, Money(-10));
    BOOST_CHECK_EQUAL(report.mismatches[1].authoritative, Money(-50));
}

BOOST_AUTO_TEST_SUITE_END()
