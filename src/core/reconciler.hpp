/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: reconciler.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Projects the mirror's settlement events onto the advisory ledger. Each
 * DebtSettled event is replayed through record_settlement exactly once,
 * keyed by its transfer reference; a DuplicateReference means the event is
 * already reflected and counts as done.
 * ============================================================================
 */

#ifndef SPL_RECONCILER_HPP
#define SPL_RECONCILER_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ledger_service.hpp"
#include "mirror_contract.hpp"

namespace spl {

    struct ReconcileReport {
        std::size_t events_seen = 0;
        std::size_t recorded = 0;
        std::size_t already_present = 0;
        std::uint64_t cursor = 0;

        // Set when a replay failed; the cursor stays before that event.
        std::optional<std::string> halted_on;
    };

    struct BalanceMismatch {
        MemberKey member;
        Money advisory;
        Money authoritative;
    };

    struct CrossCheckReport {
        GroupId group_id = 0;
        std::vector<BalanceMismatch> mismatches;

        bool consistent() const { return mismatches.empty(); }
    };

    class Reconciler {
    public:
        Reconciler(IMirrorSource& mirror, LedgerService& ledger, std::uint64_t cursor = 0);

        /**
         * @brief Replays every settlement event after the cursor, in order.
         * Stops at the first event that fails for any reason other than a
         * duplicate reference so it is retried on the next run.
         */
        ReconcileReport run();

        std::uint64_t cursor() const;

        /**
         * @brief Compares advisory balances with the mirror's.
         * A member present on only one side is reported against zero.
         */
        CrossCheckReport cross_check(GroupId group_id);

    private:
        IMirrorSource& mirror_;
        LedgerService& ledger_;
        mutable std::mutex mutex_;
        std::uint64_t cursor_;
    };

} // namespace spl

#endif // SPL_RECONCILER_HPP
