/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: balance_aggregator.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Folds a group's expense and settlement history into one signed net
 * balance per member. Positive means the member is owed, negative means the
 * member owes. The fold is pure: every call returns a fresh, immutable
 * snapshot and nothing is cached between calls.
 * ============================================================================
 */

#ifndef SPL_BALANCE_AGGREGATOR_HPP
#define SPL_BALANCE_AGGREGATOR_HPP

#include <cstddef>
#include <vector>

#include "types.hpp"

namespace spl {

    /**
     * @brief Immutable per-member balance map of one group.
     * Entries follow the roster's enumeration order.
     */
    class BalanceSnapshot {
    public:
        struct Entry {
            MemberKey member;
            Money balance;
        };

        BalanceSnapshot(GroupId group_id, std::vector<Entry> entries);

        GroupId group_id() const { return group_id_; }
        const std::vector<Entry>& entries() const { return entries_; }

        bool contains(const MemberKey& member) const;

        /**
         * @throws NotAGroupMember if the member is not part of the snapshot.
         */
        Money balance_of(const MemberKey& member) const;

        // Always zero for a consistent ledger.
        Money total() const;

        std::size_t nonzero_count() const;

    private:
        GroupId group_id_;
        std::vector<Entry> entries_;
    };

    /**
     * @brief Uncredited floor-division remainder of a single expense.
     */
    struct RoundingEntry {
        RecordId expense_id = 0;
        Money amount;
        std::size_t participants = 0;
        Money share;
        Money remainder;
    };

    struct RoundingReport {
        GroupId group_id = 0;
        std::vector<RoundingEntry> entries;
        Money total_remainder;
    };

    /**
     * @brief Rejects an expense that could not be folded: unknown payer or
     * participant, non-positive amount, empty or repeated participants.
     * Nothing is mutated when this throws.
     */
    void validate_expense(const Group& group, const Expense& expense);

    void validate_settlement(const Group& group, const Settlement& settlement);

    /**
     * @brief Computes every member's net balance.
     *
     * Each expense debits `share = amount / participants` (floor) from every
     * participant, the payer included when the payer took part, and credits
     * the payer with `share * participants`. The remainder of the division is
     * credited to no one, which keeps the sum of all balances at exactly
     * zero. Each settlement credits `from` and debits `to` by its amount.
     *
     * The result does not depend on the order of the records.
     */
    BalanceSnapshot compute_balances(const Group& group,
                                     const std::vector<Expense>& expenses,
                                     const std::vector<Settlement>& settlements);

    // Only expenses with a non-zero remainder are listed.
    RoundingReport rounding_report(const Group& group, const std::vector<Expense>& expenses);

} // namespace spl

#endif // SPL_BALANCE_AGGREGATOR_HPP
