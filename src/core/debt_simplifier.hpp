/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: debt_simplifier.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Reduces a balance snapshot to the smallest ordered list of
 * debtor -> creditor transfers that zeroes every balance.
 * ============================================================================
 */

#ifndef SPL_DEBT_SIMPLIFIER_HPP
#define SPL_DEBT_SIMPLIFIER_HPP

#include <vector>

#include "balance_aggregator.hpp"

namespace spl {

    /**
     * @brief Greedy largest-to-largest matching.
     *
     * Repeatedly pairs the creditor with the largest remaining credit and the
     * debtor with the largest remaining debt, settles the smaller of the two
     * and retires whoever reaches zero. Equal amounts are resolved by the
     * snapshot's enumeration order, earliest member first, so the plan is
     * reproducible. At most n - 1 entries for n non-zero balances.
     *
     * Pure: never touches the settlement ledger.
     *
     * @throws LedgerCorruption if the balances do not sum to zero.
     */
    std::vector<SimplifiedDebt> simplify_debts(const BalanceSnapshot& balances);

    // Keeps the entries where `member` pays or is paid, in plan order.
    std::vector<SimplifiedDebt> debts_involving(const std::vector<SimplifiedDebt>& debts, const MemberKey& member);

} // namespace spl

#endif // SPL_DEBT_SIMPLIFIER_HPP
