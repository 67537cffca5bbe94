/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: debt_simplifier.cpp
 * ============================================================================
 */

#include "debt_simplifier.hpp"
#include "errors.hpp"

#include <algorithm>
#include <iterator>

namespace spl {

namespace {

struct Party {
    MemberKey member;
    Money remaining;
};

// First party with the largest remaining amount; ties go to the earlier one.
std::vector<Party>::iterator largest(std::vector<Party>& parties) {
    return std::max_element(parties.begin(), parties.end(),
                            [](const Party& a, const Party& b) { return a.remaining < b.remaining; });
}

} // namespace

std::vector<SimplifiedDebt> simplify_debts(const BalanceSnapshot& balances) {
    Money total = balances.total();
    if (!total.is_zero()) {
        throw LedgerCorruption("Balances of group " + std::to_string(balances.group_id()) +
                               " do not sum to zero (off by " + total.to_string() + ")");
    }

    // 1. Partition into creditors and debtors, debts kept as magnitudes
    std::vector<Party> creditors;
    std::vector<Party> debtors;
    for (const auto& entry : balances.entries()) {
        if (entry.balance.is_positive()) {
            creditors.push_back({entry.member, entry.balance});
        } else if (entry.balance.is_negative()) {
            debtors.push_back({entry.member, entry.balance.magnitude()});
        }
    }

    // 2. Match largest with largest until one side is exhausted
    std::vector<SimplifiedDebt> debts;
    while (!creditors.empty() && !debtors.empty()) {
        auto creditor = largest(creditors);
        auto debtor = largest(debtors);

        Money amount = spl::min(creditor->remaining, debtor->remaining);
        if (amount.is_positive()) {
            debts.push_back({debtor->member, creditor->member, amount});
        }

        creditor->remaining -= amount;
        debtor->remaining -= amount;

        // 3. Retire settled parties; erase keeps the enumeration order intact
        if (creditor->remaining.is_zero()) creditors.erase(creditor);
        if (debtor->remaining.is_zero()) debtors.erase(debtor);
    }

    return debts;
}

std::vector<SimplifiedDebt> debts_involving(const std::vector<SimplifiedDebt>& debts, const MemberKey& member) {
    std::vector<SimplifiedDebt> filtered;
    std::copy_if(debts.begin(), debts.end(), std::back_inserter(filtered),
                 [&member](const SimplifiedDebt& d) { return d.from == member || d.to == member; });
    return filtered;
}

} // namespace spl
