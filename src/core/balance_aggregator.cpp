/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: balance_aggregator.cpp
 * ============================================================================
 */

#include "balance_aggregator.hpp"
#include "errors.hpp"

#include <map>
#include <set>

namespace spl {

BalanceSnapshot::BalanceSnapshot(GroupId group_id, std::vector<Entry> entries)
    : group_id_(group_id), entries_(std::move(entries)) {}

bool BalanceSnapshot::contains(const MemberKey& member) const {
    for (const auto& entry : entries_) {
        if (entry.member == member) return true;
    }
    return false;
}

Money BalanceSnapshot::balance_of(const MemberKey& member) const {
    for (const auto& entry : entries_) {
        if (entry.member == member) return entry.balance;
    }
    throw NotAGroupMember("Member has no balance in group " + std::to_string(group_id_), member);
}

Money BalanceSnapshot::total() const {
    Money sum;
    for (const auto& entry : entries_) {
        sum += entry.balance;
    }
    return sum;
}

std::size_t BalanceSnapshot::nonzero_count() const {
    std::size_t count = 0;
    for (const auto& entry : entries_) {
        if (!entry.balance.is_zero()) ++count;
    }
    return count;
}

// ----------------------------------------------------------------------------
// Validation
// ----------------------------------------------------------------------------
void validate_expense(const Group& group, const Expense& expense) {
    if (expense.group_id != group.id) {
        throw InvalidRecord("Expense " + std::to_string(expense.id) + " belongs to group " +
                            std::to_string(expense.group_id) + ", not " + std::to_string(group.id));
    }
    if (!expense.amount.is_positive()) {
        throw InvalidAmount("Expense amount must be positive, got " + expense.amount.to_string());
    }
    if (expense.participants.empty()) {
        throw InvalidRecord("Expense needs at least one participant");
    }
    if (!group.has_member(expense.payer)) {
        throw NotAGroupMember("Not a group member", expense.payer);
    }

    std::set<MemberKey> seen;
    for (const auto& participant : expense.participants) {
        if (!group.has_member(participant)) {
            throw NotAGroupMember("Participant not a member", participant);
        }
        if (!seen.insert(participant).second) {
            throw InvalidRecord("Participant listed twice: " + participant);
        }
    }
}

void validate_settlement(const Group& group, const Settlement& settlement) {
    if (settlement.group_id != group.id) {
        throw InvalidRecord("Settlement belongs to group " + std::to_string(settlement.group_id) +
                            ", not " + std::to_string(group.id));
    }
    if (!settlement.amount.is_positive()) {
        throw InvalidAmount("Settlement amount must be positive, got " + settlement.amount.to_string());
    }
    if (settlement.from == settlement.to) {
        throw InvalidRecord("Cannot settle with yourself");
    }
    if (!group.has_member(settlement.from)) {
        throw NotAGroupMember("Not a group member", settlement.from);
    }
    if (!group.has_member(settlement.to)) {
        throw NotAGroupMember("Not a group member", settlement.to);
    }
}

// ----------------------------------------------------------------------------
// compute_balances
// Validates the whole history first so a bad record never yields a
// half-folded result.
// ----------------------------------------------------------------------------
BalanceSnapshot compute_balances(const Group& group,
                                 const std::vector<Expense>& expenses,
                                 const std::vector<Settlement>& settlements) {
    for (const auto& expense : expenses) validate_expense(group, expense);
    for (const auto& settlement : settlements) validate_settlement(group, settlement);

    std::map<MemberKey, Money> running;
    for (const auto& member : group.members) {
        running[member] = Money(0);
    }

    for (const auto& expense : expenses) {
        Money::Split split = expense.amount.split(expense.participants.size());

        // Payer is credited what the participants are debited; the remainder
        // stays uncredited.
        running[expense.payer] += expense.amount - split.remainder;
        for (const auto& participant : expense.participants) {
            running[participant] -= split.share;
        }
    }

    for (const auto& settlement : settlements) {
        running[settlement.from] += settlement.amount;
        running[settlement.to] -= settlement.amount;
    }

    std::vector<BalanceSnapshot::Entry> entries;
    entries.reserve(group.members.size());
    for (const auto& member : group.members) {
        entries.push_back({member, running[member]});
    }
    return BalanceSnapshot(group.id, std::move(entries));
}

RoundingReport rounding_report(const Group& group, const std::vector<Expense>& expenses) {
    RoundingReport report;
    report.group_id = group.id;

    for (const auto& expense : expenses) {
        validate_expense(group, expense);
        Money::Split split = expense.amount.split(expense.participants.size());
        if (split.remainder.is_zero()) continue;

        report.entries.push_back({expense.id, expense.amount, expense.participants.size(), split.share, split.remainder});
        report.total_remainder += split.remainder;
    }
    return report;
}

} // namespace spl
