/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: mirror_contract.cpp
 * ============================================================================
 */

#include "mirror_contract.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <set>

namespace spl {

MirrorContract::MirrorContract(IValueTransfer& transfer) : transfer_(transfer) {}

MirrorContract::GroupState& MirrorContract::group_or_throw(GroupId group_id) {
    auto it = groups_.find(group_id);
    if (it == groups_.end()) {
        throw UnknownGroup("Group does not exist");
    }
    return it->second;
}

void MirrorContract::enroll(GroupId group_id, GroupState& group, const MemberKey& member) {
    group.members.push_back(member);
    group.is_member[member] = true;
    group.balances[member] = Money(0);
    user_groups_[member].push_back(group_id);

    MirrorEvent joined;
    joined.kind = MirrorEventKind::MemberJoined;
    joined.group_id = group_id;
    joined.actor = member;
    emit(joined);
}

void MirrorContract::emit(MirrorEvent event) {
    event.sequence = events_.size() + 1;
    events_.push_back(std::move(event));
}

// ----------------------------------------------------------------------------
// Group management
// ----------------------------------------------------------------------------
GroupId MirrorContract::create_group(const MemberKey& caller, const std::string& name,
                                     const std::vector<MemberKey>& initial_members) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard::Section section(guard_, "createGroup");

    if (name.empty()) {
        throw InvalidRecord("Group name required");
    }

    GroupId group_id = ++group_count_;
    GroupState& group = groups_[group_id];
    group.name = name;
    group.creator = caller;

    MirrorEvent created;
    created.kind = MirrorEventKind::GroupCreated;
    created.group_id = group_id;
    created.actor = caller;
    created.text = name;
    emit(created);

    enroll(group_id, group, caller);
    for (const auto& member : initial_members) {
        if (group.is_member.count(member) == 0) {
            enroll(group_id, group, member);
        }
    }

    spl_log("INFO", "Mirror group " + std::to_string(group_id) + " '" + name + "' created by " + caller +
                    " with " + std::to_string(group.members.size()) + " members");
    return group_id;
}

void MirrorContract::join_group(const MemberKey& caller, GroupId group_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard::Section section(guard_, "joinGroup");

    GroupState& group = group_or_throw(group_id);
    if (group.is_member.count(caller) != 0) {
        throw InvalidRecord("Already a member");
    }
    enroll(group_id, group, caller);
}

MirrorGroupInfo MirrorContract::get_group(GroupId group_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const GroupState& group = group_or_throw(group_id);
    return MirrorGroupInfo{group.name, group.creator, group.active, group.members.size()};
}

std::vector<MemberKey> MirrorContract::get_group_members(GroupId group_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return group_or_throw(group_id).members;
}

std::vector<GroupId> MirrorContract::get_user_groups(const MemberKey& member) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = user_groups_.find(member);
    return it == user_groups_.end() ? std::vector<GroupId>() : it->second;
}

// ----------------------------------------------------------------------------
// add_expense
// The caller is the payer. Shares use floor division; the payer is credited
// exactly what the participants are debited.
// ----------------------------------------------------------------------------
RecordId MirrorContract::add_expense(const MemberKey& caller, GroupId group_id, const Money& amount,
                                     const std::string& description, const std::vector<MemberKey>& participants) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard::Section section(guard_, "addExpense");

    GroupState& group = group_or_throw(group_id);
    if (group.is_member.count(caller) == 0) {
        throw NotAGroupMember("Not a group member", caller);
    }
    if (!amount.is_positive()) {
        throw InvalidAmount("Amount must be positive");
    }
    if (participants.empty()) {
        throw InvalidRecord("Need at least one participant");
    }
    std::set<MemberKey> seen;
    for (const auto& participant : participants) {
        if (group.is_member.count(participant) == 0) {
            throw NotAGroupMember("Participant not a member", participant);
        }
        if (!seen.insert(participant).second) {
            throw InvalidRecord("Duplicate participant");
        }
    }

    Money::Split split = amount.split(participants.size());
    group.balances[caller] += amount - split.remainder;
    for (const auto& participant : participants) {
        group.balances[participant] -= split.share;
    }

    Expense expense;
    expense.id = ++expense_count_;
    expense.group_id = group_id;
    expense.payer = caller;
    expense.amount = amount;
    expense.description = description;
    expense.participants = participants;
    expense.created_at = now_seconds();
    expenses_[expense.id] = expense;
    group.expense_ids.push_back(expense.id);

    MirrorEvent added;
    added.kind = MirrorEventKind::ExpenseAdded;
    added.group_id = group_id;
    added.actor = caller;
    added.amount = amount;
    added.expense_id = expense.id;
    added.text = description;
    emit(added);

    if (!split.remainder.is_zero()) {
        spl_log("INFO", "Mirror expense " + std::to_string(expense.id) + " leaves " +
                        split.remainder.to_string() + " base units uncredited");
    }
    return expense.id;
}

Expense MirrorContract::get_expense(RecordId expense_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = expenses_.find(expense_id);
    if (it == expenses_.end()) {
        throw InvalidRecord("Expense does not exist");
    }
    return it->second;
}

std::vector<RecordId> MirrorContract::get_group_expenses(GroupId group_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return group_or_throw(group_id).expense_ids;
}

// ----------------------------------------------------------------------------
// Balances
// ----------------------------------------------------------------------------
Money MirrorContract::get_member_balance(GroupId group_id, const MemberKey& member) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const GroupState& group = group_or_throw(group_id);
    auto it = group.balances.find(member);
    return it == group.balances.end() ? Money(0) : it->second;
}

std::pair<std::vector<MemberKey>, std::vector<Money>> MirrorContract::get_all_balances(GroupId group_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const GroupState& group = group_or_throw(group_id);

    std::vector<Money> balances;
    balances.reserve(group.members.size());
    for (const auto& member : group.members) {
        balances.push_back(group.balances.at(member));
    }
    return std::make_pair(group.members, balances);
}

// ----------------------------------------------------------------------------
// get_simplified_debts
// Index-based restatement of the greedy matching: each round scans for the
// largest credit and the largest debt (first index wins a tie) and settles
// the smaller of the two.
// ----------------------------------------------------------------------------
std::vector<SimplifiedDebt> MirrorContract::get_simplified_debts(GroupId group_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const GroupState& group = group_or_throw(group_id);

    const std::size_t n = group.members.size();
    std::vector<Money> credit(n);
    std::vector<Money> debt(n);
    for (std::size_t i = 0; i < n; ++i) {
        const Money& balance = group.balances.at(group.members[i]);
        if (balance.is_positive()) credit[i] = balance;
        else if (balance.is_negative()) debt[i] = -balance;
    }

    std::vector<SimplifiedDebt> debts;
    for (;;) {
        std::size_t ci = n;
        std::size_t di = n;
        for (std::size_t i = 0; i < n; ++i) {
            if (credit[i].is_positive() && (ci == n || credit[ci] < credit[i])) ci = i;
            if (debt[i].is_positive() && (di == n || debt[di] < debt[i])) di = i;
        }
        if (ci == n || di == n) break;

        Money amount = debt[di] < credit[ci] ? debt[di] : credit[ci];
        debts.push_back({group.members[di], group.members[ci], amount});
        credit[ci] -= amount;
        debt[di] -= amount;
    }
    return debts;
}

// ----------------------------------------------------------------------------
// settle
// Checks, then balance effects, then the value transfer inside the guarded
// section. A failed transfer restores both balances before propagating. A
// short confirmation keeps only the confirmed part.
// ----------------------------------------------------------------------------
TransferReceipt MirrorContract::settle(const MemberKey& caller, GroupId group_id, const MemberKey& creditor,
                                       const Money& value) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard::Section section(guard_, "settle");

    GroupState& group = group_or_throw(group_id);
    if (!value.is_positive()) {
        throw SettlementRejected("Must send value");
    }
    if (creditor == caller) {
        throw InvalidRecord("Cannot settle with yourself");
    }
    if (group.is_member.count(caller) == 0) {
        throw NotAGroupMember("Not a group member", caller);
    }
    if (group.is_member.count(creditor) == 0) {
        throw NotAGroupMember("Creditor not a member", creditor);
    }

    Money& debtor_balance = group.balances[caller];
    Money& creditor_balance = group.balances[creditor];
    if (!debtor_balance.is_negative()) {
        throw SettlementRejected("You don't owe anything");
    }
    if (!creditor_balance.is_positive()) {
        throw SettlementRejected("Creditor is not owed anything");
    }
    if (debtor_balance.magnitude() < value) {
        spl_log("WARN", "Mirror overpayment blocked: " + caller + " owes " + debtor_balance.magnitude().to_string() +
                        ", sent " + value.to_string());
        throw OverpaymentRejected("Cannot overpay your debt");
    }

    debtor_balance += value;
    creditor_balance -= value;

    TransferReceipt receipt;
    try {
        receipt = transfer_.transfer(caller, creditor, value);
    } catch (const std::exception& e) {
        debtor_balance -= value;
        creditor_balance += value;
        spl_log("ERROR", "Mirror settlement reverted in group " + std::to_string(group_id) + ": " + e.what());
        throw;
    }

    if (value < receipt.confirmed_amount) {
        debtor_balance -= value;
        creditor_balance += value;
        spl_log("FATAL", "Mirror transfer " + receipt.reference + " confirmed " +
                         receipt.confirmed_amount.to_string() + " for a request of " + value.to_string());
        throw LedgerCorruption("Transfer confirmed more than was sent");
    }
    if (!receipt.confirmed_amount.is_positive()) {
        debtor_balance -= value;
        creditor_balance += value;
        spl_log("ERROR", "Mirror transfer " + receipt.reference + " confirmed nothing in group " +
                         std::to_string(group_id));
        throw TransferRejected("Transfer confirmed nothing");
    }
    if (receipt.confirmed_amount < value) {
        Money unmoved = value - receipt.confirmed_amount;
        debtor_balance -= unmoved;
        creditor_balance += unmoved;
        spl_log("WARN", "Mirror transfer " + receipt.reference + " confirmed " +
                        receipt.confirmed_amount.to_string() + " of " + value.to_string());
    }

    MirrorEvent settled;
    settled.kind = MirrorEventKind::DebtSettled;
    settled.group_id = group_id;
    settled.actor = caller;
    settled.counterparty = creditor;
    settled.amount = receipt.confirmed_amount;
    settled.reference = receipt.reference;
    emit(settled);

    spl_log("INFO", "Mirror settlement in group " + std::to_string(group_id) + ": " + caller + " -> " + creditor +
                    " " + receipt.confirmed_amount.to_string() + " ref " + receipt.reference);
    return receipt;
}

// ----------------------------------------------------------------------------
// Events
// ----------------------------------------------------------------------------
std::vector<MirrorEvent> MirrorContract::events_since(std::uint64_t after_sequence) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<MirrorEvent> result;
    for (std::size_t i = after_sequence; i < events_.size(); ++i) {
        result.push_back(events_[i]);
    }
    return result;
}

std::vector<MirrorEvent> MirrorContract::settlement_events_since(std::uint64_t after_sequence) {
    std::vector<MirrorEvent> result;
    for (const auto& event : events_since(after_sequence)) {
        if (event.kind == MirrorEventKind::DebtSettled) result.push_back(event);
    }
    return result;
}

} // namespace spl
