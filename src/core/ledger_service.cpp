/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: ledger_service.cpp
 * ============================================================================
 */

#include "ledger_service.hpp"
#include "debt_simplifier.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>

namespace spl {

MemberKey normalize_member_key(const std::string& raw) {
    if (raw.empty()) {
        throw InvalidRecord("Member key must not be empty");
    }

    MemberKey key = raw;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return std::tolower(c); });

    if (key.rfind("0x", 0) == 0) {
        bool hex = key.size() == 42 &&
                   std::all_of(key.begin() + 2, key.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
        if (!hex) {
            throw InvalidRecord("Malformed address: " + raw);
        }
    }
    return key;
}

LedgerService::LedgerService(LedgerStore& store) : store_(store), ledger_(store) {}

Group LedgerService::create_group(const std::string& name, const MemberKey& creator,
                                  const std::vector<MemberKey>& members) {
    if (name.empty()) {
        throw InvalidRecord("Group name required");
    }

    Group group;
    group.name = name;
    group.creator = normalize_member_key(creator);
    group.add_member(group.creator);
    for (const auto& member : members) {
        group.add_member(normalize_member_key(member));
    }

    Group stored = store_.create_group(group);
    spl_log("INFO", "Group " + std::to_string(stored.id) + " '" + name + "' created with " +
                    std::to_string(stored.members.size()) + " members");
    return stored;
}

Group LedgerService::get_group(GroupId group_id) {
    std::optional<Group> group = store_.find_group(group_id);
    if (!group) {
        throw UnknownGroup("Group does not exist: " + std::to_string(group_id));
    }
    return *group;
}

std::vector<Group> LedgerService::groups_for(const MemberKey& member) {
    return store_.list_groups_for(normalize_member_key(member));
}

std::vector<MemberKey> LedgerService::members_of(GroupId group_id) {
    return store_.list_members(group_id);
}

void LedgerService::add_member(GroupId group_id, const MemberKey& member) {
    MemberKey key = normalize_member_key(member);
    if (!store_.add_member(group_id, key)) {
        throw InvalidRecord("Already a member");
    }
    spl_log("INFO", "Member " + key + " joined group " + std::to_string(group_id));
}

Expense LedgerService::add_expense(GroupId group_id, const MemberKey& payer, const Money& amount,
                                   const std::string& description, const std::vector<MemberKey>& participants) {
    Group group = get_group(group_id);

    Expense expense;
    expense.group_id = group_id;
    expense.payer = normalize_member_key(payer);
    expense.amount = amount;
    expense.description = description;
    for (const auto& participant : participants) {
        expense.participants.push_back(normalize_member_key(participant));
    }

    try {
        validate_expense(group, expense);
    } catch (const LedgerError& e) {
        spl_log("WARN", "Expense rejected in group " + std::to_string(group_id) + ": " + e.what());
        throw;
    }

    Expense stored = store_.append_expense(expense);
    spl_log("INFO", "Expense " + std::to_string(stored.id) + " saved in group " + std::to_string(group_id) +
                    ": " + stored.payer + " paid " + amount.to_string() + " for " +
                    std::to_string(stored.participants.size()) + " participants");
    return stored;
}

std::vector<Expense> LedgerService::list_expenses(GroupId group_id) {
    get_group(group_id);
    return store_.list_expenses(group_id);
}

BalanceSnapshot LedgerService::get_balances(GroupId group_id) {
    Group group = get_group(group_id);
    return compute_balances(group, store_.list_expenses(group_id), store_.list_settlements(group_id));
}

std::vector<SimplifiedDebt> LedgerService::get_simplified_debts(GroupId group_id) {
    return simplify_debts(get_balances(group_id));
}

std::vector<SimplifiedDebt> LedgerService::get_simplified_debts(GroupId group_id, const MemberKey& member) {
    MemberKey key = normalize_member_key(member);
    std::vector<SimplifiedDebt> debts = get_simplified_debts(group_id);
    if (!store_.is_member(group_id, key)) {
        throw NotAGroupMember("Not a group member", key);
    }
    return debts_involving(debts, key);
}

Settlement LedgerService::record_settlement(GroupId group_id, const MemberKey& from, const MemberKey& to,
                                            const Money& amount, const std::optional<std::string>& external_ref) {
    return ledger_.record_settlement(group_id, normalize_member_key(from), normalize_member_key(to),
                                     amount, external_ref);
}

std::vector<Settlement> LedgerService::list_settlements(GroupId group_id) {
    get_group(group_id);
    return ledger_.list(group_id);
}

RoundingReport LedgerService::rounding_report(GroupId group_id) {
    Group group = get_group(group_id);
    return spl::rounding_report(group, store_.list_expenses(group_id));
}

ChainVerification LedgerService::verify_settlements(GroupId group_id) {
    get_group(group_id);
    return ledger_.verify_chain(group_id);
}

} // namespace spl
