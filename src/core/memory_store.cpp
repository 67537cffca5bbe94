#include "memory_store.hpp"
#include "errors.hpp"

namespace spl {

Group MemoryStore::create_group(Group group) {
    std::lock_guard<std::mutex> lock(mutex_);
    group.id = next_group_id_++;
    if (group.created_at == 0) group.created_at = now_seconds();
    groups_[group.id] = group;
    return group;
}

std::optional<Group> MemoryStore::find_group(GroupId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = groups_.find(id);
    if (it == groups_.end()) return std::nullopt;
    return it->second;
}

bool MemoryStore::add_member(GroupId id, const MemberKey& member) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = groups_.find(id);
    if (it == groups_.end()) {
        throw UnknownGroup("Group does not exist: " + std::to_string(id));
    }
    return it->second.add_member(member);
}

std::vector<Group> MemoryStore::list_groups_for(const MemberKey& member) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Group> result;
    for (const auto& pair : groups_) {
        if (pair.second.has_member(member)) result.push_back(pair.second);
    }
    return result;
}

std::vector<Expense> MemoryStore::list_expenses(GroupId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = expenses_.find(id);
    return it == expenses_.end() ? std::vector<Expense>() : it->second;
}

Expense MemoryStore::append_expense(Expense expense) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (groups_.find(expense.group_id) == groups_.end()) {
        throw UnknownGroup("Group does not exist: " + std::to_string(expense.group_id));
    }
    expense.id = next_expense_id_++;
    if (expense.created_at == 0) expense.created_at = now_seconds();
    expenses_[expense.group_id].push_back(expense);
    return expense;
}

std::vector<Settlement> MemoryStore::list_settlements(GroupId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = settlements_.find(id);
    return it == settlements_.end() ? std::vector<Settlement>() : it->second;
}

Settlement MemoryStore::append_settlement(Settlement settlement) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (groups_.find(settlement.group_id) == groups_.end()) {
        throw UnknownGroup("Group does not exist: " + std::to_string(settlement.group_id));
    }
    // Check and insert under one lock: the uniqueness constraint.
    if (settlement.external_ref && !references_.insert(*settlement.external_ref).second) {
        throw DuplicateReference(*settlement.external_ref);
    }
    settlement.id = next_settlement_id_++;
    if (settlement.settled_at == 0) settlement.settled_at = now_seconds();
    settlements_[settlement.group_id].push_back(settlement);
    return settlement;
}

std::optional<Settlement> MemoryStore::find_settlement_by_reference(const std::string& reference) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (references_.count(reference) == 0) return std::nullopt;
    for (const auto& pair : settlements_) {
        for (const auto& settlement : pair.second) {
            if (settlement.external_ref && *settlement.external_ref == reference) return settlement;
        }
    }
    return std::nullopt;
}

} // namespace spl
