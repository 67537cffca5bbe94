/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: memory_store.hpp
 * ============================================================================
 */

#ifndef SPL_MEMORY_STORE_HPP
#define SPL_MEMORY_STORE_HPP

#include <map>
#include <mutex>
#include <set>

#include "ledger_store.hpp"

namespace spl {

    /**
     * @brief Thread-safe in-process store. Used by tests and by the server
     * when no database is configured.
     */
    class MemoryStore : public LedgerStore {
    public:
        Group create_group(Group group) override;
        std::optional<Group> find_group(GroupId id) override;
        bool add_member(GroupId id, const MemberKey& member) override;
        std::vector<Group> list_groups_for(const MemberKey& member) override;
        std::vector<Expense> list_expenses(GroupId id) override;
        Expense append_expense(Expense expense) override;
        std::vector<Settlement> list_settlements(GroupId id) override;
        Settlement append_settlement(Settlement settlement) override;
        std::optional<Settlement> find_settlement_by_reference(const std::string& reference) override;

    private:
        std::mutex mutex_;
        std::map<GroupId, Group> groups_;
        std::map<GroupId, std::vector<Expense>> expenses_;
        std::map<GroupId, std::vector<Settlement>> settlements_;
        std::set<std::string> references_;
        GroupId next_group_id_ = 1;
        RecordId next_expense_id_ = 1;
        RecordId next_settlement_id_ = 1;
    };

} // namespace spl

#endif // SPL_MEMORY_STORE_HPP
