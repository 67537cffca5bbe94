/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: ledger_store.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Storage and group directory contract the engine reads its history from.
 * Back ends: MemoryStore (in-process) and PgStore (PostgreSQL).
 * * CONTRACT:
 * - Lists are ordered by creation, ascending.
 * - Records are append-only; ids are assigned by the store.
 * - A settlement reference is unique across the whole store. A second
 *   append with the same reference throws DuplicateReference and stores
 *   nothing, even when both appends race.
 * ============================================================================
 */

#ifndef SPL_LEDGER_STORE_HPP
#define SPL_LEDGER_STORE_HPP

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace spl {

    class LedgerStore {
    public:
        virtual ~LedgerStore() {}

        // Assigns id and created_at; the roster is stored as given.
        virtual Group create_group(Group group) = 0;

        virtual std::optional<Group> find_group(GroupId id) = 0;

        /**
         * @return false if the member is already on the roster.
         * @throws UnknownGroup
         */
        virtual bool add_member(GroupId id, const MemberKey& member) = 0;

        virtual std::vector<Group> list_groups_for(const MemberKey& member) = 0;

        virtual std::vector<Expense> list_expenses(GroupId id) = 0;

        virtual Expense append_expense(Expense expense) = 0;

        virtual std::vector<Settlement> list_settlements(GroupId id) = 0;

        /**
         * @throws DuplicateReference if external_ref is already stored.
         */
        virtual Settlement append_settlement(Settlement settlement) = 0;

        virtual std::optional<Settlement> find_settlement_by_reference(const std::string& reference) = 0;

        // Directory view over find_group().
        std::vector<MemberKey> list_members(GroupId id);
        bool is_member(GroupId id, const MemberKey& member);
    };

} // namespace spl

#endif // SPL_LEDGER_STORE_HPP
