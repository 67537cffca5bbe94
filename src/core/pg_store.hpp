/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: pg_store.hpp
 * ============================================================================
 * * DESCRIPTION:
 * PostgreSQL back end. Each call opens its own connection and transaction,
 * so the store can be shared across server worker threads. Reference
 * uniqueness is a UNIQUE column: the database, not a process-local lock,
 * decides which of two racing settlement writes wins.
 * ============================================================================
 */

#ifndef SPL_PG_STORE_HPP
#define SPL_PG_STORE_HPP

#include <string>

#include "ledger_store.hpp"

namespace spl {

    class PgStore : public LedgerStore {
    public:
        explicit PgStore(const std::string& conn_str);

        // Creates the tables if they do not exist yet.
        void ensure_schema();

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
        std::string conn_str_;
    };

} // namespace spl

#endif // SPL_PG_STORE_HPP
