/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: ledger_service.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The advisory ledger as callers see it: group roster upkeep, expense
 * recording, balance and debt queries, and settlement recording. Balances
 * and debts are recomputed from storage on every call.
 * ============================================================================
 */

#ifndef SPL_LEDGER_SERVICE_HPP
#define SPL_LEDGER_SERVICE_HPP

#include <optional>
#include <string>
#include <vector>

#include "balance_aggregator.hpp"
#include "ledger_store.hpp"
#include "settlement_ledger.hpp"

namespace spl {

    /**
     * @brief Lower-cases a member key and checks its shape.
     * Keys starting with "0x" must carry exactly 40 hex digits.
     * @throws InvalidRecord for an empty or malformed key.
     */
    MemberKey normalize_member_key(const std::string& raw);

    class LedgerService {
    public:
        explicit LedgerService(LedgerStore& store);

        // The creator is always a member and comes first; duplicates are dropped.
        Group create_group(const std::string& name, const MemberKey& creator, const std::vector<MemberKey>& members);

        // @throws UnknownGroup
        Group get_group(GroupId group_id);

        std::vector<Group> groups_for(const MemberKey& member);

        // Roster in join order. @throws UnknownGroup
        std::vector<MemberKey> members_of(GroupId group_id);

        // @throws InvalidRecord("Already a member")
        void add_member(GroupId group_id, const MemberKey& member);

        Expense add_expense(GroupId group_id, const MemberKey& payer, const Money& amount,
                            const std::string& description, const std::vector<MemberKey>& participants);

        std::vector<Expense> list_expenses(GroupId group_id);

        BalanceSnapshot get_balances(GroupId group_id);

        std::vector<SimplifiedDebt> get_simplified_debts(GroupId group_id);
        // @throws NotAGroupMember if `member` is not on the roster.
        std::vector<SimplifiedDebt> get_simplified_debts(GroupId group_id, const MemberKey& member);

        Settlement record_settlement(GroupId group_id, const MemberKey& from, const MemberKey& to,
                                     const Money& amount, const std::optional<std::string>& external_ref);

        std::vector<Settlement> list_settlements(GroupId group_id);

        RoundingReport rounding_report(GroupId group_id);

        ChainVerification verify_settlements(GroupId group_id);

    private:
        LedgerStore& store_;
        SettlementLedger ledger_;
    };

} // namespace spl

#endif // SPL_LEDGER_SERVICE_HPP
