/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: mirror_contract.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Value-authoritative restatement of the balance and settlement logic, with
 * the same surface as the on-chain contract (createGroup, joinGroup,
 * addExpense, getMemberBalance, getAllBalances, getSimplifiedDebts, settle).
 * Balances are updated atomically when an expense or a settlement is
 * applied; settle() moves value through the transfer primitive inside a
 * reentrancy-guarded section. When the mirror and the advisory ledger
 * disagree, the mirror wins.
 *
 * The algorithms here are re-derived independently of balance_aggregator
 * and debt_simplifier so the two can be cross-checked.
 * ============================================================================
 */

#ifndef SPL_MIRROR_CONTRACT_HPP
#define SPL_MIRROR_CONTRACT_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "reentrancy_guard.hpp"
#include "types.hpp"

namespace spl {

    struct MirrorGroupInfo {
        std::string name;
        MemberKey creator;
        bool active = false;
        std::size_t member_count = 0;
    };

    enum class MirrorEventKind {
        GroupCreated,
        MemberJoined,
        ExpenseAdded,
        DebtSettled
    };

    /**
     * @brief Append-only event emitted by the mirror.
     * Fields not meaningful for a kind stay empty.
     */
    struct MirrorEvent {
        std::uint64_t sequence = 0;
        MirrorEventKind kind = MirrorEventKind::GroupCreated;
        GroupId group_id = 0;
        MemberKey actor;         // creator, joiner, payer or debtor
        MemberKey counterparty;  // creditor for DebtSettled
        Money amount;
        RecordId expense_id = 0;
        std::string text;        // group name or expense description
        std::string reference;   // transfer identifier for DebtSettled
    };

    /**
     * @brief Read side of the authoritative mirror used by reconciliation.
     */
    class IMirrorSource {
    public:
        virtual ~IMirrorSource() {}

        // DebtSettled events with a sequence greater than `after_sequence`.
        virtual std::vector<MirrorEvent> settlement_events_since(std::uint64_t after_sequence) = 0;

        virtual std::pair<std::vector<MemberKey>, std::vector<Money>> get_all_balances(GroupId group_id) = 0;
    };

    class MirrorContract : public IMirrorSource {
    public:
        explicit MirrorContract(IValueTransfer& transfer);

        // --- Group management ---------------------------------------------
        /**
         * The caller is always the first member; initial members are
         * deduplicated in first-seen order.
         */
        GroupId create_group(const MemberKey& caller, const std::string& name,
                             const std::vector<MemberKey>& initial_members);

        void join_group(const MemberKey& caller, GroupId group_id);

        MirrorGroupInfo get_group(GroupId group_id);
        std::vector<MemberKey> get_group_members(GroupId group_id);
        std::vector<GroupId> get_user_groups(const MemberKey& member);

        // --- Expenses -------------------------------------------------------
        RecordId add_expense(const MemberKey& caller, GroupId group_id, const Money& amount,
                             const std::string& description, const std::vector<MemberKey>& participants);

        Expense get_expense(RecordId expense_id);
        std::vector<RecordId> get_group_expenses(GroupId group_id);

        // --- Balances -------------------------------------------------------
        // Zero for an address that never joined, as a contract mapping reads.
        Money get_member_balance(GroupId group_id, const MemberKey& member);

        // Members in join order and their balances, index-aligned.
        std::pair<std::vector<MemberKey>, std::vector<Money>> get_all_balances(GroupId group_id) override;

        std::vector<SimplifiedDebt> get_simplified_debts(GroupId group_id);

        // --- Settlement -----------------------------------------------------
        /**
         * @brief Caller pays `value` of their debt to `creditor`.
         * @throws SettlementRejected on zero value, when the caller owes
         * nothing or the creditor is owed nothing.
         * @throws OverpaymentRejected when value exceeds the caller's debt.
         * @throws ReentrantCall when entered from inside a transfer.
         * @throws TransferFailed if the primitive refuses or confirms
         * nothing; balances are restored before it propagates.
         * @throws LedgerCorruption if the primitive confirms more than `value`.
         *
         * A confirmation short of `value` settles the confirmed amount only.
         */
        TransferReceipt settle(const MemberKey& caller, GroupId group_id, const MemberKey& creditor, const Money& value);

        // --- Events ---------------------------------------------------------
        std::vector<MirrorEvent> events_since(std::uint64_t after_sequence);
        std::vector<MirrorEvent> settlement_events_since(std::uint64_t after_sequence) override;

    private:
        struct GroupState {
            std::string name;
            MemberKey creator;
            bool active = true;
            std::vector<MemberKey> members;
            std::map<MemberKey, bool> is_member;
            std::map<MemberKey, Money> balances;
            std::vector<RecordId> expense_ids;
        };

        IValueTransfer& transfer_;
        ReentrancyGuard guard_;
        std::recursive_mutex mutex_;

        std::map<GroupId, GroupState> groups_;
        std::map<RecordId, Expense> expenses_;
        std::map<MemberKey, std::vector<GroupId>> user_groups_;
        std::vector<MirrorEvent> events_;

        GroupId group_count_ = 0;
        RecordId expense_count_ = 0;

        GroupState& group_or_throw(GroupId group_id);
        void enroll(GroupId group_id, GroupState& group, const MemberKey& member);
        void emit(MirrorEvent event);
    };

} // namespace spl

#endif // SPL_MIRROR_CONTRACT_HPP
