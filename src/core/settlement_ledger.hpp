/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: settlement_ledger.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Authoritative record of completed value transfers. It never checks an
 * amount against what is currently owed: it reflects what the value
 * transfer already did and can neither block nor reverse it.
 * ============================================================================
 */

#ifndef SPL_SETTLEMENT_LEDGER_HPP
#define SPL_SETTLEMENT_LEDGER_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ledger_store.hpp"

namespace spl {

    /**
     * @brief Outcome of re-walking a group's seal chain.
     */
    struct ChainVerification {
        bool intact = true;
        std::size_t records_checked = 0;
        std::optional<RecordId> first_broken;
    };

    class SettlementLedger {
    public:
        explicit SettlementLedger(LedgerStore& store);

        /**
         * @brief Records one completed transfer.
         *
         * Writes to the same group are serialized; uniqueness of the
         * reference is enforced by the store, so of two concurrent calls
         * with one reference exactly one succeeds.
         *
         * @throws InvalidAmount if amount <= 0.
         * @throws InvalidRecord if from == to.
         * @throws UnknownGroup / NotAGroupMember for a bad group or party.
         * @throws DuplicateReference if external_ref was already recorded.
         */
        Settlement record_settlement(GroupId group_id, const MemberKey& from, const MemberKey& to,
                                     const Money& amount, const std::optional<std::string>& external_ref);

        std::vector<Settlement> list(GroupId group_id);

        std::optional<Settlement> find_by_reference(const std::string& reference);

        ChainVerification verify_chain(GroupId group_id);

    private:
        LedgerStore& store_;

        std::mutex registry_mutex_;
        std::map<GroupId, std::shared_ptr<std::mutex>> group_locks_;

        std::shared_ptr<std::mutex> lock_for(GroupId group_id);
    };

} // namespace spl

#endif // SPL_SETTLEMENT_LEDGER_HPP
