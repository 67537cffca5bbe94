/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: types.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Records the engine folds over. Expenses and settlements are append-only
 * history owned by their group; balances and simplified debts are derived
 * on demand and never stored.
 * ============================================================================
 */

#ifndef SPL_TYPES_HPP
#define SPL_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "money.hpp"

namespace spl {

    // Opaque address-like identity key ("0x" + 40 hex digits on the wire).
    typedef std::string MemberKey;

    typedef std::uint64_t GroupId;
    typedef std::uint64_t RecordId;

    // Seconds since the Unix epoch.
    typedef std::int64_t Timestamp;

    /**
     * @brief Roster of members sharing expenses.
     * Members keep their join order; that order is the deterministic
     * enumeration order used everywhere a tie must be broken.
     */
    struct Group {
        GroupId id = 0;
        std::string name;
        MemberKey creator;
        std::vector<MemberKey> members;
        bool active = true;
        Timestamp created_at = 0;

        bool has_member(const MemberKey& member) const;

        /**
         * @return false if the member is already on the roster.
         */
        bool add_member(const MemberKey& member);
    };

    /**
     * @brief A payment by one member, split equally among participants.
     */
    struct Expense {
        RecordId id = 0;
        GroupId group_id = 0;
        MemberKey payer;
        Money amount;
        std::string description;
        std::vector<MemberKey> participants;
        Timestamp created_at = 0;

        // Floor-divided portion owed by each participant.
        Money share() const;
    };

    /**
     * @brief A completed value transfer from a debtor to a creditor.
     * external_ref is the value-transfer identifier; it may only be absent
     * on records created before references existed.
     */
    struct Settlement {
        RecordId id = 0;
        GroupId group_id = 0;
        MemberKey from;
        MemberKey to;
        Money amount;
        std::optional<std::string> external_ref;
        Timestamp settled_at = 0;
        std::string seal;
    };

    struct SimplifiedDebt {
        MemberKey from;
        MemberKey to;
        Money amount;
    };

    inline bool operator==(const SimplifiedDebt& lhs, const SimplifiedDebt& rhs) {
        return lhs.from == rhs.from && lhs.to == rhs.to && lhs.amount == rhs.amount;
    }

    inline bool operator!=(const SimplifiedDebt& lhs, const SimplifiedDebt& rhs) {
        return !(lhs == rhs);
    }

    /**
     * @brief Receipt returned by the value-transfer primitive.
     */
    struct TransferReceipt {
        std::string reference;
        Money confirmed_amount;
    };

    /**
     * @brief The external value-transfer primitive.
     * Implementations move real value; the engine only decides when.
     */
    class IValueTransfer {
    public:
        virtual ~IValueTransfer() {}

        /**
         * @throws InsufficientFunds if `from` cannot cover `amount`.
         * @throws TransferRejected for any other refusal.
         */
        virtual TransferReceipt transfer(const MemberKey& from, const MemberKey& to, const Money& amount) = 0;
    };

    Timestamp now_seconds();

} // namespace spl

#endif // SPL_TYPES_HPP
