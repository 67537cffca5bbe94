/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: wallet_book.hpp
 * ============================================================================
 * * DESCRIPTION:
 * In-process value-transfer primitive holding one spendable balance per
 * member. Backs the embedded mirror when no external chain is attached.
 * ============================================================================
 */

#ifndef SPL_WALLET_BOOK_HPP
#define SPL_WALLET_BOOK_HPP

#include <cstdint>
#include <map>
#include <mutex>

#include "types.hpp"

namespace spl {

    class WalletBook : public IValueTransfer {
    public:
        // Credits spendable funds; amount must be positive.
        void fund(const MemberKey& member, const Money& amount);

        Money funds_of(const MemberKey& member);

        TransferReceipt transfer(const MemberKey& from, const MemberKey& to, const Money& amount) override;

    private:
        std::mutex mutex_;
        std::map<MemberKey, Money> funds_;
        std::uint64_t nonce_ = 0;
    };

} // namespace spl

#endif // SPL_WALLET_BOOK_HPP
