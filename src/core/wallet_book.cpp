#include "wallet_book.hpp"
#include "crypto.hpp"
#include "errors.hpp"

namespace spl {

void WalletBook::fund(const MemberKey& member, const Money& amount) {
    if (!amount.is_positive()) {
        throw InvalidAmount("Funding amount must be positive, got " + amount.to_string());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    funds_[member] += amount;
}

Money WalletBook::funds_of(const MemberKey& member) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = funds_.find(member);
    return it == funds_.end() ? Money(0) : it->second;
}

TransferReceipt WalletBook::transfer(const MemberKey& from, const MemberKey& to, const Money& amount) {
    if (!amount.is_positive()) {
        throw TransferRejected("Transfer amount must be positive");
    }
    if (from == to) {
        throw TransferRejected("Transfer to self rejected");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Money& source = funds_[from];
    if (source < amount) {
        throw InsufficientFunds(from + " holds " + source.to_string() + ", needs " + amount.to_string());
    }
    source -= amount;
    funds_[to] += amount;

    return TransferReceipt{SPLCrypto::derive_transfer_reference(from, to, amount, ++nonce_), amount};
}

} // namespace spl
