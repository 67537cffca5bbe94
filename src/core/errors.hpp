/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: errors.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Exception types raised by the engine. Every failure is raised before any
 * state is touched, so callers never observe a partially applied operation.
 * ============================================================================
 */

#ifndef SPL_ERRORS_HPP
#define SPL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace spl {

class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& what) : std::runtime_error(what) {}
};

// Amount <= 0 wherever an amount is accepted.
class InvalidAmount : public LedgerError {
public:
    explicit InvalidAmount(const std::string& what) : LedgerError(what) {}
};

class UnknownGroup : public LedgerError {
public:
    explicit UnknownGroup(const std::string& what) : LedgerError(what) {}
};

// Any reference to a member outside the group's roster.
class NotAGroupMember : public LedgerError {
public:
    NotAGroupMember(const std::string& what, const std::string& member)
        : LedgerError(what), member_(member) {}

    const std::string& member() const { return member_; }

private:
    std::string member_;
};

// Structurally invalid record: empty or repeated participants, self settlement,
// malformed member key.
class InvalidRecord : public LedgerError {
public:
    explicit InvalidRecord(const std::string& what) : LedgerError(what) {}
};

/**
 * @brief Replay of an already recorded external transfer reference.
 * Callers treat this as "already satisfied" and stop retrying.
 */
class DuplicateReference : public LedgerError {
public:
    explicit DuplicateReference(const std::string& reference)
        : LedgerError("Transfer reference already recorded: " + reference), reference_(reference) {}

    const std::string& reference() const { return reference_; }

private:
    std::string reference_;
};

// Mirror only: attached value exceeds the caller's outstanding debt.
class OverpaymentRejected : public LedgerError {
public:
    explicit OverpaymentRejected(const std::string& what) : LedgerError(what) {}
};

// Mirror only: settle() precondition failed (zero value, nothing owed, ...).
class SettlementRejected : public LedgerError {
public:
    explicit SettlementRejected(const std::string& what) : LedgerError(what) {}
};

// Nested entry into a guarded section. Fatal to the inner call only.
class ReentrantCall : public LedgerError {
public:
    explicit ReentrantCall(const std::string& what) : LedgerError(what) {}
};

class TransferFailed : public LedgerError {
public:
    explicit TransferFailed(const std::string& what) : LedgerError(what) {}
};

class InsufficientFunds : public TransferFailed {
public:
    explicit InsufficientFunds(const std::string& what) : TransferFailed(what) {}
};

class TransferRejected : public TransferFailed {
public:
    explicit TransferRejected(const std::string& what) : TransferFailed(what) {}
};

// Closed-system invariant broken in data read back from storage.
class LedgerCorruption : public LedgerError {
public:
    explicit LedgerCorruption(const std::string& what) : LedgerError(what) {}
};

} // namespace spl

#endif // SPL_ERRORS_HPP
