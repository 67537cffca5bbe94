/**
 * SPL: SplitLedger - Cryptographic Module Header
 * Purpose: SHA-256 sealing of the settlement chain and transfer identifiers.
 */

#ifndef SPL_CRYPTO_HPP
#define SPL_CRYPTO_HPP

#include <cstdint>
#include <string>
#include "types.hpp"

namespace spl {

class SPLCrypto {
public:
    // Hex-encoded SHA-256 of the raw bytes.
    static std::string generate_sha256(const std::string& str);

    /**
     * calculate_settlement_seal
     * Bonds a settlement record to the seal of the previous settlement in the
     * same group ("GENESIS" for the first one).
     */
    static std::string calculate_settlement_seal(const std::string& prev_seal, const Settlement& settlement);

    /**
     * derive_transfer_reference
     * Transaction-hash style identifier ("0x" + 64 hex) for a value transfer
     * executed by the in-process wallet book. The nonce keeps repeated identical
     * transfers distinct.
     */
    static std::string derive_transfer_reference(const MemberKey& from, const MemberKey& to,
                                                 const Money& amount, std::uint64_t nonce);
};

} // namespace spl

#endif
