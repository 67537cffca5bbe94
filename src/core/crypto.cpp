#include "crypto.hpp"
#include <openssl/evp.h> // Modern OpenSSL API
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace spl {

std::string SPLCrypto::generate_sha256(const std::string& str) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    EVP_MD_CTX* context = EVP_MD_CTX_new();
    if (context == nullptr) {
        throw std::runtime_error("OpenSSL digest context allocation failed");
    }
    bool ok = EVP_DigestInit_ex(context, EVP_sha256(), NULL) == 1
           && EVP_DigestUpdate(context, str.c_str(), str.size()) == 1
           && EVP_DigestFinal_ex(context, hash, &length) == 1;
    EVP_MD_CTX_free(context);
    if (!ok) {
        throw std::runtime_error("OpenSSL SHA-256 digest failed");
    }

    std::stringstream ss;
    for(unsigned int i = 0; i < length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    }
    return ss.str();
}

std::string SPLCrypto::calculate_settlement_seal(const std::string& prev_seal, const Settlement& settlement) {
    std::stringstream data;
    data << prev_seal << '|'
         << settlement.group_id << '|'
         << settlement.from << '|'
         << settlement.to << '|'
         << settlement.amount.to_string() << '|'
         << settlement.external_ref.value_or("");

    return generate_sha256(data.str());
}

std::string SPLCrypto::derive_transfer_reference(const MemberKey& from, const MemberKey& to,
                                                 const Money& amount, std::uint64_t nonce) {
    std::stringstream data;
    data << from << ':' << to << ':' << amount.to_string() << ':' << nonce;
    return "0x" + generate_sha256(data.str());
}

} // namespace spl
