/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - API Layer
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: json_codec.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Wire format of the HTTP API. Amounts always travel as base-unit decimal
 * strings; a JSON number is accepted on input only when it is integral, and
 * fractional display values are converted exactly or rejected.
 * ============================================================================
 */

#ifndef SPL_JSON_CODEC_HPP
#define SPL_JSON_CODEC_HPP

#include <exception>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "../core/balance_aggregator.hpp"
#include "../core/mirror_contract.hpp"
#include "../core/reconciler.hpp"
#include "../core/settlement_ledger.hpp"
#include "../core/types.hpp"

using json = nlohmann::json;

namespace spl {

    void to_json(json& j, const Money& amount);
    void to_json(json& j, const Group& group);
    void to_json(json& j, const Expense& expense);
    void to_json(json& j, const Settlement& settlement);
    void to_json(json& j, const SimplifiedDebt& debt);
    void to_json(json& j, const RoundingReport& report);
    void to_json(json& j, const ChainVerification& verification);
    void to_json(json& j, const ReconcileReport& report);
    void to_json(json& j, const CrossCheckReport& report);

    // {"member": "balance", ...}
    json balances_to_json(const BalanceSnapshot& balances);

    // Human-readable amount in whole currency units, e.g. "1.5 ETH".
    std::string format_display(const Money& amount, unsigned decimals, const std::string& symbol);

    // {"member": "1.5 ETH", ...}
    json display_balances(const BalanceSnapshot& balances, unsigned decimals, const std::string& symbol);

    /**
     * @brief Reads an amount in base units from a string or integral number.
     * @throws InvalidAmount for floats, malformed strings or other types.
     */
    Money parse_amount(const json& value);

    /**
     * @brief Reads `amount` (base units) or, failing that, `displayAmount`
     * (decimal string in whole currency units) from a request body.
     */
    Money read_amount(const json& body, unsigned display_decimals);

    std::vector<MemberKey> read_member_list(const json& value);

    /**
     * @brief Reads a decimal group id from a path segment, query or body.
     * @throws InvalidRecord if it is empty, not all digits or out of range.
     */
    GroupId parse_group_id(const std::string& raw);

    // HTTP status an exception maps to.
    int http_status_for(const std::exception& e);

    json error_body(const std::string& message);

} // namespace spl

#endif // SPL_JSON_CODEC_HPP
