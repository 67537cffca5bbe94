/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: settlement_ledger.cpp
 * ============================================================================
 */

#include "settlement_ledger.hpp"
#include "balance_aggregator.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "log.hpp"

namespace spl {

SettlementLedger::SettlementLedger(LedgerStore& store) : store_(store) {}

std::shared_ptr<std::mutex> SettlementLedger::lock_for(GroupId group_id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto& slot = group_locks_[group_id];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

// ----------------------------------------------------------------------------
// record_settlement
// Everything is validated before the store is written. The seal chains the
// record to the group's previous settlement, like ledger rows in the core.
// ----------------------------------------------------------------------------
Settlement SettlementLedger::record_settlement(GroupId group_id, const MemberKey& from, const MemberKey& to,
                                               const Money& amount, const std::optional<std::string>& external_ref) {
    std::optional<Group> group = store_.find_group(group_id);
    if (!group) {
        throw UnknownGroup("Group does not exist: " + std::to_string(group_id));
    }
    if (external_ref && external_ref->empty()) {
        throw InvalidRecord("Transfer reference must not be empty when present");
    }

    Settlement settlement;
    settlement.group_id = group_id;
    settlement.from = from;
    settlement.to = to;
    settlement.amount = amount;
    settlement.external_ref = external_ref;

    try {
        validate_settlement(*group, settlement);
    } catch (const LedgerError& e) {
        spl_log("WARN", "Settlement rejected in group " + std::to_string(group_id) + ": " + e.what());
        throw;
    }

    std::shared_ptr<std::mutex> group_lock = lock_for(group_id);
    std::lock_guard<std::mutex> guard(*group_lock);

    std::vector<Settlement> history = store_.list_settlements(group_id);
    std::string prev_seal = history.empty() ? "GENESIS" : history.back().seal;
    settlement.seal = SPLCrypto::calculate_settlement_seal(prev_seal, settlement);

    Settlement stored;
    try {
        stored = store_.append_settlement(settlement);
    } catch (const DuplicateReference& e) {
        spl_log("WARN", "Duplicate settlement reference ignored: " + e.reference());
        throw;
    }

    spl_log("INFO", "Settlement " + std::to_string(stored.id) + " recorded in group " + std::to_string(group_id) +
                    ": " + from + " -> " + to + " " + amount.to_string() +
                    (external_ref ? " ref " + *external_ref : std::string(" (no ref)")));
    return stored;
}

std::vector<Settlement> SettlementLedger::list(GroupId group_id) {
    return store_.list_settlements(group_id);
}

std::optional<Settlement> SettlementLedger::find_by_reference(const std::string& reference) {
    return store_.find_settlement_by_reference(reference);
}

ChainVerification SettlementLedger::verify_chain(GroupId group_id) {
    ChainVerification result;
    std::string expected_prev_seal = "GENESIS";

    for (const auto& settlement : store_.list_settlements(group_id)) {
        ++result.records_checked;
        std::string recalc = SPLCrypto::calculate_settlement_seal(expected_prev_seal, settlement);
        if (recalc != settlement.seal) {
            result.intact = false;
            result.first_broken = settlement.id;
            spl_log("CRITICAL", "Settlement seal mismatch in group " + std::to_string(group_id) +
                                " at record " + std::to_string(settlement.id));
            break;
        }
        expected_prev_seal = settlement.seal;
    }
    return result;
}

} // namespace spl
