#include "reconciler.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <map>

namespace spl {

Reconciler::Reconciler(IMirrorSource& mirror, LedgerService& ledger, std::uint64_t cursor)
    : mirror_(mirror), ledger_(ledger), cursor_(cursor) {}

std::uint64_t Reconciler::cursor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cursor_;
}

ReconcileReport Reconciler::run() {
    std::lock_guard<std::mutex> lock(mutex_);

    ReconcileReport report;
    for (const auto& event : mirror_.settlement_events_since(cursor_)) {
        ++report.events_seen;
        try {
            ledger_.record_settlement(event.group_id, event.actor, event.counterparty, event.amount, event.reference);
            ++report.recorded;
        } catch (const DuplicateReference&) {
            ++report.already_present;
        } catch (const LedgerError& e) {
            report.halted_on = event.reference + ": " + e.what();
            spl_log("ERROR", "Reconciliation halted at mirror event " + std::to_string(event.sequence) +
                             " (" + event.reference + "): " + e.what());
            break;
        }
        cursor_ = event.sequence;
    }

    report.cursor = cursor_;
    if (report.events_seen > 0) {
        spl_log("INFO", "Reconciliation pass: " + std::to_string(report.recorded) + " recorded, " +
                        std::to_string(report.already_present) + " already present, cursor " +
                        std::to_string(cursor_));
    }
    return report;
}

CrossCheckReport Reconciler::cross_check(GroupId group_id) {
    CrossCheckReport report;
    report.group_id = group_id;

    std::map<MemberKey, Money> authoritative;
    auto mirror_view = mirror_.get_all_balances(group_id);
    for (std::size_t i = 0; i < mirror_view.first.size() && i < mirror_view.second.size(); ++i) {
        authoritative[mirror_view.first[i]] = mirror_view.second[i];
    }

    BalanceSnapshot advisory = ledger_.get_balances(group_id);
    for (const auto& entry : advisory.entries()) {
        auto it = authoritative.find(entry.member);
        Money expected = it == authoritative.end() ? Money(0) : it->second;
        if (expected != entry.balance) {
            report.mismatches.push_back({entry.member, entry.balance, expected});
        }
        if (it != authoritative.end()) authoritative.erase(it);
    }
    for (const auto& pair : authoritative) {
        if (!pair.second.is_zero()) {
            report.mismatches.push_back({pair.first, Money(0), pair.second});
        }
    }

    if (!report.consistent()) {
        spl_log("WARN", "Group " + std::to_string(group_id) + " advisory balances diverge from mirror on " +
                        std::to_string(report.mismatches.size()) + " members");
    }
    return report;
}

} // namespace spl
