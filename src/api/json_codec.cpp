#include "json_codec.hpp"
#include "../core/errors.hpp"

#include <stdexcept>

namespace spl {

void to_json(json& j, const Money& amount) {
    j = amount.to_string();
}

void to_json(json& j, const Group& group) {
    j = {
        {"id", group.id},
        {"name", group.name},
        {"creator", group.creator},
        {"members", group.members},
        {"active", group.active},
        {"createdAt", group.created_at}
    };
}

void to_json(json& j, const Expense& expense) {
    Money::Split split = expense.amount.split(expense.participants.size());
    j = {
        {"id", expense.id},
        {"groupId", expense.group_id},
        {"payer", expense.payer},
        {"amount", expense.amount},
        {"description", expense.description},
        {"participants", expense.participants},
        {"share", split.share},
        {"remainder", split.remainder},
        {"createdAt", expense.created_at}
    };
}

void to_json(json& j, const Settlement& settlement) {
    j = {
        {"id", settlement.id},
        {"groupId", settlement.group_id},
        {"from", settlement.from},
        {"to", settlement.to},
        {"amount", settlement.amount},
        {"txHash", settlement.external_ref ? json(*settlement.external_ref) : json(nullptr)},
        {"settledAt", settlement.settled_at},
        {"seal", settlement.seal}
    };
}

void to_json(json& j, const SimplifiedDebt& debt) {
    j = {
        {"from", debt.from},
        {"to", debt.to},
        {"amount", debt.amount}
    };
}

void to_json(json& j, const RoundingReport& report) {
    json entries = json::array();
    for (const auto& entry : report.entries) {
        entries.push_back({
            {"expenseId", entry.expense_id},
            {"amount", entry.amount},
            {"participants", entry.participants},
            {"share", entry.share},
            {"remainder", entry.remainder}
        });
    }
    j = {
        {"groupId", report.group_id},
        {"entries", entries},
        {"totalRemainder", report.total_remainder}
    };
}

void to_json(json& j, const ChainVerification& verification) {
    j = {
        {"intact", verification.intact},
        {"recordsChecked", verification.records_checked},
        {"firstBroken", verification.first_broken ? json(*verification.first_broken) : json(nullptr)}
    };
}

void to_json(json& j, const ReconcileReport& report) {
    j = {
        {"eventsSeen", report.events_seen},
        {"recorded", report.recorded},
        {"alreadyPresent", report.already_present},
        {"cursor", report.cursor},
        {"haltedOn", report.halted_on ? json(*report.halted_on) : json(nullptr)}
    };
}

void to_json(json& j, const CrossCheckReport& report) {
    json mismatches = json::array();
    for (const auto& m : report.mismatches) {
        mismatches.push_back({
            {"member", m.member},
            {"advisory", m.advisory},
            {"authoritative", m.authoritative}
        });
    }
    j = {
        {"groupId", report.group_id},
        {"consistent", report.consistent()},
        {"mismatches", mismatches}
    };
}

json balances_to_json(const BalanceSnapshot& balances) {
    json out = json::object();
    for (const auto& entry : balances.entries()) {
        out[entry.member] = entry.balance;
    }
    return out;
}

std::string format_display(const Money& amount, unsigned decimals, const std::string& symbol) {
    std::string out = amount.to_decimal(decimals);
    if (!symbol.empty()) {
        out += " " + symbol;
    }
    return out;
}

json display_balances(const BalanceSnapshot& balances, unsigned decimals, const std::string& symbol) {
    json out = json::object();
    for (const auto& entry : balances.entries()) {
        out[entry.member] = format_display(entry.balance, decimals, symbol);
    }
    return out;
}

Money parse_amount(const json& value) {
    if (value.is_string()) {
        return Money::from_string(value.get<std::string>());
    }
    if (value.is_number_unsigned()) {
        return Money(Money::value_type(value.get<std::uint64_t>()));
    }
    if (value.is_number_integer()) {
        return Money(value.get<std::int64_t>());
    }
    throw InvalidAmount("Amount must be a base-unit integer string, got " + value.dump());
}

Money read_amount(const json& body, unsigned display_decimals) {
    if (body.contains("amount")) {
        return parse_amount(body.at("amount"));
    }
    if (body.contains("displayAmount")) {
        const json& display = body.at("displayAmount");
        if (!display.is_string()) {
            throw InvalidAmount("displayAmount must be a decimal string");
        }
        return Money::from_decimal(display.get<std::string>(), display_decimals);
    }
    throw InvalidAmount("amount is required");
}

std::vector<MemberKey> read_member_list(const json& value) {
    if (!value.is_array()) {
        throw InvalidRecord("Expected an array of member addresses");
    }
    std::vector<MemberKey> members;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw InvalidRecord("Member address must be a string");
        }
        members.push_back(item.get<std::string>());
    }
    return members;
}

GroupId parse_group_id(const std::string& raw) {
    if (raw.empty() || raw.find_first_not_of("0123456789") != std::string::npos) {
        throw InvalidRecord("Invalid group ID");
    }
    try {
        return std::stoull(raw);
    } catch (const std::out_of_range&) {
        throw InvalidRecord("Invalid group ID");
    }
}

int http_status_for(const std::exception& e) {
    if (dynamic_cast<const DuplicateReference*>(&e)) return 409;
    if (dynamic_cast<const ReentrantCall*>(&e)) return 409;
    if (dynamic_cast<const UnknownGroup*>(&e)) return 404;
    if (dynamic_cast<const OverpaymentRejected*>(&e)) return 422;
    if (dynamic_cast<const SettlementRejected*>(&e)) return 422;
    if (dynamic_cast<const TransferFailed*>(&e)) return 422;
    if (dynamic_cast<const LedgerCorruption*>(&e)) return 500;
    if (dynamic_cast<const LedgerError*>(&e)) return 400;
    if (dynamic_cast<const json::exception*>(&e)) return 400;
    return 500;
}

json error_body(const std::string& message) {
    return {{"error", message}};
}

} // namespace spl
