/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: pg_store.cpp
 * ============================================================================
 */

#include "pg_store.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <pqxx/pqxx>

namespace spl {

namespace {

const char* SETTLEMENT_COLUMNS = "id, group_id, from_member, to_member, amount, tx_ref, settled_at, seal";

std::vector<MemberKey> load_roster(pqxx::work& W, GroupId id) {
    pqxx::result R = W.exec("SELECT member FROM spl_group_member WHERE group_id = " + std::to_string(id) +
                            " ORDER BY position ASC");
    std::vector<MemberKey> members;
    for (auto row : R) {
        members.push_back(row[0].as<std::string>());
    }
    return members;
}

Group load_group(pqxx::work& W, const pqxx::row& row) {
    Group group;
    group.id = row[0].as<GroupId>();
    group.name = row[1].as<std::string>();
    group.creator = row[2].as<std::string>();
    group.active = row[3].as<bool>();
    group.created_at = row[4].as<Timestamp>();
    group.members = load_roster(W, group.id);
    return group;
}

Settlement load_settlement(const pqxx::row& row) {
    Settlement settlement;
    settlement.id = row[0].as<RecordId>();
    settlement.group_id = row[1].as<GroupId>();
    settlement.from = row[2].as<std::string>();
    settlement.to = row[3].as<std::string>();
    settlement.amount = Money::from_string(row[4].as<std::string>());
    if (!row[5].is_null()) settlement.external_ref = row[5].as<std::string>();
    settlement.settled_at = row[6].as<Timestamp>();
    settlement.seal = row[7].as<std::string>();
    return settlement;
}

} // namespace

PgStore::PgStore(const std::string& conn_str) : conn_str_(conn_str) {}

void PgStore::ensure_schema() {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);

    W.exec("CREATE TABLE IF NOT EXISTS spl_group ("
           "id BIGSERIAL PRIMARY KEY, name TEXT NOT NULL, creator TEXT NOT NULL, "
           "active BOOLEAN NOT NULL DEFAULT TRUE, created_at BIGINT NOT NULL)");
    W.exec("CREATE TABLE IF NOT EXISTS spl_group_member ("
           "group_id BIGINT NOT NULL REFERENCES spl_group(id) ON DELETE CASCADE, "
           "member TEXT NOT NULL, position INTEGER NOT NULL, PRIMARY KEY (group_id, member))");
    W.exec("CREATE TABLE IF NOT EXISTS spl_expense ("
           "id BIGSERIAL PRIMARY KEY, group_id BIGINT NOT NULL REFERENCES spl_group(id), "
           "payer TEXT NOT NULL, amount TEXT NOT NULL, description TEXT NOT NULL, created_at BIGINT NOT NULL)");
    W.exec("CREATE TABLE IF NOT EXISTS spl_expense_participant ("
           "expense_id BIGINT NOT NULL REFERENCES spl_expense(id) ON DELETE CASCADE, "
           "member TEXT NOT NULL, position INTEGER NOT NULL, PRIMARY KEY (expense_id, member))");
    // NULL references are allowed for records that predate transfer ids.
    W.exec("CREATE TABLE IF NOT EXISTS spl_settlement ("
           "id BIGSERIAL PRIMARY KEY, group_id BIGINT NOT NULL REFERENCES spl_group(id), "
           "from_member TEXT NOT NULL, to_member TEXT NOT NULL, amount TEXT NOT NULL, "
           "tx_ref TEXT UNIQUE, settled_at BIGINT NOT NULL, seal TEXT NOT NULL)");

    W.commit();
    spl_log("INFO", "PostgreSQL schema verified.");
}

Group PgStore::create_group(Group group) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);

    if (group.created_at == 0) group.created_at = now_seconds();
    pqxx::result R = W.exec("INSERT INTO spl_group (name, creator, active, created_at) VALUES (" +
                            W.quote(group.name) + ", " + W.quote(group.creator) + ", " +
                            (group.active ? "TRUE" : "FALSE") + ", " + std::to_string(group.created_at) +
                            ") RETURNING id");
    group.id = R[0][0].as<GroupId>();

    for (std::size_t i = 0; i < group.members.size(); ++i) {
        W.exec("INSERT INTO spl_group_member (group_id, member, position) VALUES (" +
               std::to_string(group.id) + ", " + W.quote(group.members[i]) + ", " + std::to_string(i) + ")");
    }

    W.commit();
    return group;
}

std::optional<Group> PgStore::find_group(GroupId id) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);

    pqxx::result R = W.exec("SELECT id, name, creator, active, created_at FROM spl_group WHERE id = " +
                            std::to_string(id));
    if (R.empty()) return std::nullopt;
    return load_group(W, R[0]);
}

bool PgStore::add_member(GroupId id, const MemberKey& member) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);

    pqxx::result exists = W.exec("SELECT 1 FROM spl_group WHERE id = " + std::to_string(id));
    if (exists.empty()) {
        throw UnknownGroup("Group does not exist: " + std::to_string(id));
    }

    pqxx::result R = W.exec("INSERT INTO spl_group_member (group_id, member, position) "
                            "SELECT " + std::to_string(id) + ", " + W.quote(member) + ", "
                            "COALESCE(MAX(position) + 1, 0) FROM spl_group_member WHERE group_id = " +
                            std::to_string(id) + " ON CONFLICT DO NOTHING");
    W.commit();
    return R.affected_rows() == 1;
}

std::vector<Group> PgStore::list_groups_for(const MemberKey& member) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);

    pqxx::result R = W.exec("SELECT g.id, g.name, g.creator, g.active, g.created_at FROM spl_group g "
                            "JOIN spl_group_member m ON m.group_id = g.id WHERE m.member = " + W.quote(member) +
                            " ORDER BY g.id ASC");
    std::vector<Group> groups;
    for (auto row : R) {
        groups.push_back(load_group(W, row));
    }
    return groups;
}

std::vector<Expense> PgStore::list_expenses(GroupId id) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);

    pqxx::result R = W.exec("SELECT id, group_id, payer, amount, description, created_at FROM spl_expense "
                            "WHERE group_id = " + std::to_string(id) + " ORDER BY id ASC");
    std::vector<Expense> expenses;
    for (auto row : R) {
        Expense expense;
        expense.id = row[0].as<RecordId>();
        expense.group_id = row[1].as<GroupId>();
        expense.payer = row[2].as<std::string>();
        expense.amount = Money::from_string(row[3].as<std::string>());
        expense.description = row[4].as<std::string>();
        expense.created_at = row[5].as<Timestamp>();

        pqxx::result P = W.exec("SELECT member FROM spl_expense_participant WHERE expense_id = " +
                                std::to_string(expense.id) + " ORDER BY position ASC");
        for (auto p : P) {
            expense.participants.push_back(p[0].as<std::string>());
        }
        expenses.push_back(expense);
    }
    return expenses;
}

Expense PgStore::append_expense(Expense expense) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);

    if (expense.created_at == 0) expense.created_at = now_seconds();
    pqxx::result R = W.exec("INSERT INTO spl_expense (group_id, payer, amount, description, created_at) VALUES (" +
                            std::to_string(expense.group_id) + ", " + W.quote(expense.payer) + ", " +
                            W.quote(expense.amount.to_string()) + ", " + W.quote(expense.description) + ", " +
                            std::to_string(expense.created_at) + ") RETURNING id");
    expense.id = R[0][0].as<RecordId>();

    for (std::size_t i = 0; i < expense.participants.size(); ++i) {
        W.exec("INSERT INTO spl_expense_participant (expense_id, member, position) VALUES (" +
               std::to_string(expense.id) + ", " + W.quote(expense.participants[i]) + ", " + std::to_string(i) + ")");
    }

    W.commit();
    return expense;
}

std::vector<Settlement> PgStore::list_settlements(GroupId id) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);

    pqxx::result R = W.exec(std::string("SELECT ") + SETTLEMENT_COLUMNS + " FROM spl_settlement WHERE group_id = " +
                            std::to_string(id) + " ORDER BY id ASC");
    std::vector<Settlement> settlements;
    for (auto row : R) {
        settlements.push_back(load_settlement(row));
    }
    return settlements;
}

Settlement PgStore::append_settlement(Settlement settlement) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);

    if (settlement.settled_at == 0) settlement.settled_at = now_seconds();
    std::string ref_sql = settlement.external_ref ? W.quote(*settlement.external_ref) : std::string("NULL");

    try {
        pqxx::result R = W.exec("INSERT INTO spl_settlement (group_id, from_member, to_member, amount, tx_ref, settled_at, seal) VALUES (" +
                                std::to_string(settlement.group_id) + ", " + W.quote(settlement.from) + ", " +
                                W.quote(settlement.to) + ", " + W.quote(settlement.amount.to_string()) + ", " +
                                ref_sql + ", " + std::to_string(settlement.settled_at) + ", " +
                                W.quote(settlement.seal) + ") RETURNING id");
        settlement.id = R[0][0].as<RecordId>();
        W.commit();
    } catch (const pqxx::unique_violation&) {
        throw DuplicateReference(settlement.external_ref.value_or(""));
    }
    return settlement;
}

std::optional<Settlement> PgStore::find_settlement_by_reference(const std::string& reference) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);

    pqxx::result R = W.exec(std::string("SELECT ") + SETTLEMENT_COLUMNS + " FROM spl_settlement WHERE tx_ref = " +
                            W.quote(reference));
    if (R.empty()) return std::nullopt;
    return load_settlement(R[0]);
}

} // namespace spl
