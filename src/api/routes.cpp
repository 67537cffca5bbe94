/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - API Layer
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: routes.cpp
 * ============================================================================
 */

#include "routes.hpp"
#include "json_codec.hpp"
#include "../core/errors.hpp"
#include "../core/log.hpp"

#include <algorithm>
#include <optional>
#include <string>

namespace spl {

namespace {

bool is_authenticated(const httplib::Request &req) {
    return req.has_header("Remote-User") && !req.get_header_value("Remote-User").empty();
}

bool is_admin(const httplib::Request &req) {
    if (req.has_header("Remote-Groups")) {
        std::string groups = req.get_header_value("Remote-Groups");
        return groups.find("admins") != std::string::npos;
    }
    return false;
}

void reply(httplib::Response &res, const json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void fail(httplib::Response &res, const std::string& operation, const std::exception& e) {
    int status = http_status_for(e);
    if (status >= 500) {
        spl_log(dynamic_cast<const LedgerCorruption*>(&e) ? "CRITICAL" : "ERROR", operation + " failed: " + e.what());
    }
    reply(res, error_body(e.what()), status);
}

GroupId group_param(const httplib::Request &req) {
    if (!req.has_param("group")) {
        throw InvalidRecord("group param required");
    }
    return parse_group_id(req.get_param_value("group"));
}

GroupId group_path(const httplib::Request &req) {
    return parse_group_id(req.matches[1].str());
}

GroupId group_field(const json& body) {
    const json& value = body.at("groupId");
    if (value.is_string()) {
        return parse_group_id(value.get<std::string>());
    }
    if (!value.is_number_unsigned()) {
        throw InvalidRecord("Invalid group ID");
    }
    return value.get<GroupId>();
}

template <typename T>
json newest_first(std::vector<T> records) {
    std::reverse(records.begin(), records.end());
    return json(records);
}

} // namespace

void register_routes(httplib::Server& svr, ServiceContext& ctx) {

    auto require_user = [](const httplib::Request &req, httplib::Response &res) -> bool {
        if (!is_authenticated(req)) {
            reply(res, error_body("401 Unauthorized - Secure Gateway Login Required"), 401);
            return false;
        }
        return true;
    };

    auto require_mirror = [&ctx](httplib::Response &res) -> bool {
        if (ctx.mirror == nullptr) {
            reply(res, error_body("Embedded mirror is disabled."), 503);
            return false;
        }
        return true;
    };

    // === [SEARCH: GROUP ROUTES] ===
    svr.Post("/api/groups", [&](const httplib::Request &req, httplib::Response &res) {
        if (!require_user(req, res)) return;
        try {
            auto j = json::parse(req.body);
            std::string name = j.at("name").get<std::string>();
            std::string creator = j.value("creator", req.get_header_value("Remote-User"));
            std::vector<MemberKey> members = j.contains("members") ? read_member_list(j.at("members"))
                                                                   : std::vector<MemberKey>();

            Group group = ctx.ledger.create_group(name, creator, members);
            reply(res, group);
        } catch (const std::exception &e) {
            fail(res, "Create group", e);
        }
    });

    svr.Get("/api/groups", [&](const httplib::Request &req, httplib::Response &res) {
        if (!require_user(req, res)) return;
        try {
            if (!req.has_param("user")) throw InvalidRecord("user param required");
            reply(res, json(ctx.ledger.groups_for(req.get_param_value("user"))));
        } catch (const std::exception &e) {
            fail(res, "List groups", e);
        }
    });

    svr.Get(R"(/api/groups/(\d+))", [&](const httplib::Request &req, httplib::Response &res) {
        if (!require_user(req, res)) return;
        try {
            GroupId group_id = group_path(req);
            json body = ctx.ledger.get_group(group_id);
            body["expenses"] = newest_first(ctx.ledger.list_expenses(group_id));
            reply(res, body);
        } catch (const std::exception &e) {
            fail(res, "Fetch group", e);
        }
    });

    svr.Get(R"(/api/groups/(\d+)/members)", [&](const httplib::Request &req, httplib::Response &res) {
        if (!require_user(req, res)) return;
        try {
            reply(res, {{"members", ctx.ledger.members_of(group_path(req))}});
        } catch (const std::exception &e) {
            fail(res, "List members", e);
        }
    });

    svr.Post(R"(/api/groups/(\d+)/members)", [&](const httplib::Request &req, httplib::Response &res) {
        if (!require_user(req, res)) return;
        try {
            GroupId group_id = group_path(req);
            auto j = json::parse(req.body);
            ctx.ledger.add_member(group_id, j.at("member").get<std::string>());
            reply(res, ctx.ledger.get_group(group_id));
        } catch (const std::exception &e) {
            fail(res, "Add member", e);
        }
    });

    svr.Get(R"(/api/groups/(\d+)/audit)", [&](const httplib::Request &req, httplib::Response &res) {
        if (!require_user(req, res)) return;
        try {
            GroupId group_id = group_path(req);
            reply(res, {
                {"rounding", ctx.ledger.rounding_report(group_id)},
                {"settlementChain", ctx.ledger.verify_settlements(group_id)}
            });
        } catch (const std::exception &e) {
            fail(res, "Audit group", e);
        }
    });

    // === [SEARCH: EXPENSE ROUTES] ===
    svr.Get("/api/expenses", [&](const httplib::Request &req, httplib::Response &res) {
        if (!require_user(req, res)) return;
        try {
            reply(res, newest_first(ctx.ledger.list_expenses(group_param(req))));
        } catch (const std::exception &e) {
            fail(res, "List expenses", e);
        }
    });

    svr.Post("/api/expenses", [&](const httplib::Request &req, httplib::Response &res) {
        if (!require_user(req, res)) return;
        try {
            auto j = json::parse(req.body);
            Expense expense = ctx.ledger.add_expense(group_field(j),
                                                     j.at("payer").get<std::string>(),
                                                     read_amount(j, ctx.config.display_decimals),
                                                     j.at("description").get<std::string>(),
                                                     read_member_list(j.at("participants")));
            reply(res, expense);
        } catch (const std::exception &e) {
            fail(res, "Add expense", e);
        }
    });

    // === [SEARCH: SETTLEMENT ROUTES] ===
    svr.Get("/api/settlements", [&](const httplib::Request &req, httplib::Response &res) {
        if (!require_user(req, res)) return;
        try {
            reply(res, newest_first(ctx.ledger.list_settlements(group_param(req))));
        } catch (const std::exception &e) {
            fail(res, "List settlements", e);
        }
    });

    svr.Post("/api/settlements", [&](const httplib::Request &req, httplib::Response &res) {
        if (!require_user(req, res)) return;
        try {
            auto j = json::parse(req.body);
            std::optional<std::string> tx_ref;
            if (j.contains("txHash") && !j.at("txHash").is_null()) {
                tx_ref = j.at("txHash").get<std::string>();
            }

            Settlement settlement = ctx.ledger.record_settlement(group_field(j),
                                                                 j.at("from").get<std::string>(),
                                                                 j.at("to").get<std::string>(),
                                                                 read_amount(j, ctx.config.display_decimals),
                                                                 tx_ref);
            reply(res, settlement);
        } catch (const std::exception &e) {
            fail(res, "Record settlement", e);
        }
    });

    // === [SEARCH: BALANCES & SIMPLIFIED DEBTS] ===
    svr.Get("/api/balances", [&](const httplib::Request &req, httplib::Response &res) {
        if (!require_user(req, res)) return;
        try {
            GroupId group_id = group_param(req);
            BalanceSnapshot balances = ctx.ledger.get_balances(group_id);
            std::vector<SimplifiedDebt> debts = req.has_param("user")
                ? ctx.ledger.get_simplified_debts(group_id, req.get_param_value("user"))
                : ctx.ledger.get_simplified_debts(group_id);

            reply(res, {
                {"balances", balances_to_json(balances)},
                {"display", display_balances(balances, ctx.config.display_decimals, ctx.config.display_symbol)},
                {"debts", debts},
                {"total", balances.total()}
            });
        } catch (const std::exception &e) {
            fail(res, "Calculate balances", e);
        }
    });

    // === [SEARCH: EMBEDDED MIRROR ABI] ===
    svr.Post("/api/mirror/groups", [&](const httplib::Request &req, httplib::Response &res) {
        if (!require_user(req, res) || !require_mirror(res)) return;
        try {
            auto j = json::parse(req.body);
            std::vector<MemberKey> members;
            for (const auto& m : j.contains("members") ? read_member_list(j.at("members")) : std::vector<MemberKey>()) {
                members.push_back(normalize_member_key(m));
            }
            GroupId group_id = ctx.mirror->create_group(normalize_member_key(req.get_header_value("Remote-User")),
                                                        j.at("name").get<std::string>(), members);
            reply(res, {{"groupId", group_id}, {"members", ctx.mirror->get_group_members(group_id)}});
        } catch (const std::exception &e) {
            fail(res, "Mirror createGroup", e);
        }
    });

    svr.Post(R"(/api/mirror/groups/(\d+)/join)", [&](const httplib::Request &req, httplib::Response &res) {
        if (!require_user(req, res) || !require_mirror(res)) return;
        try {
            GroupId group_id = group_path(req);
            ctx.mirror->join_group(normalize_member_key(req.get_header_value("Remote-User")), group_id);
            reply(res, {{"groupId", group_id}, {"members", ctx.mirror->get_group_members(group_id)}});
        } catch (const std::exception &e) {
            fail(res, "Mirror joinGroup", e);
        }
    });

    svr.Post("/api/mirror/expenses", [&](const httplib::Request &req, httplib::Response &res) {
        if (!require_user(req, res) || !require_mirror(res)) return;
        try {
            auto j = json::parse(req.body);
            std::vector<MemberKey> participants;
            for (const auto& p : read_member_list(j.at("participants"))) {
                participants.push_back(normalize_member_key(p));
            }
            RecordId expense_id = ctx.mirror->add_expense(normalize_member_key(req.get_header_value("Remote-User")),
                                                          group_field(j),
                                                          read_amount(j, ctx.config.display_decimals),
                                                          j.value("description", std::string()),
                                                          participants);
            reply(res, ctx.mirror->get_expense(expense_id));
        } catch (const std::exception &e) {
            fail(res, "Mirror addExpense", e);
        }
    });

    svr.Get("/api/mirror/balances", [&](const httplib::Request &req, httplib::Response &res) {
        if (!require_user(req, res) || !require_mirror(res)) return;
        try {
            GroupId group_id = group_param(req);
            if (req.has_param("user")) {
                MemberKey member = normalize_member_key(req.get_param_value("user"));
                Money balance = ctx.mirror->get_member_balance(group_id, member);
                reply(res, {
                    {"member", member},
                    {"balance", balance},
                    {"display", format_display(balance, ctx.config.display_decimals, ctx.config.display_symbol)}
                });
                return;
            }
            auto all = ctx.mirror->get_all_balances(group_id);
            std::vector<BalanceSnapshot::Entry> entries;
            for (std::size_t i = 0; i < all.first.size(); ++i) {
                entries.push_back({all.first[i], all.second[i]});
            }
            BalanceSnapshot snapshot(group_id, entries);
            reply(res, {
                {"members", all.first},
                {"balances", all.second},
                {"display", display_balances(snapshot, ctx.config.display_decimals, ctx.config.display_symbol)}
            });
        } catch (const std::exception &e) {
            fail(res, "Mirror getAllBalances", e);
        }
    });

    svr.Get("/api/mirror/debts", [&](const httplib::Request &req, httplib::Response &res) {
        if (!require_user(req, res) || !require_mirror(res)) return;
        try {
            reply(res, json(ctx.mirror->get_simplified_debts(group_param(req))));
        } catch (const std::exception &e) {
            fail(res, "Mirror getSimplifiedDebts", e);
        }
    });

    svr.Post("/api/mirror/settle", [&](const httplib::Request &req, httplib::Response &res) {
        if (!require_user(req, res) || !require_mirror(res)) return;
        try {
            auto j = json::parse(req.body);
            TransferReceipt receipt = ctx.mirror->settle(normalize_member_key(req.get_header_value("Remote-User")),
                                                         group_field(j),
                                                         normalize_member_key(j.at("creditor").get<std::string>()),
                                                         read_amount(j, ctx.config.display_decimals));
            reply(res, {{"txHash", receipt.reference}, {"amount", receipt.confirmed_amount}});
        } catch (const std::exception &e) {
            fail(res, "Mirror settle", e);
        }
    });

    // === [SEARCH: RECONCILIATION] ===
    svr.Post("/api/reconcile", [&](const httplib::Request &req, httplib::Response &res) {
        if (!require_user(req, res) || !require_mirror(res)) return;
        try {
            json body = {{"report", ctx.reconciler->run()}};

            if (!req.body.empty()) {
                auto j = json::parse(req.body);
                if (j.contains("groupId")) {
                    body["crossCheck"] = ctx.reconciler->cross_check(group_field(j));
                }
            }
            reply(res, body);
        } catch (const std::exception &e) {
            fail(res, "Reconcile", e);
        }
    });

    // === [SEARCH: SYSTEM ROUTES] ===
    svr.Get("/api/system/logs", [&](const httplib::Request &req, httplib::Response &res) {
        if (!is_admin(req)) {
            spl_log("WARN", "Unauthorized log access blocked.");
            reply(res, error_body("Action Requires Administrator Privileges."), 403);
            return;
        }
        reply(res, {{"logs", recent_logs()}});
    });
}

} // namespace spl
