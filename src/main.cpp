/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Server
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: main.cpp
 * ============================================================================
 */

#include <memory>
#include <string>
#include <httplib.h>

#include "api/routes.hpp"
#include "core/config.hpp"
#include "core/ledger_service.hpp"
#include "core/log.hpp"
#include "core/memory_store.hpp"
#include "core/mirror_contract.hpp"
#include "core/pg_store.hpp"
#include "core/reconciler.hpp"
#include "core/wallet_book.hpp"

using namespace spl;

int main() {
    ServiceConfig config;
    try {
        config = load_config();
        validate_config(config);
    } catch (const std::exception &e) {
        spl_log("FATAL", std::string("Configuration rejected: ") + e.what() + ". System halted.");
        return 1;
    }
    set_log_capacity(config.log_capacity);

    // === [SEARCH: STORAGE BACKEND] ===
    std::unique_ptr<LedgerStore> store;
    try {
        if (config.storage_backend == "postgres") {
            auto pg = std::make_unique<PgStore>(config.storage_connection);
            pg->ensure_schema();
            store = std::move(pg);
        } else {
            spl_log("WARN", "No database configured. Ledger is held in memory and lost on restart.");
            store = std::make_unique<MemoryStore>();
        }
    } catch (const std::exception &e) {
        spl_log("FATAL", std::string("Storage unavailable: ") + e.what() + ". System halted.");
        return 1;
    }

    LedgerService ledger(*store);

    // === [SEARCH: EMBEDDED MIRROR] ===
    WalletBook wallets;
    std::unique_ptr<MirrorContract> mirror;
    std::unique_ptr<Reconciler> reconciler;
    if (config.mirror_enabled) {
        try {
            for (const auto& grant : config.genesis_funds) {
                wallets.fund(normalize_member_key(grant.first), grant.second);
            }
        } catch (const std::exception &e) {
            spl_log("FATAL", std::string("Genesis funding failed: ") + e.what() + ". System halted.");
            return 1;
        }
        mirror = std::make_unique<MirrorContract>(wallets);
        reconciler = std::make_unique<Reconciler>(*mirror, ledger);
        spl_log("INFO", "Embedded mirror active with " + std::to_string(config.genesis_funds.size()) + " funded wallets.");
    }

    ServiceContext ctx{config, ledger, mirror.get(), reconciler.get()};

    httplib::Server svr;
    spl_log("INFO", "SPL SplitLedger: Engine Active.");

    svr.set_logger([](const httplib::Request &req, const httplib::Response &res) {
        std::string log_msg = "API Request: " + req.method + " " + req.path + " -> Status " + std::to_string(res.status);
        spl_log("INFO", log_msg);
    });

    register_routes(svr, ctx);

    // === [SEARCH: SERVER INITIALIZATION] ===
    spl_log("INFO", "SPL Server running on " + config.listen_host + ":" + std::to_string(config.listen_port));

    if (!svr.listen(config.listen_host.c_str(), config.listen_port)) {
        spl_log("FATAL", "Unable to bind " + config.listen_host + ":" + std::to_string(config.listen_port));
        return 1;
    }

    return 0;
}
