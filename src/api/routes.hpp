/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - API Layer
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: routes.hpp
 * ============================================================================
 * * DESCRIPTION:
 * HTTP surface of the service. Authentication happens upstream at the
 * gateway, which forwards the caller in the Remote-User header and admin
 * membership in Remote-Groups.
 * ============================================================================
 */

#ifndef SPL_ROUTES_HPP
#define SPL_ROUTES_HPP

#include <httplib.h>

#include "../core/config.hpp"
#include "../core/ledger_service.hpp"
#include "../core/mirror_contract.hpp"
#include "../core/reconciler.hpp"

namespace spl {

    struct ServiceContext {
        ServiceConfig config;
        LedgerService& ledger;

        // Both null when the embedded mirror is disabled.
        MirrorContract* mirror = nullptr;
        Reconciler* reconciler = nullptr;
    };

    void register_routes(httplib::Server& svr, ServiceContext& ctx);

} // namespace spl

#endif // SPL_ROUTES_HPP
