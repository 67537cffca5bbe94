/**
 * ============================================================================
 * SOFTWARE: SPL: SplitLedger - Balance Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: config.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Service configuration. Precedence, lowest first: built-in defaults, the
 * JSON manifest (SPL_CONFIG, default /app/core/config/spl_config.json),
 * environment variables (SPL_DB_CONN, SPL_HOST, SPL_PORT, SPL_LOG_CAPACITY).
 * ============================================================================
 */

#ifndef SPL_CONFIG_HPP
#define SPL_CONFIG_HPP

#include <cstddef>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

#include "types.hpp"

using json = nlohmann::json;

namespace spl {

    struct ServiceConfig {
        std::string storage_backend = "memory";   // "memory" or "postgres"
        std::string storage_connection;
        std::string listen_host = "0.0.0.0";
        int listen_port = 8080;
        std::size_t log_capacity = 200;
        unsigned display_decimals = 18;
        std::string display_symbol = "ETH";
        bool mirror_enabled = true;
        std::map<MemberKey, Money> genesis_funds;
    };

    /**
     * @brief Overlays a parsed manifest onto `base`. Unknown keys are ignored.
     * @throws std::runtime_error on a value of the wrong type or an
     * unsupported storage backend.
     */
    ServiceConfig apply_manifest(ServiceConfig base, const json& manifest);

    /**
     * @brief Overlays SPL_* environment variables onto `base`.
     */
    ServiceConfig apply_environment(ServiceConfig base);

    /**
     * @brief Full startup load: defaults, manifest file if present, then
     * environment. A missing file is a warning, a corrupt one is fatal.
     */
    ServiceConfig load_config();

    // Final consistency checks before the service starts.
    void validate_config(const ServiceConfig& config);

} // namespace spl

#endif // SPL_CONFIG_HPP
