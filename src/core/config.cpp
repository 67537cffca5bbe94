#include "config.hpp"
#include "log.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace spl {

namespace {

const char* DEFAULT_CONFIG_PATH = "/app/core/config/spl_config.json";

} // namespace

ServiceConfig apply_manifest(ServiceConfig base, const json& manifest) {
    if (!manifest.is_object()) {
        throw std::runtime_error("Configuration root must be an object");
    }

    try {
        if (manifest.contains("storage")) {
            const json& storage = manifest.at("storage");
            base.storage_backend = storage.value("backend", base.storage_backend);
            base.storage_connection = storage.value("connection", base.storage_connection);
        }
        if (manifest.contains("server")) {
            const json& server = manifest.at("server");
            base.listen_host = server.value("host", base.listen_host);
            base.listen_port = server.value("port", base.listen_port);
        }
        if (manifest.contains("log")) {
            base.log_capacity = manifest.at("log").value("capacity", base.log_capacity);
        }
        if (manifest.contains("display")) {
            const json& display = manifest.at("display");
            base.display_decimals = display.value("decimals", base.display_decimals);
            base.display_symbol = display.value("symbol", base.display_symbol);
        }
        if (manifest.contains("mirror")) {
            const json& mirror = manifest.at("mirror");
            base.mirror_enabled = mirror.value("enabled", base.mirror_enabled);
            if (mirror.contains("genesis_funds")) {
                for (const auto& item : mirror.at("genesis_funds").items()) {
                    base.genesis_funds[item.key()] = Money::from_string(item.value().get<std::string>());
                }
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid configuration value: ") + e.what());
    }

    if (base.storage_backend != "memory" && base.storage_backend != "postgres") {
        throw std::runtime_error("Unsupported storage backend: " + base.storage_backend);
    }
    return base;
}

ServiceConfig apply_environment(ServiceConfig base) {
    if (const char* env_db = std::getenv("SPL_DB_CONN")) {
        base.storage_connection = env_db;
        base.storage_backend = "postgres";
    }
    if (const char* env_host = std::getenv("SPL_HOST")) {
        base.listen_host = env_host;
    }
    if (const char* env_port = std::getenv("SPL_PORT")) {
        base.listen_port = std::stoi(env_port);
    }
    if (const char* env_capacity = std::getenv("SPL_LOG_CAPACITY")) {
        base.log_capacity = static_cast<std::size_t>(std::stoul(env_capacity));
    }
    return base;
}

ServiceConfig load_config() {
    ServiceConfig config;

    const char* env_path = std::getenv("SPL_CONFIG");
    std::string config_path = env_path ? env_path : DEFAULT_CONFIG_PATH;

    std::ifstream ifs(config_path);
    if (ifs.is_open()) {
        json manifest;
        try {
            manifest = json::parse(ifs);
        } catch (const json::parse_error& e) {
            spl_log("FATAL", "Config Parse Error: " + std::string(e.what()));
            throw std::runtime_error("Configuration file is corrupt: " + config_path);
        }
        config = apply_manifest(config, manifest);
        spl_log("INFO", "Configuration loaded from " + config_path);
    } else {
        spl_log("WARN", "Config file missing at " + config_path + ". Using system defaults.");
    }

    config = apply_environment(config);
    validate_config(config);
    return config;
}

void validate_config(const ServiceConfig& config) {
    if (config.storage_backend == "postgres" && config.storage_connection.empty()) {
        throw std::runtime_error("Postgres storage selected but no connection string configured");
    }
    if (config.listen_port <= 0 || config.listen_port > 65535) {
        throw std::runtime_error("Listen port out of range: " + std::to_string(config.listen_port));
    }
    for (const auto& pair : config.genesis_funds) {
        if (!pair.second.is_positive()) {
            throw std::runtime_error("Genesis funds for " + pair.first + " must be positive");
        }
    }
}

} // namespace spl
