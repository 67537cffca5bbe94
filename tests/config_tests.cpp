#include "core/config.hpp"

#include <boost/test/unit_test.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace spl;

namespace {

// Clears every SPL_* variable for the duration of a test.
struct CleanEnvironment {
    CleanEnvironment() { clear(); }
    ~CleanEnvironment() { clear(); }

    static void clear() {
        for (const char* name : {"SPL_DB_CONN", "SPL_HOST", "SPL_PORT", "SPL_LOG_CAPACITY", "SPL_CONFIG"}) {
            unsetenv(name);
        }
    }

    std::string write_file(const std::string& name, const std::string& content) {
        std::filesystem::path path = std::filesystem::temp_directory_path() / name;
        std::ofstream ofs(path);
        ofs << content;
        return path.string();
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(config_tests, CleanEnvironment)

BOOST_AUTO_TEST_CASE(defaults)
{
    ServiceConfig config;
    BOOST_CHECK_EQUAL(config.storage_backend, "memory");
    BOOST_CHECK_EQUAL(config.listen_port, 8080);
    BOOST_CHECK_EQUAL(config.log_capacity, 200u);
    BOOST_CHECK_EQUAL(config.display_decimals, 18u);
    BOOST_CHECK(config.mirror_enabled);
    BOOST_CHECK_NO_THROW(validate_config(config));
}

BOOST_AUTO_TEST_CASE(manifest_overrides_defaults)
{
    json manifest = json::parse(R"({
        "storage": {"backend": "postgres", "connection": "dbname=spl"},
        "server": {"host": "127.0.0.1", "port": 9090},
        "log": {"capacity": 50},
        "display": {"decimals": 6, "symbol": "USDC"},
        "mirror": {"enabled": false, "genesis_funds": {"alice": "1000"}},
        "unknown": true
    })");

    ServiceConfig config = apply_manifest(ServiceConfig(), manifest);
    BOOST_CHECK_EQUAL(config.storage_backend, "postgres");
    BOOST_CHECK_EQUAL(config.storage_connection, "dbname=spl");
    BOOST_CHECK_EQUAL(config.listen_host, "127.0.0.1");
    BOOST_CHECK_EQUAL(config.listen_port, 9090);
    BOOST_CHECK_EQUAL(config.log_capacity, 50u);
    BOOST_CHECK_EQUAL(config.display_decimals, 6u);
    BOOST_CHECK_EQUAL(config.display_symbol, "USDC");
    BOOST_CHECK(!config.mirror_enabled);
    BOOST_REQUIRE_EQUAL(config.genesis_funds.count("alice"), 1u);
    BOOST_CHECK_EQUAL(config.genesis_funds.at("alice"), Money(1000));
}

BOOST_AUTO_TEST_CASE(manifest_rejects_bad_values)
{
    BOOST_CHECK_THROW(apply_manifest(ServiceConfig(), json::parse(R"({"server": {"port": "eighty"}})")),
                      std::runtime_error);
    BOOST_CHECK_THROW(apply_manifest(ServiceConfig(), json::parse(R"({"storage": {"backend": "mongo"}})")),
                      std::runtime_error);
    BOOST_CHECK_THROW(apply_manifest(ServiceConfig(), json::parse("[1, 2]")), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(environment_wins_over_manifest)
{
    setenv("SPL_DB_CONN", "host=db dbname=spl", 1);
    setenv("SPL_PORT", "7000", 1);
    setenv("SPL_LOG_CAPACITY", "10", 1);

    ServiceConfig config = apply_environment(ServiceConfig());
    BOOST_CHECK_EQUAL(config.storage_backend, "postgres");
    BOOST_CHECK_EQUAL(config.storage_connection, "host=db dbname=spl");
    BOOST_CHECK_EQUAL(config.listen_port, 7000);
    BOOST_CHECK_EQUAL(config.log_capacity, 10u);
}

BOOST_AUTO_TEST_CASE(validation)
{
    ServiceConfig config;
    config.storage_backend = "postgres";
    BOOST_CHECK_THROW(validate_config(config), std::runtime_error);

    config = ServiceConfig();
    config.listen_port = 70000;
    BOOST_CHECK_THROW(validate_config(config), std::runtime_error);

    config = ServiceConfig();
    config.genesis_funds["alice"] = Money(0);
    BOOST_CHECK_THROW(validate_config(config), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(load_from_file)
{
    setenv("SPL_CONFIG", write_file("spl_config_ok.json", R"({"server": {"port": 8181}})").c_str(), 1);
    BOOST_CHECK_EQUAL(load_config().listen_port, 8181);

    setenv("SPL_CONFIG", write_file("spl_config_bad.json", "{ not json").c_str(), 1);
    BOOST_CHECK_THROW(load_config(), std::runtime_error);

    setenv("SPL_CONFIG", "/nonexistent/spl_config.json", 1);
    BOOST_CHECK_EQUAL(load_config().listen_port, 8080);
}

BOOST_AUTO_TEST_SUITE_END()
