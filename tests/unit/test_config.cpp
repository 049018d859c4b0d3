// Rotor Configuration Layer Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>

#include "../../src/control/config.hpp"

using namespace rotor::control;

TEST_CASE("Config defaults are valid", "[control][config]") {
    Config config;

    REQUIRE(config.proxy.listen_port == 8080);
    REQUIRE(config.proxy.stats_port == 0);
    REQUIRE(config.proxy.max_connections == 256);
    REQUIRE(config.proxy.balance == "roundrobin");
    REQUIRE(config.proxy.reload_quiet_ms == 2000);
    REQUIRE(config.proxy.reload_ceiling_ms == 10000);
    REQUIRE(config.pool.size == 3);
    REQUIRE(config.pool.port_range_start == 30000);
    REQUIRE(config.pool.max_lifetime_seconds == 900);
    REQUIRE(config.pool.retry_backoff_ms == 500);
    REQUIRE(config.runtime.settle_ms == 250);

    auto validation = ConfigLoader::validate(config);
    REQUIRE(validation.valid);
    REQUIRE_FALSE(validation.has_errors());
}

TEST_CASE("Config JSON serialization", "[control][config]") {
    Config config;
    config.proxy.listen_port = 9090;
    config.pool.size = 5;

    std::string json = ConfigLoader::to_json(config);
    REQUIRE_FALSE(json.empty());
    REQUIRE(json.find("\"proxy\"") != std::string::npos);
    REQUIRE(json.find("\"pool\"") != std::string::npos);
    REQUIRE(json.find("\"runtime\"") != std::string::npos);
    REQUIRE(json.find("\"logging\"") != std::string::npos);
    REQUIRE((json.find("\"listen_port\": 9090") != std::string::npos ||
             json.find("\"listen_port\":9090") != std::string::npos));
}

TEST_CASE("Config JSON serialization of invalid UTF-8", "[control][config]") {
    Config config;
    config.runtime.work_dir = "/tmp/rotor-\xff";

    // dump() rejects the string; the failure surfaces as an empty result
    REQUIRE(ConfigLoader::to_json(config).empty());
}

TEST_CASE("Config JSON deserialization", "[control][config]") {
    const char* json = R"({
        "proxy": {
            "listen_port": 9000,
            "stats_port": 9001,
            "balance": "leastconn"
        },
        "pool": {
            "size": 5,
            "port_range_start": 40000,
            "port_range_end": 40100,
            "max_lifetime_seconds": 600
        }
    })";

    ValidationResult result;
    auto maybe_config = ConfigLoader::load_from_json(json, result);
    REQUIRE(maybe_config.has_value());

    const auto& config = *maybe_config;
    REQUIRE(config.proxy.listen_port == 9000);
    REQUIRE(config.proxy.stats_port == 9001);
    REQUIRE(config.proxy.balance == "leastconn");
    REQUIRE(config.pool.size == 5);
    REQUIRE(config.pool.port_range_start == 40000);
    REQUIRE(config.pool.port_range_end == 40100);
    REQUIRE(config.pool.max_lifetime_seconds == 600);

    SECTION("absent fields keep defaults") {
        REQUIRE(config.proxy.binary == "haproxy");
        REQUIRE(config.pool.circuit_binary == "tor");
        REQUIRE(config.pool.forwarder_binary == "privoxy");
        REQUIRE(config.pool.circuit_period_seconds == 120);
        REQUIRE(config.runtime.work_dir == "/tmp/rotor");
        REQUIRE(config.logging.level == "info");
    }
}

TEST_CASE("Config empty object uses defaults", "[control][config]") {
    ValidationResult result;
    auto config = ConfigLoader::load_from_json("{}", result);
    REQUIRE(config.has_value());
    REQUIRE(config->proxy.listen_port == 8080);
    REQUIRE(config->pool.size == 3);
}

TEST_CASE("Config malformed JSON", "[control][config]") {
    ValidationResult result;
    auto config = ConfigLoader::load_from_json("{ \"proxy\": ", result);
    REQUIRE_FALSE(config.has_value());
    REQUIRE(result.has_errors());
    REQUIRE(result.errors.front().find("JSON parsing error") != std::string::npos);
}

TEST_CASE("Config wrong field type", "[control][config]") {
    ValidationResult result;
    auto config = ConfigLoader::load_from_json(R"({"pool": {"size": "three"}})", result);
    REQUIRE_FALSE(config.has_value());
    REQUIRE(result.has_errors());
}

TEST_CASE("Config load from file", "[control][config]") {
    auto path = std::filesystem::temp_directory_path() / "rotor_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"proxy": {"listen_port": 8181}, "runtime": {"work_dir": "/tmp/rotor_cfg"}})";
    }

    ValidationResult result;
    auto config = ConfigLoader::load_from_file(path.string(), result);
    std::filesystem::remove(path);

    REQUIRE(config.has_value());
    REQUIRE(config->proxy.listen_port == 8181);
    REQUIRE(config->runtime.work_dir == "/tmp/rotor_cfg");
}

TEST_CASE("Config load from missing file", "[control][config]") {
    ValidationResult result;
    auto config = ConfigLoader::load_from_file("/nonexistent/rotor.json", result);
    REQUIRE_FALSE(config.has_value());
    REQUIRE(result.has_errors());
}

TEST_CASE("Config validation - proxy settings", "[control][config][validation]") {
    Config config;

    SECTION("zero listen port") {
        config.proxy.listen_port = 0;
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("unknown balance policy") {
        config.proxy.balance = "random";
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("leastconn is accepted") {
        config.proxy.balance = "leastconn";
        REQUIRE_FALSE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("stats port equal to listen port") {
        config.proxy.stats_port = config.proxy.listen_port;
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("ceiling shorter than quiet period") {
        config.proxy.reload_quiet_ms = 5000;
        config.proxy.reload_ceiling_ms = 1000;
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("zero max connections") {
        config.proxy.max_connections = 0;
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }
}

TEST_CASE("Config validation - pool settings", "[control][config][validation]") {
    Config config;

    SECTION("zero pool size") {
        config.pool.size = 0;
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("inverted port range") {
        config.pool.port_range_start = 40000;
        config.pool.port_range_end = 30000;
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("range too small for two leases per pair") {
        config.pool.size = 3;
        config.pool.port_range_start = 40000;
        config.pool.port_range_end = 40004;
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("tight range only warns") {
        config.pool.size = 3;
        config.pool.port_range_start = 40000;
        config.pool.port_range_end = 40007;
        auto validation = ConfigLoader::validate(config);
        REQUIRE_FALSE(validation.has_errors());
        REQUIRE_FALSE(validation.warnings.empty());
    }

    SECTION("listen port inside lease range") {
        config.proxy.listen_port = 30010;
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("stats port inside lease range") {
        config.proxy.stats_port = 30010;
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("zero lifetime") {
        config.pool.max_lifetime_seconds = 0;
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("circuit period longer than lifetime warns") {
        config.pool.max_lifetime_seconds = 60;
        config.pool.circuit_period_seconds = 120;
        auto validation = ConfigLoader::validate(config);
        REQUIRE_FALSE(validation.has_errors());
        REQUIRE_FALSE(validation.warnings.empty());
    }

    SECTION("empty binary name") {
        config.pool.circuit_binary.clear();
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }
}

TEST_CASE("Config validation - runtime and logging", "[control][config][validation]") {
    Config config;

    SECTION("root work dir rejected") {
        config.runtime.work_dir = "/";
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("empty work dir rejected") {
        config.runtime.work_dir.clear();
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("zero settle window") {
        config.runtime.settle_ms = 0;
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("unknown log level") {
        config.logging.level = "verbose";
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("unknown log format") {
        config.logging.format = "xml";
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("json format on console warns") {
        config.logging.format = "json";
        auto validation = ConfigLoader::validate(config);
        REQUIRE_FALSE(validation.has_errors());
        REQUIRE_FALSE(validation.warnings.empty());
    }
}
