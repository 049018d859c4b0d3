// Rotor Collaborator Log Format Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/pool/log_formats.hpp"

using namespace rotor::pool;
using rotor::logging::Severity;

TEST_CASE("Tor log lines", "[pool][log_formats][tor]") {
    SECTION("notice line") {
        auto line = classify_tor_line("Mar 12 12:34:56.789 [notice] Bootstrapped 100% (done): Done");
        REQUIRE(line.severity == Severity::Info);
        REQUIRE(line.message == "Bootstrapped 100% (done): Done");
    }

    SECTION("warn line") {
        auto line = classify_tor_line("Mar 12 12:34:56.789 [warn] Could not bind to 127.0.0.1:30000");
        REQUIRE(line.severity == Severity::Warn);
        REQUIRE(line.message == "Could not bind to 127.0.0.1:30000");
    }

    SECTION("err line") {
        auto line = classify_tor_line("Mar 12 12:34:56.789 [err] Reading config failed");
        REQUIRE(line.severity == Severity::Error);
        REQUIRE(line.message == "Reading config failed");
    }

    SECTION("unstructured line passes through at info") {
        auto line = classify_tor_line("started --SocksPort 30000");
        REQUIRE(line.severity == Severity::Info);
        REQUIRE(line.message == "started --SocksPort 30000");
    }

    SECTION("short line") {
        auto line = classify_tor_line("oops");
        REQUIRE(line.severity == Severity::Info);
        REQUIRE(line.message == "oops");
    }
}

TEST_CASE("Privoxy log lines", "[pool][log_formats][privoxy]") {
    SECTION("info line") {
        auto line = classify_privoxy_line(
            "2025-03-12 12:34:56.789 7f2b3c4d5700 Info: Listening on port 30001 on IP address 127.0.0.1");
        REQUIRE(line.severity == Severity::Info);
        REQUIRE(line.message == "Listening on port 30001 on IP address 127.0.0.1");
    }

    SECTION("error line") {
        auto line = classify_privoxy_line(
            "2025-03-12 12:34:56.789 7f2b3c4d5700 Error: can't bind to 127.0.0.1:30001");
        REQUIRE(line.severity == Severity::Error);
        REQUIRE(line.message == "can't bind to 127.0.0.1:30001");
    }

    SECTION("multi-word level uses its first word") {
        auto line = classify_privoxy_line(
            "2025-03-12 12:34:56.789 7f2b3c4d5700 Fatal error: can't open config file");
        REQUIRE(line.severity == Severity::Error);
        REQUIRE(line.message == "can't open config file");
    }

    SECTION("request line is informational") {
        auto line = classify_privoxy_line(
            "2025-03-12 12:34:56.789 7f2b3c4d5700 Request: example.com/");
        REQUIRE(line.severity == Severity::Info);
        REQUIRE(line.message == "example.com/");
    }

    SECTION("unstructured line passes through at info") {
        auto line = classify_privoxy_line("started");
        REQUIRE(line.severity == Severity::Info);
        REQUIRE(line.message == "started");
    }
}

TEST_CASE("HAProxy log lines", "[pool][log_formats][haproxy]") {
    SECTION("warning line") {
        auto line = classify_haproxy_line(
            "[WARNING]  (1234) : Server privoxies/privoxy-30001 is DOWN");
        REQUIRE(line.severity == Severity::Warn);
        REQUIRE(line.message == "Server privoxies/privoxy-30001 is DOWN");
    }

    SECTION("alert line") {
        auto line = classify_haproxy_line("[ALERT]    (1234) : Starting frontend rotating_proxies");
        REQUIRE(line.severity == Severity::Error);
        REQUIRE(line.message == "Starting frontend rotating_proxies");
    }

    SECTION("notice line") {
        auto line = classify_haproxy_line("[NOTICE]   (1234) : New worker (1240) forked");
        REQUIRE(line.severity == Severity::Info);
        REQUIRE(line.message == "New worker (1240) forked");
    }

    SECTION("unstructured line passes through at info") {
        auto line = classify_haproxy_line("Proxy rotating_proxies started.");
        REQUIRE(line.severity == Severity::Info);
        REQUIRE(line.message == "Proxy rotating_proxies started.");
    }

    SECTION("unterminated level") {
        auto line = classify_haproxy_line("[WARNING no bracket");
        REQUIRE(line.severity == Severity::Info);
        REQUIRE(line.message == "[WARNING no bracket");
    }
}
