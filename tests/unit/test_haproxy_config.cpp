// Rotor HAProxy Configuration Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <string>

#include "../../src/core/errors.hpp"
#include "../../src/pool/haproxy_config.hpp"

using namespace rotor::pool;

namespace {

size_t count_occurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

}  // namespace

TEST_CASE("HAProxy config renders required sections", "[pool][haproxy_config]") {
    ProxyDescriptor descriptor;
    descriptor.listen_port = 8080;
    descriptor.max_connections = 512;
    descriptor.backends = {30001, 30003};

    std::string text;
    REQUIRE_FALSE(render_haproxy_config(descriptor, text));

    REQUIRE(text.find("global\n  maxconn 512\n") != std::string::npos);
    REQUIRE(text.find("defaults\n  mode http\n") != std::string::npos);
    REQUIRE(text.find("frontend rotating_proxies\n  bind *:8080\n") != std::string::npos);
    REQUIRE(text.find("default_backend privoxies") != std::string::npos);
    REQUIRE(count_occurrences(text, "option http_proxy") == 2);
    REQUIRE(text.find("backend privoxies\n  balance roundrobin\n") != std::string::npos);
    REQUIRE(text.find("  server privoxy-30001 127.0.0.1:30001 check\n") != std::string::npos);
    REQUIRE(text.find("  server privoxy-30003 127.0.0.1:30003 check\n") != std::string::npos);
    REQUIRE(count_occurrences(text, "  server ") == 2);
}

TEST_CASE("HAProxy config stats block", "[pool][haproxy_config]") {
    ProxyDescriptor descriptor;

    SECTION("absent without stats port") {
        std::string text;
        REQUIRE_FALSE(render_haproxy_config(descriptor, text));
        REQUIRE(text.find("listen stats") == std::string::npos);
    }

    SECTION("present with stats port") {
        descriptor.stats_port = 8404;
        std::string text;
        REQUIRE_FALSE(render_haproxy_config(descriptor, text));
        REQUIRE(text.find("listen stats\n  bind            :8404\n") != std::string::npos);
        REQUIRE(text.find("stats uri /haproxy?stats") != std::string::npos);
        REQUIRE(text.find("stats refresh 30s") != std::string::npos);
    }
}

TEST_CASE("HAProxy config with no backends", "[pool][haproxy_config]") {
    ProxyDescriptor descriptor;
    std::string text;
    REQUIRE_FALSE(render_haproxy_config(descriptor, text));
    REQUIRE(text.find("backend privoxies") != std::string::npos);
    REQUIRE(text.find("  server ") == std::string::npos);
}

TEST_CASE("HAProxy config rendering is deterministic", "[pool][haproxy_config]") {
    ProxyDescriptor a;
    a.stats_port = 8404;
    a.backends = {30005, 30001, 30003};

    ProxyDescriptor b = a;
    b.backends = {30003, 30005, 30001};

    std::string first;
    std::string second;
    std::string third;
    REQUIRE_FALSE(render_haproxy_config(a, first));
    REQUIRE_FALSE(render_haproxy_config(a, second));
    REQUIRE_FALSE(render_haproxy_config(b, third));

    REQUIRE(first == second);
    REQUIRE(first == third);
    REQUIRE(first.find("privoxy-30001") < first.find("privoxy-30003"));
    REQUIRE(first.find("privoxy-30003") < first.find("privoxy-30005"));
}

TEST_CASE("HAProxy config balance policy", "[pool][haproxy_config]") {
    ProxyDescriptor descriptor;
    std::string text;

    SECTION("leastconn") {
        descriptor.balance = "leastconn";
        REQUIRE_FALSE(render_haproxy_config(descriptor, text));
        REQUIRE(text.find("balance leastconn") != std::string::npos);
    }

    SECTION("unknown policy fails to render") {
        descriptor.balance = "random";
        auto ec = render_haproxy_config(descriptor, text);
        REQUIRE(ec == rotor::core::make_error_code(rotor::core::Errc::render_failed));
        REQUIRE(text.empty());
    }
}

TEST_CASE("HAProxy config rejects zero listen port", "[pool][haproxy_config]") {
    ProxyDescriptor descriptor;
    descriptor.listen_port = 0;
    std::string text;
    REQUIRE(render_haproxy_config(descriptor, text) ==
            rotor::core::make_error_code(rotor::core::Errc::render_failed));
}
