// Rotor Event and Admission Gate Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <stop_token>
#include <thread>
#include <vector>

#include "../../src/core/event.hpp"
#include "../../src/pool/admission_gate.hpp"

using namespace std::chrono_literals;
using rotor::core::Event;

TEST_CASE("Event fires once", "[core][event]") {
    Event event;
    REQUIRE_FALSE(event.is_set());

    REQUIRE(event.set());
    REQUIRE(event.is_set());

    // Second set is a no-op
    REQUIRE_FALSE(event.set());
    REQUIRE(event.is_set());
}

TEST_CASE("Event late waiter sees it fired", "[core][event]") {
    Event event;
    event.set();

    auto start = std::chrono::steady_clock::now();
    event.wait();
    REQUIRE(event.wait_for(1s));
    REQUIRE(std::chrono::steady_clock::now() - start < 500ms);
}

TEST_CASE("Event wakes every waiter", "[core][event]") {
    Event event;
    std::atomic<int> woken{0};

    std::vector<std::thread> waiters;
    for (int i = 0; i < 4; ++i) {
        waiters.emplace_back([&event, &woken] {
            event.wait();
            woken.fetch_add(1);
        });
    }

    std::this_thread::sleep_for(50ms);
    REQUIRE(woken.load() == 0);

    event.set();
    for (auto& waiter : waiters) {
        waiter.join();
    }
    REQUIRE(woken.load() == 4);
}

TEST_CASE("Event wait_for times out", "[core][event]") {
    Event event;
    auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(event.wait_for(50ms));
    REQUIRE(std::chrono::steady_clock::now() - start >= 50ms);
}

TEST_CASE("Event token combines with stop callbacks", "[core][event]") {
    Event first;
    Event second;
    Event any;

    std::stop_callback on_first(first.token(), [&any] { any.set(); });
    std::stop_callback on_second(second.token(), [&any] { any.set(); });

    std::thread setter([&second] {
        std::this_thread::sleep_for(20ms);
        second.set();
    });

    REQUIRE(any.wait_for(2s));
    REQUIRE(second.is_set());
    REQUIRE_FALSE(first.is_set());
    setter.join();
}

TEST_CASE("Cancellable sleep", "[core][event]") {
    SECTION("completes without stop") {
        std::stop_source source;
        REQUIRE(rotor::core::sleep_for(source.get_token(), 10ms));
    }

    SECTION("returns early on stop") {
        std::stop_source source;
        std::thread stopper([&source] {
            std::this_thread::sleep_for(20ms);
            source.request_stop();
        });

        auto start = std::chrono::steady_clock::now();
        REQUIRE_FALSE(rotor::core::sleep_for(source.get_token(), 10s));
        REQUIRE(std::chrono::steady_clock::now() - start < 5s);
        stopper.join();
    }
}

TEST_CASE("Admission gate bounds concurrency", "[pool][gate]") {
    rotor::pool::AdmissionGate gate(2);
    std::stop_source source;

    REQUIRE(gate.acquire(source.get_token()));
    REQUIRE(gate.acquire(source.get_token()));
    REQUIRE(gate.in_use() == 2);
    REQUIRE_FALSE(gate.try_acquire());

    std::atomic<bool> admitted{false};
    std::thread third([&] {
        if (gate.acquire(source.get_token())) {
            admitted = true;
        }
    });

    std::this_thread::sleep_for(50ms);
    REQUIRE_FALSE(admitted.load());

    gate.release();
    third.join();
    REQUIRE(admitted.load());
    REQUIRE(gate.in_use() == 2);
}

TEST_CASE("Admission gate acquire honors cancellation", "[pool][gate]") {
    rotor::pool::AdmissionGate gate(1);
    std::stop_source source;

    REQUIRE(gate.acquire(source.get_token()));

    std::atomic<bool> result{true};
    std::thread waiter([&] { result = gate.acquire(source.get_token()); });

    std::this_thread::sleep_for(20ms);
    source.request_stop();
    waiter.join();

    REQUIRE_FALSE(result.load());
    REQUIRE(gate.in_use() == 1);
}
