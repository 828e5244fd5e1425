#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/ProbeRuntime.hpp"
#include "infrastructure/network/SocketProbe.hpp"
#include "support/LoopbackServices.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <thread>

using namespace netsweep::infra;
using namespace netsweep::testing;
using namespace std::chrono_literals;

TEST_CASE("ProbeRuntime sizes threads from probe concurrency", "[ProbeRuntime]") {
    const size_t ceiling = std::max<size_t>(2 * std::thread::hardware_concurrency(), 1);

    SECTION("Nothing in flight still gets one thread") {
        REQUIRE(ProbeRuntime::threadsFor(0) == 1);
    }

    SECTION("One thread per batch of probes") {
        REQUIRE(ProbeRuntime::threadsFor(1) == 1);
        REQUIRE(ProbeRuntime::threadsFor(ProbeRuntime::PROBES_PER_THREAD) == 1);
        REQUIRE(ProbeRuntime::threadsFor(ProbeRuntime::PROBES_PER_THREAD + 1) ==
                std::min<size_t>(2, ceiling));
    }

    SECTION("Capped by the hardware") {
        REQUIRE(ProbeRuntime::threadsFor(100000) == ceiling);
    }
}

TEST_CASE("ProbeRuntime runs handlers until shutdown", "[ProbeRuntime]") {
    SECTION("Zero threads becomes one") {
        ProbeRuntime runtime(0);
        REQUIRE(runtime.threadCount() == 1);
    }

    SECTION("Posted work runs without an explicit start") {
        ProbeRuntime runtime(2);
        REQUIRE(runtime.accepting());

        std::promise<void> ran;
        asio::post(runtime.makeStrand(), [&ran]() { ran.set_value(); });
        REQUIRE(ran.get_future().wait_for(2s) == std::future_status::ready);
    }

    SECTION("Shutdown waits for pending timers") {
        ProbeRuntime runtime(1);
        std::atomic<bool> fired{false};

        asio::steady_timer timer(runtime.ioContext(), 100ms);
        timer.async_wait([&fired](const asio::error_code& ec) {
            if (!ec) {
                fired = true;
            }
        });

        runtime.shutdown();
        REQUIRE(fired);
        REQUIRE_FALSE(runtime.accepting());
    }

    SECTION("Shutdown twice is harmless") {
        ProbeRuntime runtime(2);
        runtime.shutdown();
        runtime.shutdown();
        REQUIRE_FALSE(runtime.accepting());
    }
}

TEST_CASE("SocketProbe after runtime shutdown", "[ProbeRuntime][SocketProbe][Network]") {
    ProbeRuntime runtime(1);
    SocketProbe probe(runtime);
    LoopbackTcpServer server;
    runtime.shutdown();

    SECTION("TCP connect returns at once without connecting") {
        auto future = probe.connectAsync(loopback(), server.port(), 1000ms);
        REQUIRE(future.wait_for(0ms) == std::future_status::ready);

        auto result = future.get();
        REQUIRE(result.outcome == ConnectOutcome::Unreachable);
        REQUIRE(result.banner.empty());
    }

    SECTION("UDP exchange returns at once unanswered") {
        auto future = probe.exchangeAsync(loopback(), unusedUdpPort(), {}, 1000ms);
        REQUIRE(future.wait_for(0ms) == std::future_status::ready);
        REQUIRE_FALSE(future.get().answered);
    }
}
