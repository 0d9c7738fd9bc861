#include <catch2/catch_test_macros.hpp>

#include "client_reconnector.hpp"
#include "fakes.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

const std::string kUrl = "http://127.0.0.1:8092/api/sweep/stream";

} // namespace

TEST_CASE("Reconnect backoff", "[reconnect]") {
    ReconnectConfig cfg;
    REQUIRE(ClientReconnector::backoff_delay(1, cfg) == 1000ms);
    REQUIRE(ClientReconnector::backoff_delay(2, cfg) == 2000ms);
    REQUIRE(ClientReconnector::backoff_delay(3, cfg) == 4000ms);
    REQUIRE(ClientReconnector::backoff_delay(5, cfg) == 16000ms);
    REQUIRE(ClientReconnector::backoff_delay(6, cfg) == 30000ms);
    REQUIRE(ClientReconnector::backoff_delay(40, cfg) == 30000ms);
}

TEST_CASE("Client reconnector", "[reconnect]") {
    FakeScheduler sched;
    FakeEventSource source;
    ClientReconnector rc(sched, source, kUrl);

    std::vector<ConnectionState> states;
    std::string last_detail;
    rc.on_state([&](ConnectionState s, const std::string& detail) {
        states.push_back(s);
        last_detail = detail;
    });
    std::vector<std::string> received;
    rc.on_message([&](const SseMessage& m) { received.push_back(m.event); });

    SECTION("ConnectsAndDeliversMessages") {
        rc.start();
        REQUIRE(source.open_calls == 1);
        REQUIRE(source.url == kUrl);
        REQUIRE(rc.connecting());

        source.fire_open();
        REQUIRE(rc.connected());
        source.fire_message("status", "{}");
        source.fire_message("sweep_data", "{}");
        REQUIRE(received == std::vector<std::string>{"status", "sweep_data"});
    }

    SECTION("BackoffGrowsBetweenAttempts") {
        rc.start();
        source.fire_error("HTTP 503");
        REQUIRE(rc.state() == ConnectionState::Waiting);
        REQUIRE(rc.reconnect_attempts() == 1);

        sched.advance(999ms);
        REQUIRE(source.open_calls == 1);
        sched.advance(1ms);
        REQUIRE(source.open_calls == 2);

        source.fire_error("HTTP 503");
        sched.advance(1999ms);
        REQUIRE(source.open_calls == 2);
        sched.advance(1ms);
        REQUIRE(source.open_calls == 3);

        source.fire_error("HTTP 503");
        sched.advance(4000ms);
        REQUIRE(source.open_calls == 4);
        REQUIRE(rc.reconnect_attempts() == 3);
    }

    SECTION("SuccessResetsAttempts") {
        rc.start();
        source.fire_error("stream closed by server");
        sched.advance(1000ms);
        source.fire_error("stream closed by server");
        sched.advance(2000ms);
        REQUIRE(rc.reconnect_attempts() == 2);

        source.fire_open();
        REQUIRE(rc.reconnect_attempts() == 0);

        // Next failure starts the ladder from the bottom
        source.fire_error("stream closed by server");
        sched.advance(1000ms);
        REQUIRE(rc.connecting());
    }

    SECTION("TerminalAfterMaxAttempts") {
        rc.start();
        for (int i = 0; i < 9; ++i) {
            source.fire_error("curl error: Couldn't connect to server");
            REQUIRE(rc.state() == ConnectionState::Waiting);
            sched.advance(30000ms);
        }
        source.fire_error("curl error: Couldn't connect to server");
        REQUIRE(rc.terminal());
        REQUIRE(last_detail == "Connection lost. Please refresh.");

        int opens = source.open_calls;
        sched.advance(120000ms);
        REQUIRE(source.open_calls == opens);
    }

    SECTION("StaleStreamReconnects") {
        rc.start();
        source.fire_open();

        // Heartbeats keep it fresh
        for (int i = 0; i < 6; ++i) {
            sched.advance(15000ms);
            source.fire_message("heartbeat", "{}");
        }
        REQUIRE(source.open_calls == 1);

        // Silence for 90 s
        sched.advance(120000ms);
        REQUIRE(source.open_calls == 2);
        REQUIRE(source.close_calls >= 1);
        REQUIRE(rc.connecting());
        // Staleness is not a failed attempt
        REQUIRE(rc.reconnect_attempts() == 0);
    }

    SECTION("HiddenSkipsStaleness") {
        rc.start();
        source.fire_open();
        rc.set_visible(false);
        sched.advance(300000ms);
        REQUIRE(source.open_calls == 1);
        REQUIRE(rc.connected());

        // Visible again: the silence clock restarts
        rc.set_visible(true);
        sched.advance(60000ms);
        REQUIRE(source.open_calls == 1);
        sched.advance(60000ms);
        REQUIRE(source.open_calls == 2);
    }

    SECTION("VisibleSkipsRemainingBackoff") {
        rc.start();
        source.fire_open();
        rc.set_visible(false);
        for (int i = 0; i < 5; ++i) {
            source.fire_error("stream closed by server");
            sched.advance(ClientReconnector::backoff_delay(i + 1, ReconnectConfig{}));
        }
        source.fire_error("stream closed by server");
        REQUIRE(rc.state() == ConnectionState::Waiting);
        int opens = source.open_calls;

        rc.set_visible(true);
        REQUIRE(source.open_calls == opens + 1);
        REQUIRE(rc.connecting());
    }

    SECTION("StopClosesAndIgnoresLateErrors") {
        rc.start();
        source.fire_open();
        rc.stop();
        REQUIRE(rc.state() == ConnectionState::Idle);
        REQUIRE_FALSE(source.is_open);

        source.fire_error("late");
        sched.advance(60000ms);
        REQUIRE(rc.state() == ConnectionState::Idle);
        REQUIRE(source.open_calls == 1);
    }

    SECTION("StateNames") {
        REQUIRE(to_string(ConnectionState::Waiting) == "waiting");
        REQUIRE(to_string(ConnectionState::Terminal) == "terminal");
    }
}
