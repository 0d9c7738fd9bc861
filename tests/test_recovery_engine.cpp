#include <catch2/catch_test_macros.hpp>

#include "recovery_engine.hpp"

#include <chrono>
#include <variant>

using namespace std::chrono_literals;

namespace {

ErrorContext exit_error(uint32_t consecutive) {
    return ErrorContext{
        .kind = FailureKind::UnexpectedExit,
        .message = "sweep process exited unexpectedly",
        .consecutive_errors = consecutive,
    };
}

ErrorContext fatal_error(int64_t hz, size_t active, uint32_t consecutive = 1) {
    return ErrorContext{
        .kind = FailureKind::FatalStartup,
        .message = "hackrf_open() failed: Resource busy (-1000)",
        .frequency_hz = hz,
        .consecutive_errors = consecutive,
        .active_frequencies = active,
    };
}

} // namespace

TEST_CASE("Recovery engine", "[recovery]") {
    RecoveryEngine engine(Config::Recovery{});
    auto t0 = std::chrono::steady_clock::time_point{} + 1h;

    SECTION("EscalationLadder") {
        // Spaced out so the per-minute limit never applies
        auto at = [&](int n) { return t0 + std::chrono::minutes(2 * n); };

        auto a1 = std::get<RetryAction>(engine.decide(exit_error(1), at(1)));
        REQUIRE(a1.strategy == RecoveryStrategy::WaitAndRetry);
        REQUIRE(a1.delay == 2000ms);
        REQUIRE(a1.attempt == 1);
        REQUIRE(a1.max_attempts == 6);

        auto a2 = std::get<RetryAction>(engine.decide(exit_error(2), at(2)));
        REQUIRE(a2.strategy == RecoveryStrategy::WaitAndRetry);
        REQUIRE(a2.delay == 4000ms);

        auto a3 = std::get<RetryAction>(engine.decide(exit_error(3), at(3)));
        REQUIRE(a3.strategy == RecoveryStrategy::AggressiveCleanup);
        REQUIRE(a3.delay == 6000ms);

        auto a5 = std::get<RetryAction>(engine.decide(exit_error(5), at(5)));
        REQUIRE(a5.strategy == RecoveryStrategy::DeviceReset);
        REQUIRE(a5.delay == 10000ms);

        auto a6 = std::get<RetryAction>(engine.decide(exit_error(6), at(6)));
        REQUIRE(a6.strategy == RecoveryStrategy::DeviceReset);

        auto a7 = engine.decide(exit_error(7), at(7));
        REQUIRE(std::holds_alternative<EscalateAction>(a7));
        REQUIRE(engine.cooling_down());
    }

    SECTION("RateLimit") {
        for (int i = 0; i < 5; ++i) {
            auto a = engine.decide(exit_error(1), t0 + std::chrono::seconds(i));
            REQUIRE(std::holds_alternative<RetryAction>(a));
        }
        auto sixth = engine.decide(exit_error(1), t0 + 5s);
        REQUIRE(std::holds_alternative<EscalateAction>(sixth));
        REQUIRE(std::get<EscalateAction>(sixth).reason.find("within 60s") != std::string::npos);
    }

    SECTION("RateWindowSlides") {
        for (int i = 0; i < 5; ++i) {
            engine.decide(exit_error(1), t0 + std::chrono::seconds(i));
        }
        // The first five have aged out
        auto later = engine.decide(exit_error(1), t0 + 120s);
        REQUIRE(std::holds_alternative<RetryAction>(later));
    }

    SECTION("FutileFatalEscalatesImmediately") {
        ErrorContext ctx{
            .kind = FailureKind::FatalStartup,
            .message = "hackrf_open() failed: Permission denied",
            .futile = true,
            .frequency_hz = 100000000,
        };
        auto a = engine.decide(ctx, t0);
        REQUIRE(std::holds_alternative<EscalateAction>(a));
        REQUIRE(std::get<EscalateAction>(a).reason.starts_with("unrecoverable"));
    }

    SECTION("FatalAdvancesWhenOthersRemain") {
        auto a = std::get<RetryAction>(engine.decide(fatal_error(100000000, 2), t0));
        REQUIRE(a.advance_frequency);

        auto single = std::get<RetryAction>(engine.decide(fatal_error(200000000, 1), t0 + 2min));
        REQUIRE_FALSE(single.advance_frequency);
    }

    SECTION("BlacklistAfterThreshold") {
        engine.decide(fatal_error(100000000, 3), t0);
        engine.decide(fatal_error(100000000, 3), t0 + 2min);
        auto third = engine.decide(fatal_error(100000000, 3), t0 + 4min);
        REQUIRE(std::holds_alternative<BlacklistAction>(third));
        REQUIRE(std::get<BlacklistAction>(third).frequency_hz == 100000000);
        REQUIRE(engine.is_blacklisted(100000000));
        REQUIRE_FALSE(engine.is_blacklisted(200000000));
    }

    SECTION("LastFrequencyIsNeverBlacklisted") {
        engine.decide(fatal_error(100000000, 1), t0);
        engine.decide(fatal_error(100000000, 1), t0 + 2min);
        auto third = engine.decide(fatal_error(100000000, 1), t0 + 4min);
        REQUIRE(std::holds_alternative<EscalateAction>(third));
        REQUIRE_FALSE(engine.is_blacklisted(100000000));
    }

    SECTION("SuccessClearsFrequencyFailures") {
        engine.decide(fatal_error(100000000, 2), t0);
        engine.decide(fatal_error(100000000, 2), t0 + 2min);
        engine.clear_frequency_failures(100000000);
        auto a = engine.decide(fatal_error(100000000, 2), t0 + 4min);
        REQUIRE(std::holds_alternative<RetryAction>(a));
    }

    SECTION("ClearBlacklistAndReset") {
        for (int i = 0; i < 3; ++i) {
            engine.decide(fatal_error(100000000, 2), t0 + std::chrono::minutes(2 * i));
        }
        REQUIRE(engine.is_blacklisted(100000000));
        engine.clear_blacklist();
        REQUIRE_FALSE(engine.is_blacklisted(100000000));

        engine.decide(exit_error(7), t0 + 10min);
        REQUIRE(engine.cooling_down());
        engine.reset();
        REQUIRE_FALSE(engine.cooling_down());
        REQUIRE(engine.health().consecutive_failures == 0);
    }

    SECTION("HealthRecord") {
        engine.record_sample(-40.0);
        engine.record_sample(-60.0);
        engine.decide(exit_error(2), t0);
        REQUIRE(engine.health().consecutive_failures == 2);
        REQUIRE(engine.health().backoff_level == 1);

        engine.record_success(t0 + 5s);
        auto j = engine.health_json(t0 + 6s);
        REQUIRE(j["consecutive_failures"] == 0);
        REQUIRE(j["samples_seen"] == 2);
        REQUIRE(j["average_peak_power_db"] == -50.0);
        REQUIRE(j["ms_since_last_known_good"] == 1000);
        REQUIRE(j["cooling_down"] == false);
    }

    SECTION("Names") {
        REQUIRE(to_string(RecoveryStrategy::AggressiveCleanup) == "aggressive_cleanup");
        REQUIRE(to_string(FailureKind::FatalStartup) == "fatal_startup");
    }
}
