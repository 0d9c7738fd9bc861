#include <catch2/catch_test_macros.hpp>

#include "sweep_types.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

TEST_CASE("SweepConfig parsing", "[sweep_types]") {

    SECTION("PlainNumbersUseDefaultSpan") {
        auto cfg = SweepConfig::from_json(json::parse(R"({"frequencies": [100, 433.92]})"), 10.0, 10000);
        REQUIRE(cfg);
        REQUIRE(cfg->frequencies.size() == 2);
        REQUIRE(cfg->frequencies[0] == FrequencyEntry{.center_mhz = 100.0, .span_mhz = 10.0});
        REQUIRE(cfg->frequencies[1].center_mhz == 433.92);
        REQUIRE(cfg->cycle_time_ms == 10000);
    }

    SECTION("ValueWithUnit") {
        auto cfg = SweepConfig::from_json(json::parse(R"({
            "frequencies": [
                {"value": 2.4, "unit": "GHz"},
                {"value": 915000, "unit": "kHz"},
                {"value": 100000000, "unit": "Hz"},
                {"value": 88}
            ]
        })"), 5.0, 10000);
        REQUIRE(cfg);
        REQUIRE(cfg->frequencies[0].center_mhz == 2400.0);
        REQUIRE(cfg->frequencies[1].center_mhz == 915.0);
        REQUIRE(cfg->frequencies[2].center_mhz == 100.0);
        REQUIRE(cfg->frequencies[3].center_mhz == 88.0);
        REQUIRE(cfg->frequencies[3].span_mhz == 5.0);
    }

    SECTION("UnknownUnit") {
        auto cfg = SweepConfig::from_json(json::parse(R"({"frequencies": [{"value": 1, "unit": "THz"}]})"), 10.0, 10000);
        REQUIRE_FALSE(cfg);
        REQUIRE(cfg.error().find("THz") != std::string::npos);
    }

    SECTION("RangeBecomesCenterAndHalfWidth") {
        auto cfg = SweepConfig::from_json(json::parse(R"({
            "frequencies": [{"start": 2400, "stop": 2500}, {"start": 900, "end": 800}]
        })"), 10.0, 10000);
        REQUIRE(cfg);
        REQUIRE(cfg->frequencies[0] == FrequencyEntry{.center_mhz = 2450.0, .span_mhz = 50.0});
        // Reversed bounds are swapped
        REQUIRE(cfg->frequencies[1] == FrequencyEntry{.center_mhz = 850.0, .span_mhz = 50.0});
    }

    SECTION("EmptyRange") {
        auto cfg = SweepConfig::from_json(json::parse(R"({"frequencies": [{"start": 100, "stop": 100}]})"), 10.0, 10000);
        REQUIRE_FALSE(cfg);
    }

    SECTION("CycleTime") {
        auto cfg = SweepConfig::from_json(json::parse(R"({"frequencies": [100], "cycle_time_ms": 5000})"), 10.0, 10000);
        REQUIRE(cfg);
        REQUIRE(cfg->cycle_time_ms == 5000);

        auto negative = SweepConfig::from_json(json::parse(R"({"frequencies": [100], "cycle_time_ms": -1})"), 10.0, 10000);
        REQUIRE_FALSE(negative);
    }

    SECTION("FrequenciesMustBeArray") {
        REQUIRE_FALSE(SweepConfig::from_json(json::parse(R"({"frequencies": 100})"), 10.0, 10000));
        REQUIRE_FALSE(SweepConfig::from_json(json::parse(R"({})"), 10.0, 10000));
        REQUIRE_FALSE(SweepConfig::from_json(json::parse(R"({"frequencies": ["100"]})"), 10.0, 10000));
    }
}

TEST_CASE("SweepConfig validation", "[sweep_types]") {

    SECTION("Valid") {
        SweepConfig cfg{.frequencies = {{.center_mhz = 100.0, .span_mhz = 10.0}}, .cycle_time_ms = 10000};
        REQUIRE(cfg.validate(1000));
    }

    SECTION("EmptyFrequencyList") {
        SweepConfig cfg;
        auto r = cfg.validate(1000);
        REQUIRE_FALSE(r);
        REQUIRE(r.error() == "at least one frequency is required");
    }

    SECTION("OutOfRange") {
        SweepConfig low{.frequencies = {{.center_mhz = 3.0, .span_mhz = 5.0}}, .cycle_time_ms = 10000};
        REQUIRE_FALSE(low.validate(1000));

        SweepConfig high{.frequencies = {{.center_mhz = 7245.0, .span_mhz = 10.0}}, .cycle_time_ms = 10000};
        REQUIRE_FALSE(high.validate(1000));

        SweepConfig edge{.frequencies = {{.center_mhz = 7240.0, .span_mhz = 10.0}}, .cycle_time_ms = 10000};
        REQUIRE(edge.validate(1000));
    }

    SECTION("NonPositiveSpan") {
        SweepConfig cfg{.frequencies = {{.center_mhz = 100.0, .span_mhz = 0.0}}, .cycle_time_ms = 10000};
        REQUIRE_FALSE(cfg.validate(1000));
    }

    SECTION("CycleTooShort") {
        SweepConfig cfg{.frequencies = {{.center_mhz = 100.0, .span_mhz = 10.0}}, .cycle_time_ms = 500};
        REQUIRE_FALSE(cfg.validate(1000));
    }

    SECTION("ToJson") {
        SweepConfig cfg{.frequencies = {{.center_mhz = 100.0, .span_mhz = 10.0}}, .cycle_time_ms = 3000};
        auto j = cfg.to_json();
        REQUIRE(j["cycle_time_ms"] == 3000);
        REQUIRE(j["frequencies"][0]["center_mhz"] == 100.0);
        REQUIRE(j["frequencies"][0]["span_mhz"] == 10.0);
    }
}

TEST_CASE("Sweep phase transitions", "[sweep_types]") {

    SECTION("NormalLifecycle") {
        REQUIRE(can_transition(SweepPhase::Idle, SweepPhase::Starting));
        REQUIRE(can_transition(SweepPhase::Starting, SweepPhase::Running));
        REQUIRE(can_transition(SweepPhase::Running, SweepPhase::Stopping));
        REQUIRE(can_transition(SweepPhase::Stopping, SweepPhase::Idle));
    }

    SECTION("FailureAndRecovery") {
        REQUIRE(can_transition(SweepPhase::Running, SweepPhase::Error));
        REQUIRE(can_transition(SweepPhase::Starting, SweepPhase::Error));
        REQUIRE(can_transition(SweepPhase::Error, SweepPhase::Starting));
    }

    SECTION("EmergencyStopFromAnywhere") {
        for (auto from : {SweepPhase::Idle, SweepPhase::Starting, SweepPhase::Running,
                          SweepPhase::Stopping, SweepPhase::Error}) {
            REQUIRE(can_transition(from, SweepPhase::EmergencyStopped));
        }
    }

    SECTION("Forbidden") {
        REQUIRE_FALSE(can_transition(SweepPhase::Idle, SweepPhase::Error));
        REQUIRE_FALSE(can_transition(SweepPhase::Stopping, SweepPhase::Running));
        REQUIRE_FALSE(can_transition(SweepPhase::EmergencyStopped, SweepPhase::Starting));
        REQUIRE_FALSE(can_transition(SweepPhase::EmergencyStopped, SweepPhase::Running));
    }

    SECTION("Names") {
        REQUIRE(to_string(SweepPhase::Idle) == "idle");
        REQUIRE(to_string(SweepPhase::EmergencyStopped) == "emergency_stopped");
    }
}

TEST_CASE("Sweep arguments", "[sweep_types]") {
    Config::Device device;

    SECTION("RoundsWindowOutward") {
        auto args = sweep_arguments({.center_mhz = 433.92, .span_mhz = 1.0}, device);
        REQUIRE(args == std::vector<std::string>{
            "hackrf_sweep", "-f", "432:435", "-g", "20", "-l", "32", "-w", "20000"});
    }

    SECTION("UsesConfiguredDevice") {
        device.sweep_binary = "/usr/local/bin/hackrf_sweep";
        device.lna_gain = 8;
        device.vga_gain = 4;
        device.bin_width_hz = 500000;
        auto args = sweep_arguments({.center_mhz = 2450.0, .span_mhz = 50.0}, device);
        REQUIRE(args == std::vector<std::string>{
            "/usr/local/bin/hackrf_sweep", "-f", "2400:2500", "-g", "4", "-l", "8", "-w", "500000"});
    }

    SECTION("CenterHz") {
        FrequencyEntry f{.center_mhz = 433.92, .span_mhz = 1.0};
        REQUIRE(f.center_hz() == 433920000);
    }
}
