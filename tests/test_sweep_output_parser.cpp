#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "sweep_output_parser.hpp"

using Catch::Matchers::WithinAbs;

TEST_CASE("Sweep output parser", "[parser]") {

    SECTION("TypicalLine") {
        auto s = parse_sweep_line(
            "2024-01-15, 10:30:45.123456, 2400000000, 2405000000, 1000000.00, 20, -45.5, -42.1, -38.7, -41.2, -44.8");
        REQUIRE(s);
        REQUIRE(s->date == "2024-01-15");
        REQUIRE(s->time == "10:30:45.123456");
        REQUIRE(s->hz_low == 2400000000.0);
        REQUIRE(s->hz_high == 2405000000.0);
        REQUIRE(s->bin_width_hz == 1000000.0);
        REQUIRE(s->num_samples == 20);
        REQUIRE(s->power_db.size() == 5);
        REQUIRE(s->peak_index == 2);
        REQUIRE(s->peak_power_db == -38.7);
        // Peak bin 2 centre: 2400 + 2 + 0.5 MHz
        REQUIRE_THAT(s->peak_frequency_mhz, WithinAbs(2402.5, 1e-9));
        REQUIRE(s->signal_strength == "Moderate");
        REQUIRE(s->source == "hackrf");
        REQUIRE(s->center_hz() == 2402500000.0);
    }

    SECTION("SingleBin") {
        auto s = parse_sweep_line("2024-01-15, 10:30:45, 100000000, 105000000, 5000000, 10, -95.0");
        REQUIRE(s);
        REQUIRE(s->power_db.size() == 1);
        REQUIRE(s->peak_index == 0);
        REQUIRE(s->signal_strength == "No Signal");
    }

    SECTION("TooFewFields") {
        REQUIRE_FALSE(parse_sweep_line("2024-01-15, 10:30:45, 100000000, 105000000, 5000000, 10"));
        REQUIRE_FALSE(parse_sweep_line(""));
    }

    SECTION("NonNumericHeader") {
        REQUIRE_FALSE(parse_sweep_line("date, time, hz_low, hz_high, hz_bin_width, num_samples, dB"));
    }

    SECTION("BadPowerValuesSkipped") {
        auto s = parse_sweep_line("2024-01-15, 10:30:45, 100000000, 105000000, 5000000, 10, nan, -60.0, abc");
        REQUIRE(s);
        REQUIRE(s->power_db == std::vector<double>{-60.0});
    }

    SECTION("OnlyBadPowerValues") {
        REQUIRE_FALSE(parse_sweep_line("2024-01-15, 10:30:45, 100000000, 105000000, 5000000, 10, x, y"));
    }

    SECTION("SampleCountOutOfRange") {
        REQUIRE_FALSE(parse_sweep_line("2024-01-15, 10:30:45, 100000000, 105000000, 5000000, 1e20, -60.0"));
        REQUIRE_FALSE(parse_sweep_line("2024-01-15, 10:30:45, 100000000, 105000000, 5000000, 99999999999, -60.0"));
        REQUIRE_FALSE(parse_sweep_line("2024-01-15, 10:30:45, 100000000, 105000000, 5000000, -3, -60.0"));
        REQUIRE_FALSE(parse_sweep_line("2024-01-15, 10:30:45, 100000000, 105000000, 5000000, 10.5, -60.0"));
        auto s = parse_sweep_line("2024-01-15, 10:30:45, 100000000, 105000000, 5000000, 2147483647, -60.0");
        REQUIRE(s);
        REQUIRE(s->num_samples == 2147483647);
    }

    SECTION("DiagnosticLine") {
        REQUIRE_FALSE(parse_sweep_line("call hackrf_sample_rate_set(20.000 MHz)"));
        REQUIRE_FALSE(parse_sweep_line("Sweeping from 2400 MHz to 2500 MHz"));
    }
}

TEST_CASE("Signal strength labels", "[parser]") {
    REQUIRE(signal_strength_label(-100.0) == "No Signal");
    REQUIRE(signal_strength_label(-90.0) == "Very Weak");
    REQUIRE(signal_strength_label(-75.0) == "Very Weak");
    REQUIRE(signal_strength_label(-70.0) == "Weak");
    REQUIRE(signal_strength_label(-50.0) == "Moderate");
    REQUIRE(signal_strength_label(-30.0) == "Strong");
    REQUIRE(signal_strength_label(-10.0) == "Very Strong");
    REQUIRE(signal_strength_label(5.0) == "Very Strong");
}
