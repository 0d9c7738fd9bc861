#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// One hackrf_sweep output row:
// date, time, hz_low, hz_high, hz_bin_width, num_samples, dB, dB, ...
struct SweepSample {
    std::string date;
    std::string time;
    double hz_low = 0.0;
    double hz_high = 0.0;
    double bin_width_hz = 0.0;
    int num_samples = 0;
    std::vector<double> power_db;

    size_t peak_index = 0;
    double peak_power_db = 0.0;
    double peak_frequency_mhz = 0.0;
    std::string signal_strength;
    std::string source = "hackrf";

    double center_hz() const { return (hz_low + hz_high) / 2.0; }
};

std::optional<SweepSample> parse_sweep_line(std::string_view line);

std::string signal_strength_label(double db);
