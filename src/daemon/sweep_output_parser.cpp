#include "sweep_output_parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>

namespace {

std::vector<std::string_view> split_fields(std::string_view line) {
    std::vector<std::string_view> parts;
    size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && (line[i] == ',' || std::isspace(static_cast<unsigned char>(line[i])))) ++i;
        size_t start = i;
        while (i < line.size() && line[i] != ',' && !std::isspace(static_cast<unsigned char>(line[i]))) ++i;
        if (i > start) parts.push_back(line.substr(start, i - start));
    }
    return parts;
}

std::optional<double> to_double(std::string_view s) {
    double v = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size() || !std::isfinite(v)) return std::nullopt;
    return v;
}

// Sample counts are plain non-negative integers.
std::optional<int> to_count(std::string_view s) {
    int v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size() || v < 0) return std::nullopt;
    return v;
}

} // namespace

std::optional<SweepSample> parse_sweep_line(std::string_view line) {
    auto parts = split_fields(line);
    if (parts.size() < 7) return std::nullopt;

    auto low = to_double(parts[2]);
    auto high = to_double(parts[3]);
    auto bin = to_double(parts[4]);
    auto count = to_count(parts[5]);
    if (!low || !high || !bin || !count) return std::nullopt;

    SweepSample s;
    s.date = std::string(parts[0]);
    s.time = std::string(parts[1]);
    s.hz_low = *low;
    s.hz_high = *high;
    s.bin_width_hz = *bin;
    s.num_samples = *count;

    for (size_t i = 6; i < parts.size(); ++i) {
        if (auto db = to_double(parts[i])) s.power_db.push_back(*db);
    }
    if (s.power_db.empty()) return std::nullopt;

    auto peak = std::ranges::max_element(s.power_db);
    s.peak_index = static_cast<size_t>(peak - s.power_db.begin());
    s.peak_power_db = *peak;
    s.peak_frequency_mhz =
        (s.hz_low + static_cast<double>(s.peak_index) * s.bin_width_hz + s.bin_width_hz / 2.0) / 1e6;
    s.signal_strength = signal_strength_label(s.peak_power_db);
    return s;
}

std::string signal_strength_label(double db) {
    if (db < -90) return "No Signal";
    if (db < -70) return "Very Weak";
    if (db < -50) return "Weak";
    if (db < -30) return "Moderate";
    if (db < -10) return "Strong";
    return "Very Strong";
}
