#include "sweep_types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <utility>

using json = nlohmann::json;

namespace {

std::expected<double, std::string> unit_to_mhz(double value, std::string unit) {
    std::transform(unit.begin(), unit.end(), unit.begin(), ::tolower);
    if (unit == "hz") return value / 1e6;
    if (unit == "khz") return value / 1e3;
    if (unit == "mhz") return value;
    if (unit == "ghz") return value * 1e3;
    return std::unexpected(std::format("unknown frequency unit '{}'", unit));
}

std::expected<FrequencyEntry, std::string> parse_frequency(const json& f, double default_span) {
    if (f.is_number()) {
        return FrequencyEntry{.center_mhz = f.get<double>(), .span_mhz = default_span};
    }
    if (!f.is_object()) {
        return std::unexpected("frequency must be a number or an object");
    }

    if (f.contains("value")) {
        if (!f["value"].is_number()) return std::unexpected("frequency value must be numeric");
        auto mhz = unit_to_mhz(f["value"].get<double>(), f.value("unit", "MHz"));
        if (!mhz) return std::unexpected(mhz.error());
        return FrequencyEntry{.center_mhz = *mhz, .span_mhz = default_span};
    }

    if (f.contains("start") && (f.contains("stop") || f.contains("end"))) {
        const auto& upper = f.contains("stop") ? f["stop"] : f["end"];
        if (!f["start"].is_number() || !upper.is_number()) {
            return std::unexpected("frequency range bounds must be numeric");
        }
        double a = f["start"].get<double>();
        double b = upper.get<double>();
        if (b < a) std::swap(a, b);
        if (a == b) return std::unexpected("frequency range is empty");
        return FrequencyEntry{.center_mhz = (a + b) / 2.0, .span_mhz = (b - a) / 2.0};
    }

    return std::unexpected("frequency object needs 'value' or 'start'/'stop'");
}

} // namespace

int64_t FrequencyEntry::center_hz() const {
    return static_cast<int64_t>(std::llround(center_mhz * 1e6));
}

std::expected<SweepConfig, std::string>
SweepConfig::from_json(const json& j, double default_span_mhz, uint32_t default_cycle_time_ms) {
    SweepConfig cfg;
    cfg.cycle_time_ms = default_cycle_time_ms;

    if (!j.is_object() || !j.contains("frequencies") || !j["frequencies"].is_array()) {
        return std::unexpected("'frequencies' must be an array");
    }

    for (const auto& f : j["frequencies"]) {
        auto entry = parse_frequency(f, default_span_mhz);
        if (!entry) return std::unexpected(entry.error());
        cfg.frequencies.push_back(*entry);
    }

    if (j.contains("cycle_time_ms")) {
        const auto& ct = j["cycle_time_ms"];
        if (!ct.is_number() || ct.get<double>() < 0) {
            return std::unexpected("'cycle_time_ms' must be a positive number");
        }
        cfg.cycle_time_ms = ct.get<uint32_t>();
    }

    return cfg;
}

std::expected<void, std::string> SweepConfig::validate(uint32_t min_cycle_time_ms) const {
    if (frequencies.empty()) {
        return std::unexpected("at least one frequency is required");
    }
    for (const auto& f : frequencies) {
        if (f.span_mhz <= 0.0) {
            return std::unexpected(std::format("span for {} MHz must be positive", f.center_mhz));
        }
        if (f.low_mhz() < kMinFrequencyMhz || f.high_mhz() > kMaxFrequencyMhz) {
            return std::unexpected(std::format("{}-{} MHz is outside {}-{} MHz",
                                               f.low_mhz(), f.high_mhz(),
                                               kMinFrequencyMhz, kMaxFrequencyMhz));
        }
    }
    if (cycle_time_ms < min_cycle_time_ms) {
        return std::unexpected(std::format("cycle time must be at least {} ms", min_cycle_time_ms));
    }
    return {};
}

json SweepConfig::to_json() const {
    json freqs = json::array();
    for (const auto& f : frequencies) {
        freqs.push_back({{"center_mhz", f.center_mhz}, {"span_mhz", f.span_mhz}});
    }
    return {{"frequencies", freqs}, {"cycle_time_ms", cycle_time_ms}};
}

std::string_view to_string(SweepPhase phase) {
    switch (phase) {
        case SweepPhase::Idle: return "idle";
        case SweepPhase::Starting: return "starting";
        case SweepPhase::Running: return "running";
        case SweepPhase::Stopping: return "stopping";
        case SweepPhase::Error: return "error";
        case SweepPhase::EmergencyStopped: return "emergency_stopped";
    }
    return "unknown";
}

bool can_transition(SweepPhase from, SweepPhase to) {
    // Reset paths (stop completion, sync, server reset) and emergency stop
    // are reachable from everywhere.
    if (to == SweepPhase::Idle || to == SweepPhase::EmergencyStopped) return true;

    switch (from) {
        case SweepPhase::Idle:
            return to == SweepPhase::Starting || to == SweepPhase::Running;
        case SweepPhase::Starting:
            return to == SweepPhase::Running || to == SweepPhase::Error ||
                   to == SweepPhase::Stopping;
        case SweepPhase::Running:
            return to == SweepPhase::Error || to == SweepPhase::Stopping;
        case SweepPhase::Stopping:
            return false;
        case SweepPhase::Error:
            return to == SweepPhase::Starting || to == SweepPhase::Stopping ||
                   to == SweepPhase::Running;
        case SweepPhase::EmergencyStopped:
            return false;
    }
    return false;
}

std::vector<std::string> sweep_arguments(const FrequencyEntry& entry, const Config::Device& device) {
    auto lo = static_cast<long>(std::floor(entry.low_mhz()));
    auto hi = static_cast<long>(std::ceil(entry.high_mhz()));
    if (hi <= lo) hi = lo + 1;
    return {
        device.sweep_binary,
        "-f", std::format("{}:{}", lo, hi),
        "-g", std::to_string(device.vga_gain),
        "-l", std::to_string(device.lna_gain),
        "-w", std::to_string(device.bin_width_hz),
    };
}
