#pragma once

#include "config.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

inline constexpr double kMinFrequencyMhz = 1.0;
inline constexpr double kMaxFrequencyMhz = 7250.0;

struct FrequencyEntry {
    double center_mhz = 0.0;
    double span_mhz = 0.0;

    double low_mhz() const { return center_mhz - span_mhz; }
    double high_mhz() const { return center_mhz + span_mhz; }
    int64_t center_hz() const;

    bool operator==(const FrequencyEntry&) const = default;
};

struct SweepConfig {
    std::vector<FrequencyEntry> frequencies;
    uint32_t cycle_time_ms = 10000;

    // Accepts {"frequencies": [...], "cycle_time_ms": N}. Each frequency may be
    // a number in MHz, {"value", "unit"}, {"start", "stop"} or {"start", "end"}.
    static std::expected<SweepConfig, std::string>
    from_json(const nlohmann::json& j, double default_span_mhz, uint32_t default_cycle_time_ms);

    std::expected<void, std::string> validate(uint32_t min_cycle_time_ms) const;

    nlohmann::json to_json() const;
};

enum class SweepPhase { Idle, Starting, Running, Stopping, Error, EmergencyStopped };

std::string_view to_string(SweepPhase phase);

bool can_transition(SweepPhase from, SweepPhase to);

struct SweepState {
    SweepPhase phase = SweepPhase::Idle;
    size_t current_frequency_index = 0;
    std::optional<std::chrono::steady_clock::time_point> cycle_started_at;
    uint32_t consecutive_error_count = 0;
    std::string last_error;
};

// hackrf_sweep arguments for one frequency window: -f lo:hi -g vga -l lna -w bin
std::vector<std::string> sweep_arguments(const FrequencyEntry& entry, const Config::Device& device);
