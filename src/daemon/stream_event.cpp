#include "stream_event.hpp"

#include <array>
#include <chrono>
#include <utility>

using json = nlohmann::json;

namespace {

constexpr std::array<std::pair<EventType, std::string_view>, 10> kEventNames = {{
    {EventType::Connected, "connected"},
    {EventType::SweepData, "sweep_data"},
    {EventType::Status, "status"},
    {EventType::CycleConfig, "cycle_config"},
    {EventType::Heartbeat, "heartbeat"},
    {EventType::RecoveryStart, "recovery_start"},
    {EventType::RecoveryComplete, "recovery_complete"},
    {EventType::Error, "error"},
    {EventType::StateSync, "state_sync"},
    {EventType::ServerReset, "server_reset"},
}};

int64_t wall_clock_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

json to_json(const ConnectedEvent& e) {
    return {{"connection_id", e.connection_id}, {"message", "connected to sweep stream"}};
}

json to_json(const SweepDataEvent& e) {
    const auto& s = e.sample;
    return {
        {"frequency", s.peak_frequency_mhz},
        {"unit", "MHz"},
        {"power", s.peak_power_db},
        {"power_values", s.power_db},
        {"frequency_range", {{"low", s.hz_low}, {"high", s.hz_high}, {"center", s.center_hz()}}},
        {"bin_width", s.bin_width_hz},
        {"num_samples", s.num_samples},
        {"peak_bin_index", s.peak_index},
        {"signal_strength", s.signal_strength},
        {"source", s.source},
        {"date", s.date},
        {"time", s.time},
    };
}

json to_json(const StatusEvent& e) {
    json j = {
        {"state", to_string(e.phase)},
        {"current_index", e.current_index},
        {"total_frequencies", e.frequency_count},
    };
    if (e.frequency) {
        j["current_frequency"] = {{"center_mhz", e.frequency->center_mhz},
                                  {"span_mhz", e.frequency->span_mhz}};
    }
    if (!e.detail.empty()) j["detail"] = e.detail;
    return j;
}

json to_json(const CycleConfigEvent& e) {
    auto j = e.config.to_json();
    j["is_cycling"] = e.config.frequencies.size() > 1;
    j["switching_delay_ms"] = e.switching_delay_ms;
    return j;
}

json to_json(const HeartbeatEvent& e) {
    return {{"uptime_ms", e.uptime_ms}, {"connection_id", e.connection_id}};
}

json to_json(const RecoveryStartEvent& e) {
    return {
        {"reason", e.reason},
        {"strategy", e.strategy},
        {"attempt", e.attempt},
        {"max_attempts", e.max_attempts},
    };
}

json to_json(const RecoveryCompleteEvent& e) {
    return {{"reason", e.reason}, {"attempt", e.attempt}};
}

json to_json(const ErrorEvent& e) {
    return {{"message", e.message}, {"kind", e.kind}};
}

json to_json(const StateSyncEvent& e) {
    return {{"before", e.before}, {"after", e.after}, {"changes", e.changes}};
}

json to_json(const ServerResetEvent& e) {
    return {{"reason", e.reason}};
}

} // namespace

EventType event_type(const StreamEvent& event) {
    return static_cast<EventType>(event.index());
}

std::string_view event_name(EventType type) {
    for (const auto& [t, name] : kEventNames) {
        if (t == type) return name;
    }
    return "unknown";
}

std::optional<EventType> event_type_from_name(std::string_view name) {
    for (const auto& [t, n] : kEventNames) {
        if (n == name) return t;
    }
    return std::nullopt;
}

json event_payload(const StreamEvent& event) {
    auto j = std::visit([](const auto& e) { return to_json(e); }, event);
    j["timestamp"] = wall_clock_ms();
    return j;
}
