#include "event_printer.hpp"

#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::string format_event(const SseMessage& msg) {
    json j = json::parse(msg.data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::format("[{}] {}", msg.event, msg.data);
    }

    if (msg.event == "sweep_data") {
        auto range = j.value("frequency_range", json::object());
        return std::format("[sweep_data] {:.3f}-{:.3f} MHz  peak {:.3f} MHz  {:.1f} dB  ({})",
                           range.value("low", 0.0) / 1e6, range.value("high", 0.0) / 1e6,
                           j.value("frequency", 0.0), j.value("power", 0.0),
                           j.value("signal_strength", ""));
    }
    if (msg.event == "status") {
        std::string line = std::format("[status] {} ({}/{})", j.value("state", "?"),
                                       j.value("current_index", 0) + 1,
                                       j.value("total_frequencies", 0));
        if (j.contains("current_frequency")) {
            line += std::format(" @ {:.3f} MHz", j["current_frequency"].value("center_mhz", 0.0));
        }
        if (auto detail = j.value("detail", ""); !detail.empty()) line += ": " + detail;
        return line;
    }
    if (msg.event == "heartbeat") {
        return std::format("[heartbeat] server up {} s", j.value("uptime_ms", int64_t{0}) / 1000);
    }
    if (msg.event == "recovery_start") {
        return std::format("[recovery] {} via {} (attempt {}/{})", j.value("reason", ""),
                           j.value("strategy", ""), j.value("attempt", 0), j.value("max_attempts", 0));
    }
    if (msg.event == "recovery_complete") {
        return std::format("[recovery] recovered after {} attempt(s)", j.value("attempt", 0));
    }
    if (msg.event == "error") {
        return std::format("[error] {} ({})", j.value("message", ""), j.value("kind", ""));
    }

    j.erase("timestamp");
    return std::format("[{}] {}", msg.event, j.dump());
}
