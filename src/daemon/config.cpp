#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& section, const char* key, T& out) {
    if (section.contains(key)) out = section[key].get<T>();
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("device")) {
            auto& d = j["device"];
            read_key(d, "sweep_binary", cfg.device.sweep_binary);
            read_key(d, "info_binary", cfg.device.info_binary);
            read_key(d, "probe_timeout_ms", cfg.device.probe_timeout_ms);
            read_key(d, "lna_gain", cfg.device.lna_gain);
            read_key(d, "vga_gain", cfg.device.vga_gain);
            read_key(d, "bin_width_hz", cfg.device.bin_width_hz);
            read_key(d, "default_span_mhz", cfg.device.default_span_mhz);
        }

        if (j.contains("sweep")) {
            auto& s = j["sweep"];
            read_key(s, "default_cycle_time_ms", cfg.sweep.default_cycle_time_ms);
            read_key(s, "min_cycle_time_ms", cfg.sweep.min_cycle_time_ms);
            read_key(s, "settle_ms", cfg.sweep.settle_ms);
            read_key(s, "monitor_interval_ms", cfg.sweep.monitor_interval_ms);
            read_key(s, "stop_grace_ms", cfg.sweep.stop_grace_ms);
            read_key(s, "kill_verify_timeout_ms", cfg.sweep.kill_verify_timeout_ms);
            read_key(s, "self_check_interval_ms", cfg.sweep.self_check_interval_ms);
            read_key(s, "no_initial_data_ms", cfg.sweep.no_initial_data_ms);
            read_key(s, "data_timeout_ms", cfg.sweep.data_timeout_ms);
        }

        if (j.contains("recovery")) {
            auto& r = j["recovery"];
            read_key(r, "base_retry_delay_ms", cfg.recovery.base_retry_delay_ms);
            read_key(r, "cleanup_after", cfg.recovery.cleanup_after);
            read_key(r, "device_reset_after", cfg.recovery.device_reset_after);
            read_key(r, "extended_cooldown_after", cfg.recovery.extended_cooldown_after);
            read_key(r, "device_reset_cooldown_ms", cfg.recovery.device_reset_cooldown_ms);
            read_key(r, "max_failures_per_minute", cfg.recovery.max_failures_per_minute);
            read_key(r, "blacklist_threshold", cfg.recovery.blacklist_threshold);
        }

        if (j.contains("stream")) {
            auto& s = j["stream"];
            read_key(s, "heartbeat_interval_ms", cfg.stream.heartbeat_interval_ms);
            read_key(s, "eviction_multiple", cfg.stream.eviction_multiple);
            read_key(s, "max_queued_events", cfg.stream.max_queued_events);
            read_key(s, "spectrum_throttle_ms", cfg.stream.spectrum_throttle_ms);
        }

        if (j.contains("http")) {
            auto& h = j["http"];
            read_key(h, "enabled", cfg.http.enabled);
            read_key(h, "address", cfg.http.address);
            read_key(h, "port", cfg.http.port);
            read_key(h, "command_timeout_ms", cfg.http.command_timeout_ms);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
