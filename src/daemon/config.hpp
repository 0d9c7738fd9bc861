#pragma once

#include <cstdint>
#include <string>

struct Config {
    struct Device {
        std::string sweep_binary = "hackrf_sweep";
        std::string info_binary = "hackrf_info";
        uint32_t probe_timeout_ms = 3000;
        int lna_gain = 32;
        int vga_gain = 20;
        uint32_t bin_width_hz = 20000;
        double default_span_mhz = 10.0;
    } device;

    struct Sweep {
        uint32_t default_cycle_time_ms = 10000;
        uint32_t min_cycle_time_ms = 1000;
        uint32_t settle_ms = 2500;
        uint32_t monitor_interval_ms = 2000;
        uint32_t stop_grace_ms = 100;
        uint32_t kill_verify_timeout_ms = 2000;
        uint32_t self_check_interval_ms = 30000;
        uint32_t no_initial_data_ms = 60000;
        uint32_t data_timeout_ms = 7200000;
    } sweep;

    struct Recovery {
        uint32_t base_retry_delay_ms = 2000;
        uint32_t cleanup_after = 3;
        uint32_t device_reset_after = 5;
        uint32_t extended_cooldown_after = 7;
        uint32_t device_reset_cooldown_ms = 10000;
        uint32_t max_failures_per_minute = 5;
        uint32_t blacklist_threshold = 3;
    } recovery;

    struct Stream {
        uint32_t heartbeat_interval_ms = 15000;
        uint32_t eviction_multiple = 4;
        uint32_t max_queued_events = 256;
        uint32_t spectrum_throttle_ms = 50;

        // Computed from heartbeat_interval_ms and eviction_multiple (no independent config key).
        uint64_t eviction_timeout_ms() const {
            return static_cast<uint64_t>(heartbeat_interval_ms) * eviction_multiple;
        }
    } stream;

    struct Http {
        bool enabled = true;
        std::string address = "127.0.0.1";
        uint16_t port = 8092;
        uint32_t command_timeout_ms = 15000;
    } http;

    static Config load(const std::string& path);
    static Config load_default();
};
