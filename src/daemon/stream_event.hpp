#pragma once

#include "sweep_output_parser.hpp"
#include "sweep_types.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

struct ConnectedEvent {
    std::string connection_id;
};

struct SweepDataEvent {
    SweepSample sample;
};

struct StatusEvent {
    SweepPhase phase = SweepPhase::Idle;
    size_t current_index = 0;
    size_t frequency_count = 0;
    std::optional<FrequencyEntry> frequency;
    std::string detail;
};

struct CycleConfigEvent {
    SweepConfig config;
    uint32_t switching_delay_ms = 0;
};

struct HeartbeatEvent {
    uint64_t uptime_ms = 0;
    std::string connection_id;
};

struct RecoveryStartEvent {
    std::string reason;
    std::string strategy;
    uint32_t attempt = 0;
    uint32_t max_attempts = 0;
};

struct RecoveryCompleteEvent {
    std::string reason;
    uint32_t attempt = 0;
};

struct ErrorEvent {
    std::string message;
    std::string kind;
};

struct StateSyncEvent {
    nlohmann::json before;
    nlohmann::json after;
    std::vector<std::string> changes;
};

struct ServerResetEvent {
    std::string reason;
};

// Alternative order must match EventType.
using StreamEvent = std::variant<ConnectedEvent, SweepDataEvent, StatusEvent, CycleConfigEvent,
                                 HeartbeatEvent, RecoveryStartEvent, RecoveryCompleteEvent,
                                 ErrorEvent, StateSyncEvent, ServerResetEvent>;

enum class EventType {
    Connected,
    SweepData,
    Status,
    CycleConfig,
    Heartbeat,
    RecoveryStart,
    RecoveryComplete,
    Error,
    StateSync,
    ServerReset,
};

EventType event_type(const StreamEvent& event);
std::string_view event_name(EventType type);
std::optional<EventType> event_type_from_name(std::string_view name);

// JSON body for the wire, stamped with the current wall-clock time in ms.
nlohmann::json event_payload(const StreamEvent& event);
