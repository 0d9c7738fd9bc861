#pragma once

#include "config.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>

enum class FailureKind { FatalStartup, UnexpectedExit, NoData, SpawnFailed, DeviceUnavailable };

enum class RecoveryStrategy { WaitAndRetry, AggressiveCleanup, DeviceReset, ExtendedCooldown };

std::string_view to_string(FailureKind kind);
std::string_view to_string(RecoveryStrategy strategy);

struct ErrorContext {
    FailureKind kind = FailureKind::UnexpectedExit;
    std::string message;
    bool futile = false;
    std::optional<int64_t> frequency_hz;
    uint32_t consecutive_errors = 1;
    // Frequencies in the sweep that are not blacklisted.
    size_t active_frequencies = 1;
};

struct RetryAction {
    std::chrono::milliseconds delay{0};
    RecoveryStrategy strategy = RecoveryStrategy::WaitAndRetry;
    uint32_t attempt = 0;
    uint32_t max_attempts = 0;
    bool advance_frequency = false;
};

struct BlacklistAction {
    int64_t frequency_hz = 0;
};

struct EscalateAction {
    std::string reason;
};

using RecoveryAction = std::variant<RetryAction, BlacklistAction, EscalateAction>;

struct DeviceHealthRecord {
    std::optional<std::chrono::steady_clock::time_point> last_known_good;
    uint32_t consecutive_failures = 0;
    uint32_t backoff_level = 0;
    std::set<int64_t> blacklisted;
    std::map<int64_t, uint32_t> fatal_counts;
    double average_peak_power_db = 0.0;
    uint64_t samples_seen = 0;
};

// Supervising thread only. Every update, the power average included, arrives
// there in order, so nothing here is locked.
class RecoveryEngine {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    explicit RecoveryEngine(Config::Recovery config);

    RecoveryAction decide(const ErrorContext& ctx, TimePoint now);

    void record_success(TimePoint now);
    void record_sample(double peak_power_db);

    void clear_frequency_failures(int64_t frequency_hz);
    bool is_blacklisted(int64_t frequency_hz) const;
    void clear_blacklist();

    // True after an extended-cooldown escalation until cleared.
    bool cooling_down() const { return cooling_down_; }
    void clear_cooldown();

    // Clears failure state; sample statistics and last_known_good survive.
    void reset();

    uint32_t max_attempts() const { return config_.extended_cooldown_after - 1; }

    const DeviceHealthRecord& health() const { return health_; }
    nlohmann::json health_json(TimePoint now) const;

private:
    RetryAction strategy_for(uint32_t attempt) const;

    Config::Recovery config_;
    DeviceHealthRecord health_;
    std::deque<TimePoint> recent_failures_;
    bool cooling_down_ = false;
};
