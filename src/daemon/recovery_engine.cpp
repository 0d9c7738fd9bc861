#include "recovery_engine.hpp"

#include <algorithm>
#include <format>

using namespace std::chrono_literals;

namespace {

constexpr auto kRateWindow = 60s;

} // namespace

std::string_view to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::FatalStartup: return "fatal_startup";
        case FailureKind::UnexpectedExit: return "unexpected_exit";
        case FailureKind::NoData: return "no_data";
        case FailureKind::SpawnFailed: return "spawn_failed";
        case FailureKind::DeviceUnavailable: return "device_unavailable";
    }
    return "unknown";
}

std::string_view to_string(RecoveryStrategy strategy) {
    switch (strategy) {
        case RecoveryStrategy::WaitAndRetry: return "wait_and_retry";
        case RecoveryStrategy::AggressiveCleanup: return "aggressive_cleanup";
        case RecoveryStrategy::DeviceReset: return "device_reset";
        case RecoveryStrategy::ExtendedCooldown: return "extended_cooldown";
    }
    return "unknown";
}

RecoveryEngine::RecoveryEngine(Config::Recovery config)
    : config_(std::move(config)) {}

RecoveryAction RecoveryEngine::decide(const ErrorContext& ctx, TimePoint now) {
    recent_failures_.push_back(now);
    while (!recent_failures_.empty() && now - recent_failures_.front() > kRateWindow) {
        recent_failures_.pop_front();
    }

    uint32_t attempt = std::max<uint32_t>(ctx.consecutive_errors, 1);
    health_.consecutive_failures = attempt;

    if (recent_failures_.size() > config_.max_failures_per_minute) {
        cooling_down_ = true;
        return EscalateAction{std::format("{} failures within 60s", recent_failures_.size())};
    }

    bool advance = false;
    if (ctx.kind == FailureKind::FatalStartup) {
        if (ctx.futile) {
            return EscalateAction{"unrecoverable: " + ctx.message};
        }
        if (ctx.frequency_hz) {
            int64_t hz = *ctx.frequency_hz;
            uint32_t count = ++health_.fatal_counts[hz];
            if (count >= config_.blacklist_threshold) {
                if (ctx.active_frequencies > 1) {
                    health_.blacklisted.insert(hz);
                    return BlacklistAction{hz};
                }
                cooling_down_ = true;
                return EscalateAction{std::format("{} MHz failed to start {} times",
                                                  static_cast<double>(hz) / 1e6, count)};
            }
        }
        advance = ctx.active_frequencies > 1;
    }

    if (attempt >= config_.extended_cooldown_after) {
        health_.backoff_level = 4;
        cooling_down_ = true;
        return EscalateAction{std::format("{} consecutive failures, extended cooldown", attempt)};
    }

    auto action = strategy_for(attempt);
    action.advance_frequency = advance;
    health_.backoff_level = static_cast<uint32_t>(action.strategy) + 1;
    return action;
}

RetryAction RecoveryEngine::strategy_for(uint32_t attempt) const {
    RetryAction a;
    a.attempt = attempt;
    a.max_attempts = max_attempts();

    auto linear = std::chrono::milliseconds(static_cast<int64_t>(config_.base_retry_delay_ms) * attempt);
    if (attempt >= config_.device_reset_after) {
        a.strategy = RecoveryStrategy::DeviceReset;
        a.delay = std::chrono::milliseconds(config_.device_reset_cooldown_ms);
    } else if (attempt >= config_.cleanup_after) {
        a.strategy = RecoveryStrategy::AggressiveCleanup;
        a.delay = linear;
    } else {
        a.strategy = RecoveryStrategy::WaitAndRetry;
        a.delay = linear;
    }
    return a;
}

void RecoveryEngine::record_success(TimePoint now) {
    health_.consecutive_failures = 0;
    health_.backoff_level = 0;
    health_.last_known_good = now;
}

void RecoveryEngine::record_sample(double peak_power_db) {
    ++health_.samples_seen;
    health_.average_peak_power_db +=
        (peak_power_db - health_.average_peak_power_db) / static_cast<double>(health_.samples_seen);
}

void RecoveryEngine::clear_frequency_failures(int64_t frequency_hz) {
    health_.fatal_counts.erase(frequency_hz);
}

bool RecoveryEngine::is_blacklisted(int64_t frequency_hz) const {
    return health_.blacklisted.contains(frequency_hz);
}

void RecoveryEngine::clear_blacklist() {
    health_.blacklisted.clear();
    health_.fatal_counts.clear();
}

void RecoveryEngine::clear_cooldown() {
    cooling_down_ = false;
    recent_failures_.clear();
}

void RecoveryEngine::reset() {
    clear_blacklist();
    clear_cooldown();
    health_.consecutive_failures = 0;
    health_.backoff_level = 0;
}

nlohmann::json RecoveryEngine::health_json(TimePoint now) const {
    nlohmann::json j = {
        {"consecutive_failures", health_.consecutive_failures},
        {"backoff_level", health_.backoff_level},
        {"blacklisted_frequencies_hz", health_.blacklisted},
        {"average_peak_power_db", health_.average_peak_power_db},
        {"samples_seen", health_.samples_seen},
        {"cooling_down", cooling_down_},
    };
    if (health_.last_known_good) {
        j["ms_since_last_known_good"] =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - *health_.last_known_good).count();
    } else {
        j["ms_since_last_known_good"] = nullptr;
    }
    return j;
}
