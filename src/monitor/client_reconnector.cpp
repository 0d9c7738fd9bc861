#include "client_reconnector.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <print>

std::string_view to_string(ConnectionState state) {
    switch (state) {
    case ConnectionState::Idle: return "idle";
    case ConnectionState::Connecting: return "connecting";
    case ConnectionState::Connected: return "connected";
    case ConnectionState::Waiting: return "waiting";
    case ConnectionState::Terminal: return "terminal";
    }
    return "unknown";
}

ClientReconnector::ClientReconnector(Scheduler& scheduler, EventSource& source, std::string url,
                                     ReconnectConfig config, bool verbose)
    : scheduler_(scheduler), source_(source), url_(std::move(url)), config_(config),
      verbose_(verbose) {}

ClientReconnector::~ClientReconnector() {
    stop();
}

std::chrono::milliseconds ClientReconnector::backoff_delay(uint32_t attempt,
                                                           const ReconnectConfig& config) {
    if (attempt == 0) attempt = 1;
    // Past 2^20 the cap has long applied
    uint32_t shift = std::min<uint32_t>(attempt - 1, 20);
    std::chrono::milliseconds delay = config.base_delay * (int64_t{1} << shift);
    return std::min(delay, config.max_delay);
}

void ClientReconnector::start() {
    if (state_ != ConnectionState::Idle) return;
    attempts_ = 0;
    connect();
}

void ClientReconnector::stop() {
    cancel_timers();
    if (state_ == ConnectionState::Connecting || state_ == ConnectionState::Connected) {
        source_.close();
    }
    state_ = ConnectionState::Idle;
}

void ClientReconnector::set_visible(bool visible) {
    if (visible_ == visible) return;
    visible_ = visible;

    if (!visible) {
        log("Hidden: staleness check paused");
        scheduler_.cancel(staleness_timer_);
        staleness_timer_ = Scheduler::kInvalidTimer;
        return;
    }

    log("Visible: staleness check resumed");
    last_data_at_ = scheduler_.now();
    if (state_ == ConnectionState::Connected) {
        arm_staleness_check();
    } else if (state_ == ConnectionState::Waiting) {
        // Lost while hidden: don't sit out the rest of the backoff
        scheduler_.cancel(reconnect_timer_);
        reconnect_timer_ = Scheduler::kInvalidTimer;
        connect();
    }
}

void ClientReconnector::connect() {
    if (state_ == ConnectionState::Terminal) return;
    set_state(ConnectionState::Connecting, url_);

    source_.open(url_, {
        .on_open = [this] { handle_open(); },
        .on_message = [this](const SseMessage& msg) { handle_message(msg); },
        .on_error = [this](const std::string& reason) { handle_error(reason); },
    });
}

void ClientReconnector::handle_open() {
    attempts_ = 0;
    last_data_at_ = scheduler_.now();
    set_state(ConnectionState::Connected);
    if (visible_) arm_staleness_check();
}

void ClientReconnector::handle_message(const SseMessage& msg) {
    last_data_at_ = scheduler_.now();
    if (on_message_) on_message_(msg);
}

void ClientReconnector::handle_error(const std::string& reason) {
    if (state_ == ConnectionState::Idle || state_ == ConnectionState::Terminal) return;

    cancel_timers();
    source_.close();

    attempts_++;
    if (attempts_ >= config_.max_attempts) {
        log(std::format("Giving up after {} attempts: {}", attempts_, reason));
        set_state(ConnectionState::Terminal, "Connection lost. Please refresh.");
        return;
    }

    auto delay = backoff_delay(attempts_, config_);
    set_state(ConnectionState::Waiting,
              std::format("{}; reconnecting in {} ms (attempt {}/{})", reason, delay.count(),
                          attempts_, config_.max_attempts));
    reconnect_timer_ = scheduler_.schedule(delay, [this] {
        reconnect_timer_ = Scheduler::kInvalidTimer;
        connect();
    });
}

void ClientReconnector::check_staleness() {
    if (!visible_ || state_ != ConnectionState::Connected || !last_data_at_) return;

    auto silent = scheduler_.now() - *last_data_at_;
    if (silent < config_.stale_after) return;

    log(std::format("Stream stale for {} ms, reconnecting",
                    std::chrono::duration_cast<std::chrono::milliseconds>(silent).count()));
    cancel_timers();
    source_.close();
    connect();
}

void ClientReconnector::arm_staleness_check() {
    scheduler_.cancel(staleness_timer_);
    staleness_timer_ = scheduler_.schedule_every(config_.staleness_check_interval,
                                                 [this] { check_staleness(); });
}

void ClientReconnector::cancel_timers() {
    scheduler_.cancel(staleness_timer_);
    scheduler_.cancel(reconnect_timer_);
    staleness_timer_ = Scheduler::kInvalidTimer;
    reconnect_timer_ = Scheduler::kInvalidTimer;
}

void ClientReconnector::set_state(ConnectionState state, const std::string& detail) {
    state_ = state;
    if (on_state_) on_state_(state, detail);
}

void ClientReconnector::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[sweepwatch] {}", msg);
    }
}
