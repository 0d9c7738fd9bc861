#pragma once

#include "event_source.hpp"
#include "platform/scheduler.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

struct ReconnectConfig {
    std::chrono::milliseconds staleness_check_interval{30000};
    std::chrono::milliseconds stale_after{90000};
    uint32_t max_attempts = 10;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
};

enum class ConnectionState { Idle, Connecting, Connected, Waiting, Terminal };

std::string_view to_string(ConnectionState state);

// Keeps one dashboard stream alive. Reconnects with exponential backoff
// and gives up for good after max_attempts consecutive failures.
class ClientReconnector {
public:
    using MessageCallback = std::function<void(const SseMessage&)>;
    using StateCallback = std::function<void(ConnectionState, const std::string& detail)>;

    ClientReconnector(Scheduler& scheduler, EventSource& source, std::string url,
                      ReconnectConfig config = {}, bool verbose = false);
    ~ClientReconnector();

    ClientReconnector(const ClientReconnector&) = delete;
    ClientReconnector& operator=(const ClientReconnector&) = delete;

    void on_message(MessageCallback cb) { on_message_ = std::move(cb); }
    void on_state(StateCallback cb) { on_state_ = std::move(cb); }

    void start();
    void stop();

    // Hidden sessions keep their connection but skip staleness checks.
    void set_visible(bool visible);

    ConnectionState state() const { return state_; }
    bool connected() const { return state_ == ConnectionState::Connected; }
    bool connecting() const { return state_ == ConnectionState::Connecting; }
    bool terminal() const { return state_ == ConnectionState::Terminal; }
    bool visible() const { return visible_; }
    uint32_t reconnect_attempts() const { return attempts_; }
    std::optional<Scheduler::Clock::time_point> last_data_at() const { return last_data_at_; }

    // Delay before reconnect attempt n (1-based).
    static std::chrono::milliseconds backoff_delay(uint32_t attempt, const ReconnectConfig& config);

private:
    void connect();
    void handle_open();
    void handle_message(const SseMessage& msg);
    void handle_error(const std::string& reason);
    void check_staleness();
    void arm_staleness_check();
    void cancel_timers();
    void set_state(ConnectionState state, const std::string& detail = {});
    void log(const std::string& msg);

    Scheduler& scheduler_;
    EventSource& source_;
    std::string url_;
    ReconnectConfig config_;
    bool verbose_;

    ConnectionState state_ = ConnectionState::Idle;
    bool visible_ = true;
    uint32_t attempts_ = 0;
    std::optional<Scheduler::Clock::time_point> last_data_at_;

    Scheduler::TimerId staleness_timer_ = Scheduler::kInvalidTimer;
    Scheduler::TimerId reconnect_timer_ = Scheduler::kInvalidTimer;

    MessageCallback on_message_;
    StateCallback on_state_;
};
