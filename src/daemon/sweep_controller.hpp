#pragma once

#include "config.hpp"
#include "platform/scheduler.hpp"
#include "process_supervisor.hpp"
#include "recovery_engine.hpp"
#include "stream_event.hpp"
#include "sweep_types.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Lifecycle notifications for one sweep run (Start accepted until the sweep
// comes to rest in Idle or EmergencyStopped).
struct RunCallbacks {
    std::function<void(const SweepConfig&)> started;
    std::function<void(SweepPhase final_phase, uint32_t error_count, const std::string& last_error)> finished;
};

// Sweep state machine and frequency cycling. Scheduler thread only.
class SweepController {
public:
    using Reply = std::function<void(nlohmann::json)>;
    // Returns the number of subscribers the event reached.
    using Publisher = std::function<size_t(const StreamEvent&)>;

    SweepController(Scheduler& scheduler, ProcessSupervisor& supervisor, RecoveryEngine& engine,
                    Config config, Publisher publish, bool verbose = false);
    ~SweepController();

    SweepController(const SweepController&) = delete;
    SweepController& operator=(const SweepController&) = delete;

    void start(SweepConfig config, Reply reply);
    void stop(Reply reply);
    void emergency_stop(Reply reply);
    void force_cleanup(Reply reply);
    nlohmann::json manual_sync();
    nlohmann::json server_reset(const std::string& reason);

    // Arms the periodic split-brain and data-timeout check.
    void start_self_check();
    void self_check();

    // Synchronous kill of everything, for daemon shutdown.
    void shutdown();

    nlohmann::json cycle_status() const;
    nlohmann::json state_snapshot() const;
    StatusEvent status_snapshot(std::string detail = {}) const;

    const SweepState& state() const { return state_; }
    const std::optional<SweepConfig>& config() const { return config_; }
    bool start_pending() const { return start_pending_; }
    bool in_transition() const { return in_transition_; }

    void set_run_callbacks(RunCallbacks callbacks) { run_callbacks_ = std::move(callbacks); }

    std::chrono::milliseconds switching_delay() const;

private:
    using SpawnResult = std::expected<ProcessHandle, SpawnError>;

    bool set_phase(SweepPhase to, const std::string& detail = {});
    void spawn_current(uint64_t gen, std::function<void(SpawnResult)> done);
    void on_spawned(uint64_t gen);
    void on_settled(uint64_t gen);
    void arm_cycle_timer();
    void on_cycle_tick();
    void switch_to(size_t index);
    void handle_output(OutputStream stream, const std::string& line);
    void on_process_death(uint64_t gen);
    void handle_failure(FailureKind kind, const std::string& message);
    void apply_recovery(const RecoveryAction& action, uint64_t gen);
    void schedule_retry(const RetryAction& action, uint64_t gen);
    void retry_spawn(const RetryAction& action, uint64_t gen);
    void respawn(uint64_t gen);
    void escalate(const std::string& reason);
    void finish_stop(bool verified);
    void cancel_pending_start(const std::string& reason);
    void reconcile(std::vector<std::string>& changes);
    void cancel_timers();
    void begin_run();
    void end_run();

    std::optional<size_t> next_active_index(size_t from);
    size_t active_frequency_count() const;
    std::optional<FrequencyEntry> current_frequency() const;
    std::string describe(const FrequencyEntry& f) const;

    void publish(const StreamEvent& event);
    void log(const std::string& msg);

    Scheduler& scheduler_;
    ProcessSupervisor& supervisor_;
    RecoveryEngine& engine_;
    Config cfg_;
    Publisher publish_;
    bool verbose_;

    SweepState state_;
    std::optional<SweepConfig> config_;

    // Bumped whenever pending work (spawns, timers, output) must be ignored.
    uint64_t generation_ = 0;
    bool start_pending_ = false;
    bool spawn_in_flight_ = false;
    bool in_transition_ = false;

    bool recovering_ = false;
    uint32_t recovery_attempt_ = 0;
    std::string recovery_reason_;

    std::optional<Scheduler::Clock::time_point> spawned_at_;
    std::optional<Scheduler::Clock::time_point> last_data_at_;

    Scheduler::TimerId settle_timer_ = Scheduler::kInvalidTimer;
    Scheduler::TimerId cycle_timer_ = Scheduler::kInvalidTimer;
    Scheduler::TimerId switch_timer_ = Scheduler::kInvalidTimer;
    Scheduler::TimerId retry_timer_ = Scheduler::kInvalidTimer;
    Scheduler::TimerId self_check_timer_ = Scheduler::kInvalidTimer;

    Reply pending_start_reply_;
    std::vector<Reply> stop_replies_;

    RunCallbacks run_callbacks_;
    bool run_active_ = false;
    uint32_t run_error_count_ = 0;
};
