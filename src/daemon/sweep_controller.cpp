#include "sweep_controller.hpp"

#include <algorithm>
#include <format>
#include <memory>
#include <print>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

FailureKind failure_kind(SpawnErrorKind kind) {
    return kind == SpawnErrorKind::DeviceUnavailable ? FailureKind::DeviceUnavailable
                                                     : FailureKind::SpawnFailed;
}

int64_t elapsed_ms(Scheduler::Clock::time_point from, Scheduler::Clock::time_point to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

} // namespace

SweepController::SweepController(Scheduler& scheduler, ProcessSupervisor& supervisor,
                                 RecoveryEngine& engine, Config config, Publisher publish,
                                 bool verbose)
    : scheduler_(scheduler), supervisor_(supervisor), engine_(engine),
      cfg_(std::move(config)), publish_(std::move(publish)), verbose_(verbose) {}

SweepController::~SweepController() {
    cancel_timers();
    scheduler_.cancel(self_check_timer_);
}

// --- Commands ---

void SweepController::start(SweepConfig config, Reply reply) {
    if (state_.phase != SweepPhase::Idle || start_pending_) {
        reply({{"status", "rejected"},
               {"reason", std::format("sweep already active (state: {})",
                                      start_pending_ ? "starting" : to_string(state_.phase))}});
        return;
    }

    if (auto valid = config.validate(cfg_.sweep.min_cycle_time_ms); !valid) {
        reply({{"status", "rejected"}, {"reason", valid.error()}});
        return;
    }

    engine_.reset();
    config_ = std::move(config);
    state_.current_frequency_index = 0;
    state_.consecutive_error_count = 0;
    state_.last_error.clear();
    start_pending_ = true;

    uint64_t gen = ++generation_;
    log(std::format("Starting sweep over {} frequencies", config_->frequencies.size()));

    pending_start_reply_ = std::move(reply);
    spawn_current(gen, [this, gen](SpawnResult result) {
        start_pending_ = false;
        auto reply = std::move(pending_start_reply_);
        pending_start_reply_ = nullptr;
        if (!result) {
            auto reason = std::format("{}: {}", to_string(result.error().kind), result.error().reason);
            std::println(stderr, "sweep: start rejected: {}", reason);
            reply({{"status", "rejected"}, {"reason", reason}});
            return;
        }

        begin_run();
        publish(CycleConfigEvent{
            .config = *config_,
            .switching_delay_ms = static_cast<uint32_t>(switching_delay().count()),
        });
        on_spawned(gen);
        reply({
            {"status", "accepted"},
            {"state", to_string(state_.phase)},
            {"frequencies", config_->frequencies.size()},
            {"cycle_time_ms", config_->cycle_time_ms},
        });
    });
}

void SweepController::stop(Reply reply) {
    switch (state_.phase) {
        case SweepPhase::Idle:
            if (start_pending_) {
                ++generation_;
                cancel_pending_start("cancelled by stop");
            }
            reply({{"status", "ok"}, {"stopped", true}, {"final_state", to_string(state_.phase)}});
            return;
        case SweepPhase::EmergencyStopped:
            reply({{"status", "error"},
                   {"message", "sweep is emergency stopped; run sync or reset first"}});
            return;
        case SweepPhase::Stopping:
            stop_replies_.push_back(std::move(reply));
            return;
        case SweepPhase::Starting:
        case SweepPhase::Running:
        case SweepPhase::Error:
            break;
    }

    stop_replies_.push_back(std::move(reply));
    cancel_timers();
    ++generation_;
    in_transition_ = false;
    recovering_ = false;
    set_phase(SweepPhase::Stopping);
    supervisor_.stop(true, [this](bool verified) { finish_stop(verified); });
}

void SweepController::finish_stop(bool verified) {
    if (state_.phase == SweepPhase::Stopping) {
        state_.consecutive_error_count = 0;
        set_phase(SweepPhase::Idle, verified ? "stopped" : "stopped, process not confirmed dead");
        end_run();
    }

    auto replies = std::move(stop_replies_);
    stop_replies_.clear();
    for (auto& r : replies) {
        r({{"status", "ok"}, {"stopped", verified}, {"final_state", to_string(state_.phase)}});
    }
}

void SweepController::cancel_pending_start(const std::string& reason) {
    if (!start_pending_) return;
    start_pending_ = false;
    log("Pending start " + reason);
    if (pending_start_reply_) {
        auto reply = std::move(pending_start_reply_);
        pending_start_reply_ = nullptr;
        reply({{"status", "rejected"}, {"reason", reason}});
    }
}

void SweepController::emergency_stop(Reply reply) {
    cancel_timers();
    ++generation_;
    cancel_pending_start("cancelled by emergency stop");
    in_transition_ = false;
    recovering_ = false;

    std::println(stderr, "sweep: emergency stop (state was {})", to_string(state_.phase));
    set_phase(SweepPhase::EmergencyStopped, "emergency stop requested");
    end_run();

    supervisor_.emergency_kill_all([this, reply = std::move(reply)](bool verified) {
        if (!verified) {
            publish(ErrorEvent{.message = "sweep processes survived emergency kill", .kind = "emergency_stop"});
        }
        reply({{"status", "ok"}, {"stopped", verified}, {"final_state", to_string(state_.phase)}});
    });
}

void SweepController::force_cleanup(Reply reply) {
    cancel_timers();
    ++generation_;
    cancel_pending_start("cancelled by force cleanup");
    in_transition_ = false;
    recovering_ = false;

    supervisor_.force_cleanup_all([this, reply = std::move(reply)](bool verified) {
        if (state_.phase != SweepPhase::EmergencyStopped && state_.phase != SweepPhase::Idle) {
            state_.consecutive_error_count = 0;
            set_phase(SweepPhase::Idle, "force cleanup");
            end_run();
        }
        reply({{"status", "ok"}, {"cleaned", verified}, {"final_state", to_string(state_.phase)}});
    });
}

json SweepController::manual_sync() {
    auto before = state_snapshot();
    std::vector<std::string> changes;

    reconcile(changes);

    if (!engine_.health().blacklisted.empty()) {
        changes.push_back(std::format("cleared {} blacklisted frequencies",
                                      engine_.health().blacklisted.size()));
    }
    if (engine_.cooling_down()) changes.push_back("cleared recovery cooldown");
    engine_.clear_blacklist();
    engine_.clear_cooldown();

    if ((state_.phase == SweepPhase::EmergencyStopped || state_.phase == SweepPhase::Error) &&
        !supervisor_.handle()) {
        changes.push_back(std::format("released {} to idle", to_string(state_.phase)));
        cancel_timers();
        ++generation_;
        recovering_ = false;
        state_.consecutive_error_count = 0;
        set_phase(SweepPhase::Idle, "manual sync");
        end_run();
    }

    auto after = state_snapshot();
    publish(StateSyncEvent{.before = before, .after = after, .changes = changes});
    return {{"status", "ok"}, {"before_state", before}, {"after_state", after}, {"changes", changes}};
}

json SweepController::server_reset(const std::string& reason) {
    std::println(stderr, "sweep: server reset: {}", reason);
    cancel_timers();
    ++generation_;
    cancel_pending_start("cancelled by server reset");
    in_transition_ = false;
    recovering_ = false;

    supervisor_.force_cleanup_all([this](bool verified) {
        if (!verified) std::println(stderr, "sweep: processes survived server reset");
    });
    engine_.reset();

    set_phase(SweepPhase::Idle, "server reset");
    end_run();
    state_ = SweepState{};
    config_.reset();
    spawned_at_.reset();
    last_data_at_.reset();

    size_t notified = publish_ ? publish_(ServerResetEvent{.reason = reason}) : 0;
    return {{"status", "ok"}, {"clients_notified", notified}, {"final_state", to_string(state_.phase)}};
}

void SweepController::shutdown() {
    cancel_timers();
    scheduler_.cancel(self_check_timer_);
    self_check_timer_ = Scheduler::kInvalidTimer;
    ++generation_;
    cancel_pending_start("daemon shutting down");
    in_transition_ = false;

    supervisor_.stop_monitoring();
    auto killed = supervisor_.kill_matching();
    if (!killed.empty()) log(std::format("Killed {} sweep process(es) on shutdown", killed.size()));

    if (state_.phase != SweepPhase::Idle && state_.phase != SweepPhase::EmergencyStopped) {
        set_phase(SweepPhase::Idle, "daemon shutdown");
    }
    end_run();
}

// --- Spawning and cycling ---

void SweepController::spawn_current(uint64_t gen, std::function<void(SpawnResult)> done) {
    auto freq = current_frequency();
    if (!freq) {
        done(std::unexpected(SpawnError{SpawnErrorKind::SpawnFailed, "no frequency configured"}));
        return;
    }

    auto args = sweep_arguments(*freq, cfg_.device);
    auto result = std::make_shared<std::optional<SpawnResult>>();
    spawn_in_flight_ = true;

    scheduler_.offload(
        [this, args = std::move(args), result, gen] {
            *result = supervisor_.spawn(args, [this, gen](OutputStream stream, const std::string& line) {
                if (gen == generation_) handle_output(stream, line);
            });
        },
        [this, result, gen, done = std::move(done)] {
            spawn_in_flight_ = false;
            if (gen != generation_) {
                if (result->has_value() && result->value()) {
                    log(std::format("Discarding stale spawn (pid {})", result->value()->pid));
                    supervisor_.stop(false, [](bool) {});
                }
                return;
            }
            if (!result->has_value()) {
                done(std::unexpected(SpawnError{SpawnErrorKind::SpawnFailed, "spawn did not run"}));
                return;
            }
            done(std::move(**result));
        });
}

void SweepController::on_spawned(uint64_t gen) {
    auto now = scheduler_.now();
    state_.cycle_started_at = now;
    spawned_at_ = now;
    last_data_at_.reset();

    set_phase(SweepPhase::Starting, current_frequency() ? describe(*current_frequency()) : "");
    supervisor_.start_monitoring([this, gen] { on_process_death(gen); });

    settle_timer_ = scheduler_.schedule(std::chrono::milliseconds(cfg_.sweep.settle_ms), [this, gen] {
        settle_timer_ = Scheduler::kInvalidTimer;
        on_settled(gen);
    });
}

void SweepController::on_settled(uint64_t gen) {
    if (gen != generation_ || state_.phase != SweepPhase::Starting) return;

    set_phase(SweepPhase::Running);
    engine_.record_success(scheduler_.now());
    if (auto f = current_frequency()) engine_.clear_frequency_failures(f->center_hz());
    state_.consecutive_error_count = 0;

    if (recovering_) {
        publish(RecoveryCompleteEvent{.reason = recovery_reason_, .attempt = recovery_attempt_});
        recovering_ = false;
        log(std::format("Recovered after attempt {}", recovery_attempt_));
    }
    arm_cycle_timer();
}

void SweepController::arm_cycle_timer() {
    scheduler_.cancel(cycle_timer_);
    if (!config_) return;
    cycle_timer_ = scheduler_.schedule(std::chrono::milliseconds(config_->cycle_time_ms), [this] {
        cycle_timer_ = Scheduler::kInvalidTimer;
        on_cycle_tick();
    });
}

void SweepController::on_cycle_tick() {
    if (state_.phase != SweepPhase::Running || in_transition_ || !config_) return;

    state_.cycle_started_at = scheduler_.now();
    if (config_->frequencies.size() <= 1) {
        arm_cycle_timer();
        return;
    }

    auto next = next_active_index(state_.current_frequency_index);
    if (!next) {
        escalate("every frequency is blacklisted");
        return;
    }
    if (*next == state_.current_frequency_index) {
        arm_cycle_timer();
        return;
    }
    switch_to(*next);
}

void SweepController::switch_to(size_t index) {
    in_transition_ = true;
    state_.current_frequency_index = index;
    state_.cycle_started_at = scheduler_.now();
    publish(status_snapshot("switching to " + describe(config_->frequencies[index])));

    uint64_t gen = generation_;
    supervisor_.stop(true, [this, gen](bool verified) {
        if (gen != generation_) return;
        if (!verified) std::println(stderr, "sweep: previous process not confirmed dead before switch");

        switch_timer_ = scheduler_.schedule(switching_delay(), [this, gen] {
            switch_timer_ = Scheduler::kInvalidTimer;
            if (gen != generation_) return;
            spawn_current(gen, [this, gen](SpawnResult result) {
                in_transition_ = false;
                if (!result) {
                    handle_failure(failure_kind(result.error().kind), result.error().reason);
                    return;
                }
                supervisor_.start_monitoring([this, gen] { on_process_death(gen); });
                arm_cycle_timer();
            });
        });
    });
}

std::chrono::milliseconds SweepController::switching_delay() const {
    uint32_t cycle = config_ ? config_->cycle_time_ms : cfg_.sweep.default_cycle_time_ms;
    return std::chrono::milliseconds(std::clamp<uint32_t>(cycle / 4, 500, 3000));
}

// --- Output and failures ---

void SweepController::handle_output(OutputStream stream, const std::string& line) {
    if (stream == OutputStream::Stdout) {
        auto sample = parse_sweep_line(line);
        if (!sample) return;
        last_data_at_ = scheduler_.now();
        engine_.record_sample(sample->peak_power_db);
        publish(SweepDataEvent{.sample = std::move(*sample)});
        return;
    }

    if (ProcessSupervisor::classify_startup_error(line)) {
        std::println(stderr, "sweep: fatal device error: {}", line);
        handle_failure(FailureKind::FatalStartup, line);
    } else {
        log("hackrf_sweep: " + line);
    }
}

void SweepController::on_process_death(uint64_t gen) {
    if (gen != generation_ || in_transition_) return;
    if (state_.phase != SweepPhase::Starting && state_.phase != SweepPhase::Running) return;
    handle_failure(FailureKind::UnexpectedExit, "sweep process exited unexpectedly");
}

void SweepController::handle_failure(FailureKind kind, const std::string& message) {
    if (state_.phase != SweepPhase::Starting && state_.phase != SweepPhase::Running) return;

    cancel_timers();
    in_transition_ = false;
    ++state_.consecutive_error_count;
    ++run_error_count_;
    state_.last_error = message;

    set_phase(SweepPhase::Error, message);
    publish(ErrorEvent{.message = message, .kind = std::string(to_string(kind))});

    auto freq = current_frequency();
    ErrorContext ctx{
        .kind = kind,
        .message = message,
        .futile = ProcessSupervisor::is_futile_error(message),
        .frequency_hz = freq ? std::optional<int64_t>(freq->center_hz()) : std::nullopt,
        .consecutive_errors = state_.consecutive_error_count,
        .active_frequencies = active_frequency_count(),
    };
    auto action = engine_.decide(ctx, scheduler_.now());

    uint64_t gen = ++generation_;
    supervisor_.stop(true, [this, gen, action](bool) {
        if (gen != generation_) return;
        apply_recovery(action, gen);
    });
}

void SweepController::apply_recovery(const RecoveryAction& action, uint64_t gen) {
    if (const auto* retry = std::get_if<RetryAction>(&action)) {
        if (retry->advance_frequency) {
            if (auto next = next_active_index(state_.current_frequency_index)) {
                state_.current_frequency_index = *next;
            }
        }
        schedule_retry(*retry, gen);
        return;
    }

    if (const auto* bl = std::get_if<BlacklistAction>(&action)) {
        auto detail = std::format("blacklisted {:.3f} MHz after repeated startup failures",
                                  static_cast<double>(bl->frequency_hz) / 1e6);
        std::println(stderr, "sweep: {}", detail);
        publish(status_snapshot(detail));

        auto next = next_active_index(state_.current_frequency_index);
        if (!next) {
            escalate("every frequency is blacklisted");
            return;
        }
        state_.current_frequency_index = *next;
        schedule_retry(RetryAction{
            .delay = std::chrono::milliseconds(cfg_.recovery.base_retry_delay_ms),
            .strategy = RecoveryStrategy::WaitAndRetry,
            .attempt = state_.consecutive_error_count,
            .max_attempts = engine_.max_attempts(),
        }, gen);
        return;
    }

    escalate(std::get<EscalateAction>(action).reason);
}

void SweepController::schedule_retry(const RetryAction& action, uint64_t gen) {
    recovering_ = true;
    recovery_attempt_ = action.attempt;
    recovery_reason_ = state_.last_error;

    publish(RecoveryStartEvent{
        .reason = state_.last_error,
        .strategy = std::string(to_string(action.strategy)),
        .attempt = action.attempt,
        .max_attempts = action.max_attempts,
    });
    log(std::format("Recovery attempt {}/{} ({}) in {} ms", action.attempt, action.max_attempts,
                    to_string(action.strategy), action.delay.count()));

    if (action.strategy == RecoveryStrategy::AggressiveCleanup) {
        supervisor_.force_cleanup_all([this](bool verified) {
            if (!verified) std::println(stderr, "sweep: cleanup before retry left processes behind");
        });
    }

    retry_timer_ = scheduler_.schedule(action.delay, [this, action, gen] {
        retry_timer_ = Scheduler::kInvalidTimer;
        if (gen != generation_ || state_.phase != SweepPhase::Error) return;
        retry_spawn(action, gen);
    });
}

void SweepController::retry_spawn(const RetryAction& action, uint64_t gen) {
    set_phase(SweepPhase::Starting, "recovery attempt " + std::to_string(action.attempt));
    if (action.strategy != RecoveryStrategy::DeviceReset) {
        respawn(gen);
        return;
    }

    // After the reset cooldown the device is checked on its own and the outcome published
    auto check = std::make_shared<ProbeResult>();
    spawn_in_flight_ = true;
    scheduler_.offload([this, check] { *check = supervisor_.probe_device(); }, [this, check, gen] {
        spawn_in_flight_ = false;
        if (gen != generation_) return;
        std::println(stderr, "sweep: device reset check: {}", check->reason);
        publish(status_snapshot("device reset check: " + check->reason));
        if (!check->available) {
            handle_failure(FailureKind::DeviceUnavailable, "device reset check: " + check->reason);
            return;
        }
        respawn(gen);
    });
}

void SweepController::respawn(uint64_t gen) {
    spawn_current(gen, [this, gen](SpawnResult result) {
        if (!result) {
            handle_failure(failure_kind(result.error().kind), result.error().reason);
            return;
        }
        on_spawned(gen);
    });
}

void SweepController::escalate(const std::string& reason) {
    std::println(stderr, "sweep: escalating to emergency stop: {}", reason);
    cancel_timers();
    ++generation_;
    in_transition_ = false;
    recovering_ = false;
    state_.last_error = reason;

    set_phase(SweepPhase::EmergencyStopped, reason);
    publish(ErrorEvent{.message = reason, .kind = "escalated"});
    end_run();

    supervisor_.emergency_kill_all([this](bool verified) {
        if (!verified) std::println(stderr, "sweep: processes survived escalation kill");
        log("Escalation kill complete");
    });
}

// --- Reconciliation ---

void SweepController::start_self_check() {
    scheduler_.cancel(self_check_timer_);
    self_check_timer_ = scheduler_.schedule_every(
        std::chrono::milliseconds(cfg_.sweep.self_check_interval_ms), [this] { self_check(); });
}

void SweepController::self_check() {
    auto before = state_snapshot();
    std::vector<std::string> changes;
    reconcile(changes);
    if (!changes.empty()) {
        publish(StateSyncEvent{.before = before, .after = state_snapshot(), .changes = changes});
    }

    if (state_.phase != SweepPhase::Running || in_transition_ || !spawned_at_) return;

    auto now = scheduler_.now();
    if (!last_data_at_) {
        if (now - *spawned_at_ >= std::chrono::milliseconds(cfg_.sweep.no_initial_data_ms)) {
            handle_failure(FailureKind::NoData,
                           std::format("no sweep data within {} s of spawn", cfg_.sweep.no_initial_data_ms / 1000));
        }
    } else if (now - *last_data_at_ >= std::chrono::milliseconds(cfg_.sweep.data_timeout_ms)) {
        handle_failure(FailureKind::NoData,
                       std::format("no sweep data for {} s", cfg_.sweep.data_timeout_ms / 1000));
    }
}

void SweepController::reconcile(std::vector<std::string>& changes) {
    auto obs = supervisor_.observe();
    // A process the supervisor is still killing belongs to that stop sequence
    bool busy = spawn_in_flight_ || in_transition_ || start_pending_ || supervisor_.stopping();

    bool active = state_.phase == SweepPhase::Starting || state_.phase == SweepPhase::Running;
    if (active && !obs.handle_alive && !busy) {
        changes.push_back(std::format("state was {} but no sweep process is alive", to_string(state_.phase)));
        cancel_timers();
        ++generation_;
        recovering_ = false;
        supervisor_.stop_monitoring();
        if (obs.pid) supervisor_.stop(false, [](bool) {});
        set_phase(SweepPhase::Idle, "reconciled: process gone");
        end_run();
    } else if (obs.handle_alive && !active && !busy && state_.phase != SweepPhase::Stopping &&
               state_.phase != SweepPhase::Error) {
        // Error is left to recovery, which stops the process before retrying
        if (state_.phase == SweepPhase::EmergencyStopped || !config_) {
            changes.push_back(std::format("killed live sweep process {} while {}", *obs.pid,
                                          to_string(state_.phase)));
            supervisor_.emergency_kill_all([](bool) {});
        } else {
            changes.push_back(std::format("adopted live sweep process {}", *obs.pid));
            cancel_timers();
            uint64_t gen = ++generation_;
            set_phase(SweepPhase::Running, "reconciled: process alive");
            supervisor_.start_monitoring([this, gen] { on_process_death(gen); });
            arm_cycle_timer();
        }
    }

    if (!obs.orphan_pids.empty() && !spawn_in_flight_) {
        auto killed = supervisor_.kill_orphans();
        if (!killed.empty()) {
            changes.push_back(std::format("killed {} orphaned sweep process(es)", killed.size()));
        }
    }
}

// --- Helpers ---

bool SweepController::set_phase(SweepPhase to, const std::string& detail) {
    if (state_.phase == to) return true;
    if (!can_transition(state_.phase, to)) {
        std::println(stderr, "sweep: refusing transition {} -> {}", to_string(state_.phase), to_string(to));
        return false;
    }
    log(std::format("{} -> {}{}", to_string(state_.phase), to_string(to),
                    detail.empty() ? "" : " (" + detail + ")"));
    state_.phase = to;
    publish(status_snapshot(detail));
    return true;
}

void SweepController::cancel_timers() {
    for (auto* t : {&settle_timer_, &cycle_timer_, &switch_timer_, &retry_timer_}) {
        scheduler_.cancel(*t);
        *t = Scheduler::kInvalidTimer;
    }
}

void SweepController::begin_run() {
    run_active_ = true;
    run_error_count_ = 0;
    if (run_callbacks_.started && config_) run_callbacks_.started(*config_);
}

void SweepController::end_run() {
    if (!run_active_) return;
    run_active_ = false;
    if (run_callbacks_.finished) {
        run_callbacks_.finished(state_.phase, run_error_count_, state_.last_error);
    }
}

std::optional<size_t> SweepController::next_active_index(size_t from) {
    if (!config_ || config_->frequencies.empty()) return std::nullopt;
    size_t n = config_->frequencies.size();
    for (size_t step = 1; step <= n; ++step) {
        size_t idx = (from + step) % n;
        const auto& f = config_->frequencies[idx];
        if (engine_.is_blacklisted(f.center_hz())) {
            if (idx != from) publish(status_snapshot("skipping blacklisted " + describe(f)));
            continue;
        }
        return idx;
    }
    return std::nullopt;
}

size_t SweepController::active_frequency_count() const {
    if (!config_) return 0;
    return static_cast<size_t>(std::ranges::count_if(config_->frequencies, [this](const FrequencyEntry& f) {
        return !engine_.is_blacklisted(f.center_hz());
    }));
}

std::optional<FrequencyEntry> SweepController::current_frequency() const {
    if (!config_ || state_.current_frequency_index >= config_->frequencies.size()) return std::nullopt;
    return config_->frequencies[state_.current_frequency_index];
}

std::string SweepController::describe(const FrequencyEntry& f) const {
    return std::format("{:.3f} MHz (±{:.3f})", f.center_mhz, f.span_mhz);
}

StatusEvent SweepController::status_snapshot(std::string detail) const {
    return StatusEvent{
        .phase = state_.phase,
        .current_index = state_.current_frequency_index,
        .frequency_count = config_ ? config_->frequencies.size() : 0,
        .frequency = current_frequency(),
        .detail = std::move(detail),
    };
}

json SweepController::state_snapshot() const {
    auto h = supervisor_.handle();
    return {
        {"state", to_string(state_.phase)},
        {"process_pid", h ? json(h->pid) : json(nullptr)},
        {"current_index", state_.current_frequency_index},
        {"consecutive_errors", state_.consecutive_error_count},
        {"blacklisted", engine_.health().blacklisted.size()},
    };
}

json SweepController::cycle_status() const {
    auto now = scheduler_.now();
    auto h = supervisor_.handle();

    json resp = {
        {"status", "ok"},
        {"state", to_string(state_.phase)},
        {"is_running", state_.phase == SweepPhase::Running || state_.phase == SweepPhase::Starting},
        {"start_pending", start_pending_},
        {"in_transition", in_transition_},
        {"current_index", state_.current_frequency_index},
        {"consecutive_errors", state_.consecutive_error_count},
        {"last_error", state_.last_error},
        {"switching_delay_ms", switching_delay().count()},
    };

    if (config_) {
        resp["frequencies"] = config_->to_json()["frequencies"];
        resp["cycle_time_ms"] = config_->cycle_time_ms;
        resp["is_cycling"] = config_->frequencies.size() > 1;
    } else {
        resp["frequencies"] = json::array();
        resp["cycle_time_ms"] = cfg_.sweep.default_cycle_time_ms;
        resp["is_cycling"] = false;
    }

    if (auto f = current_frequency()) {
        resp["current_frequency"] = {{"center_mhz", f->center_mhz}, {"span_mhz", f->span_mhz}};
    }
    if (state_.cycle_started_at) {
        auto in_cycle = elapsed_ms(*state_.cycle_started_at, now);
        resp["time_in_cycle_ms"] = in_cycle;
        if (config_) {
            resp["time_to_next_cycle_ms"] = std::max<int64_t>(0, config_->cycle_time_ms - in_cycle);
        }
    }

    json proc = {{"monitoring", supervisor_.monitoring()}};
    if (h) {
        proc["pid"] = h->pid;
        proc["pgid"] = h->pgid;
        proc["uptime_ms"] = elapsed_ms(h->start_time, std::chrono::steady_clock::now());
    } else {
        proc["pid"] = nullptr;
    }
    if (last_data_at_) proc["ms_since_last_data"] = elapsed_ms(*last_data_at_, now);
    resp["process_health"] = proc;
    resp["device_health"] = engine_.health_json(now);
    return resp;
}

void SweepController::publish(const StreamEvent& event) {
    if (publish_) publish_(event);
}

void SweepController::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[sweepwatch] {}", msg);
    }
}
