#include "daemon_core.hpp"

#include "platform/platform_paths.hpp"

#include <chrono>
#include <format>
#include <print>

using json = nlohmann::json;

DaemonCore::DaemonCore(Config config, bool verbose, Scheduler& scheduler, ProcessLauncher& launcher)
    : config_(std::move(config)), verbose_(verbose), scheduler_(scheduler),
      supervisor_(launcher, scheduler_, config_.device, config_.sweep, verbose_),
      engine_(config_.recovery),
      hub_(scheduler_, config_.stream, verbose_),
      controller_(scheduler_, supervisor_, engine_, config_,
                  [this](const StreamEvent& event) { return hub_.publish(event); },
                  verbose_),
      started_at_(scheduler_.now()) {
    controller_.set_run_callbacks({
        .started = [this](const SweepConfig& cfg) { on_run_started(cfg); },
        .finished = [this](SweepPhase phase, uint32_t errors, const std::string& last_error) {
            on_run_finished(phase, errors, last_error);
        },
    });
}

DaemonCore::~DaemonCore() = default;

bool DaemonCore::init(const std::string& history_path) {
    std::string db_path = history_path;
    if (db_path.empty()) {
        auto data = platform::data_dir();
        db_path = !data.empty() ? data + "/runs.db" : "/tmp/sweepwatch/runs.db";
    }
    if (!history_.open(db_path)) {
        std::println(stderr, "Warning: run history failed to open, history disabled");
    } else {
        log("Run history at " + db_path);
    }

    controller_.start_self_check();
    return true;
}

void DaemonCore::handle_command(const std::string& cmd_str, const json& cmd, Reply reply) {
    if (cmd_str == "start") return handle_start(cmd, std::move(reply));
    if (cmd_str == "stop") return controller_.stop(std::move(reply));
    if (cmd_str == "emergency-stop") return controller_.emergency_stop(std::move(reply));
    if (cmd_str == "force-cleanup") return controller_.force_cleanup(std::move(reply));
    if (cmd_str == "cycle-status") return reply(controller_.cycle_status());
    if (cmd_str == "sync") return reply(controller_.manual_sync());
    if (cmd_str == "reset") return reply(controller_.server_reset(cmd.value("reason", "operator reset")));
    if (cmd_str == "health") return handle_health(std::move(reply));
    if (cmd_str == "history") return reply(handle_history(cmd));
    reply({{"status", "error"}, {"message", "unknown command"}});
}

void DaemonCore::handle_start(const json& cmd, Reply reply) {
    auto parsed = SweepConfig::from_json(cmd, config_.device.default_span_mhz,
                                         config_.sweep.default_cycle_time_ms);
    if (!parsed) {
        reply({{"status", "rejected"}, {"reason", parsed.error()}});
        return;
    }
    controller_.start(std::move(*parsed), std::move(reply));
}

void DaemonCore::handle_health(Reply reply) {
    json resp = {
        {"status", "ok"},
        {"state", to_string(controller_.state().phase)},
        {"sse_client_count", hub_.subscriber_count()},
        {"uptime_ms", std::chrono::duration_cast<std::chrono::milliseconds>(
                          scheduler_.now() - started_at_).count()},
        {"history_enabled", history_.is_open()},
        {"state_validation", state_validation()},
    };

    auto handle = supervisor_.handle();
    resp["process_running"] = handle.has_value();
    resp["process_pid"] = handle ? json(handle->pid) : json(nullptr);

    // hackrf_info cannot open a device the sweep already holds
    if (handle) {
        resp["hardware_detected"] = true;
        resp["hardware_reason"] = "in_use";
        reply(std::move(resp));
        return;
    }

    auto probe = std::make_shared<ProbeResult>();
    scheduler_.offload(
        [this, probe] { *probe = supervisor_.probe_device(); },
        [probe, resp = std::move(resp), reply = std::move(reply)]() mutable {
            resp["hardware_detected"] = probe->available;
            resp["hardware_reason"] = probe->reason;
            if (probe->device_info) resp["device_info"] = *probe->device_info;
            reply(std::move(resp));
        });
}

json DaemonCore::state_validation() {
    auto obs = supervisor_.observe();
    auto phase = controller_.state().phase;
    bool active = phase == SweepPhase::Starting || phase == SweepPhase::Running;

    std::vector<std::string> issues;
    if (active && !obs.handle_alive && !controller_.in_transition()) {
        issues.push_back(std::format("state is {} but no sweep process is alive", to_string(phase)));
    }
    if (obs.handle_alive && !active && phase != SweepPhase::Stopping) {
        issues.push_back(std::format("sweep process {} alive while {}", *obs.pid, to_string(phase)));
    }
    if (!obs.orphan_pids.empty()) {
        issues.push_back(std::format("{} orphaned sweep process(es)", obs.orphan_pids.size()));
    }
    return {{"consistent", issues.empty()}, {"issues", issues}};
}

json DaemonCore::handle_history(const json& cmd) {
    int limit = cmd.value("limit", 10);
    auto runs = history_.recent(limit);

    json resp = {{"status", "ok"}, {"runs", json::array()}};
    for (auto& r : runs) {
        json freqs = json::parse(r.frequencies, nullptr, false);
        resp["runs"].push_back({
            {"id", r.id},
            {"started_at", r.started_at},
            {"stopped_at", r.stopped_at.empty() ? json(nullptr) : json(r.stopped_at)},
            {"frequencies", freqs.is_discarded() ? json(r.frequencies) : freqs},
            {"cycle_time_ms", r.cycle_time_ms},
            {"final_phase", r.final_phase},
            {"error_count", r.error_count},
            {"last_error", r.last_error.empty() ? json(nullptr) : json(r.last_error)},
        });
    }
    return resp;
}

std::string DaemonCore::subscribe(std::shared_ptr<StreamSink> sink, SubscriptionFilter filter) {
    auto id = hub_.subscribe(std::move(sink), std::move(filter));
    if (!hub_.find(id)) return id;

    hub_.send_to(id, controller_.status_snapshot("initial state"));
    auto phase = controller_.state().phase;
    if (controller_.config() && (phase == SweepPhase::Starting || phase == SweepPhase::Running)) {
        hub_.send_to(id, CycleConfigEvent{
            .config = *controller_.config(),
            .switching_delay_ms = static_cast<uint32_t>(controller_.switching_delay().count()),
        });
    }
    return id;
}

void DaemonCore::unsubscribe(const std::string& connection_id) {
    hub_.unsubscribe(connection_id);
}

void DaemonCore::shutdown() {
    log("Shutting down sweep supervisor");
    controller_.shutdown();
    hub_.close_all();
    history_.close();
}

void DaemonCore::on_run_started(const SweepConfig& config) {
    current_run_id_ = history_.begin_run(config.to_json()["frequencies"].dump(), config.cycle_time_ms);
}

void DaemonCore::on_run_finished(SweepPhase final_phase, uint32_t error_count,
                                 const std::string& last_error) {
    if (current_run_id_ == 0) return;
    history_.finish_run(current_run_id_, std::string(to_string(final_phase)), error_count, last_error);
    current_run_id_ = 0;
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[sweepwatch] {}", msg);
    }
}
