#pragma once

#include "config.hpp"
#include "platform/process_launcher.hpp"
#include "platform/scheduler.hpp"
#include "platform/stream_sink.hpp"
#include "process_supervisor.hpp"
#include "recovery_engine.hpp"
#include "storage/run_history.hpp"
#include "stream_hub.hpp"
#include "sweep_controller.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

// Portable command surface. Every method runs on the scheduler thread.
class DaemonCore {
public:
    using Reply = std::function<void(nlohmann::json)>;

    DaemonCore(Config config, bool verbose, Scheduler& scheduler, ProcessLauncher& launcher);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Opens the run journal (empty path: the default data dir) and arms the
    // periodic self-check. A journal that fails to open only disables history.
    bool init(const std::string& history_path = {});

    // The reply may run before this returns or later, once the command's
    // asynchronous work has completed.
    void handle_command(const std::string& cmd_str, const nlohmann::json& cmd, Reply reply);

    // Registers a stream subscriber and sends it the current state.
    std::string subscribe(std::shared_ptr<StreamSink> sink, SubscriptionFilter filter = {});
    void unsubscribe(const std::string& connection_id);

    void shutdown();

    SweepController& controller() { return controller_; }
    StreamHub& hub() { return hub_; }
    RunHistory& history() { return history_; }

private:
    void handle_start(const nlohmann::json& cmd, Reply reply);
    void handle_health(Reply reply);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json state_validation();

    void on_run_started(const SweepConfig& config);
    void on_run_finished(SweepPhase final_phase, uint32_t error_count, const std::string& last_error);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    Scheduler& scheduler_;

    ProcessSupervisor supervisor_;
    RecoveryEngine engine_;
    StreamHub hub_;
    SweepController controller_;
    RunHistory history_;

    int64_t current_run_id_ = 0;
    Scheduler::Clock::time_point started_at_;
};
