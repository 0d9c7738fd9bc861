#pragma once

#include "config.hpp"
#include "platform/process_launcher.hpp"
#include "platform/scheduler.hpp"

#include <atomic>
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct ProcessHandle {
    pid_t pid = -1;
    pid_t pgid = -1;
    std::chrono::steady_clock::time_point start_time;
};

struct ProbeResult {
    bool available = false;
    std::string reason;
    std::optional<std::string> device_info;
};

enum class SpawnErrorKind { DeviceUnavailable, SpawnFailed };

struct SpawnError {
    SpawnErrorKind kind = SpawnErrorKind::SpawnFailed;
    std::string reason;
};

std::string_view to_string(SpawnErrorKind kind);

struct ProcessObservation {
    bool handle_alive = false;
    std::optional<pid_t> pid;
    std::vector<pid_t> orphan_pids;
};

// Owns the external sweep process. spawn() and probe_device() block and are
// meant for worker threads; everything else runs on the scheduler thread.
class ProcessSupervisor {
public:
    using OutputCallback = std::function<void(OutputStream, const std::string&)>;
    using DoneCallback = std::function<void(bool verified)>;
    using DeathCallback = std::function<void()>;

    ProcessSupervisor(ProcessLauncher& launcher, Scheduler& scheduler,
                      Config::Device device, Config::Sweep sweep, bool verbose = false);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    ProbeResult probe_device();

    // on_output is invoked on the scheduler thread, and only until the
    // handle is stopped or released.
    std::expected<ProcessHandle, SpawnError> spawn(const std::vector<std::string>& argv,
                                                   OutputCallback on_output);

    void stop(bool graceful, DoneCallback done);
    void force_cleanup_all(DoneCallback done);
    void emergency_kill_all(DoneCallback done);

    // Immediate SIGKILL of our process and every process named like the
    // sweep or info binary. Returns the pids signalled.
    std::vector<pid_t> kill_matching();

    // SIGKILL processes named like the sweep binary that we do not own.
    std::vector<pid_t> kill_orphans();

    void start_monitoring(DeathCallback on_death);
    void stop_monitoring();
    bool monitoring() const { return monitor_timer_ != Scheduler::kInvalidTimer; }
    // A stop or kill sequence is still waiting for the process to die.
    bool stopping() const {
        return grace_timer_ != Scheduler::kInvalidTimer || stop_verify_timer_ != Scheduler::kInvalidTimer ||
               kill_verify_timer_ != Scheduler::kInvalidTimer;
    }

    ProcessObservation observe();
    std::optional<ProcessHandle> handle() const;

    static bool classify_startup_error(std::string_view message);
    static bool is_futile_error(std::string_view message);

private:
    void escalate_kill(ProcessHandle h);
    void verify_stopped(ProcessHandle h, Scheduler::Clock::time_point deadline);
    void finish_stop(bool verified);

    void kill_all(const char* label, DoneCallback done);
    void verify_kill_all(Scheduler::Clock::time_point deadline);
    std::vector<pid_t> remaining_processes();

    void release_handle();
    void log(const std::string& msg);

    ProcessLauncher& launcher_;
    Scheduler& scheduler_;
    Config::Device device_;
    Config::Sweep sweep_;
    bool verbose_;
    std::string sweep_name_;
    std::string info_name_;

    // Guards handle_ and serializes launches against kills.
    mutable std::mutex mutex_;
    std::optional<ProcessHandle> handle_;

    // Output lines from an older epoch are dropped.
    std::shared_ptr<std::atomic<uint64_t>> output_epoch_;

    Scheduler::TimerId grace_timer_ = Scheduler::kInvalidTimer;
    Scheduler::TimerId stop_verify_timer_ = Scheduler::kInvalidTimer;
    Scheduler::TimerId kill_verify_timer_ = Scheduler::kInvalidTimer;
    Scheduler::TimerId monitor_timer_ = Scheduler::kInvalidTimer;

    std::vector<DoneCallback> pending_stops_;
    std::vector<DoneCallback> pending_kill_all_;
    DeathCallback on_death_;
};
