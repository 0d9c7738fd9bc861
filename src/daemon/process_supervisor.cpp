#include "process_supervisor.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <csignal>
#include <filesystem>
#include <format>
#include <print>
#include <sstream>

using namespace std::chrono_literals;

namespace {

constexpr auto kVerifyPoll = 50ms;
constexpr auto kStopVerifyTimeout = 1000ms;

constexpr std::array<std::string_view, 8> kFatalStartupErrors = {
    "No HackRF boards found",
    "hackrf_open() failed",
    "Resource busy",
    "Permission denied",
    "libusb_open() failed",
    "USB error",
    "hackrf_is_streaming() failed",
    "hackrf_start_rx() failed",
};

constexpr std::array<std::string_view, 2> kFutileErrors = {
    "Permission denied",
    "access denied",
};

bool contains_ci(std::string_view haystack, std::string_view needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

// /proc/<pid>/comm holds at most 15 characters of the executable name.
std::string comm_name(const std::string& binary) {
    auto name = std::filesystem::path(binary).filename().string();
    return name.substr(0, 15);
}

std::string join_non_empty_lines(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    std::string joined;
    while (std::getline(in, line)) {
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) continue;
        auto last = line.find_last_not_of(" \t\r");
        if (!joined.empty()) joined += "; ";
        joined += line.substr(first, last - first + 1);
    }
    return joined;
}

} // namespace

std::string_view to_string(SpawnErrorKind kind) {
    switch (kind) {
        case SpawnErrorKind::DeviceUnavailable: return "DeviceUnavailable";
        case SpawnErrorKind::SpawnFailed: return "SpawnFailed";
    }
    return "Unknown";
}

ProcessSupervisor::ProcessSupervisor(ProcessLauncher& launcher, Scheduler& scheduler,
                                     Config::Device device, Config::Sweep sweep, bool verbose)
    : launcher_(launcher), scheduler_(scheduler),
      device_(std::move(device)), sweep_(std::move(sweep)), verbose_(verbose),
      sweep_name_(comm_name(device_.sweep_binary)),
      info_name_(comm_name(device_.info_binary)),
      output_epoch_(std::make_shared<std::atomic<uint64_t>>(0)) {}

ProcessSupervisor::~ProcessSupervisor() {
    scheduler_.cancel(grace_timer_);
    scheduler_.cancel(stop_verify_timer_);
    scheduler_.cancel(kill_verify_timer_);
    scheduler_.cancel(monitor_timer_);
    output_epoch_->fetch_add(1);
}

ProbeResult ProcessSupervisor::probe_device() {
    auto r = launcher_.run_with_timeout({device_.info_binary},
                                        std::chrono::milliseconds(device_.probe_timeout_ms));
    if (r.timed_out) return {.available = false, .reason = "timeout"};

    auto combined = r.out + r.err;
    if (contains_ci(combined, "Resource busy")) return {.available = false, .reason = "busy"};
    if (contains_ci(combined, "No HackRF boards found")) return {.available = false, .reason = "not_found"};
    if (r.exit_code != 0) return {.available = false, .reason = "failed"};
    if (r.out.find("Serial number") == std::string::npos) {
        return {.available = false, .reason = "unknown"};
    }
    return {.available = true, .reason = "available", .device_info = join_non_empty_lines(r.out)};
}

std::expected<ProcessHandle, SpawnError>
ProcessSupervisor::spawn(const std::vector<std::string>& argv, OutputCallback on_output) {
    auto probe = probe_device();
    if (!probe.available) {
        return std::unexpected(SpawnError{SpawnErrorKind::DeviceUnavailable, probe.reason});
    }

    std::lock_guard lock(mutex_);
    if (handle_ && launcher_.is_alive(handle_->pid)) {
        return std::unexpected(SpawnError{SpawnErrorKind::SpawnFailed,
                                          "a sweep process is already running"});
    }

    uint64_t epoch = output_epoch_->fetch_add(1) + 1;
    auto on_line = [sched = &scheduler_, epoch_ptr = output_epoch_, epoch,
                    cb = std::move(on_output)](OutputStream stream, std::string line) {
        sched->post([epoch_ptr, epoch, cb, stream, line = std::move(line)] {
            if (epoch_ptr->load() == epoch) cb(stream, line);
        });
    };

    auto launched = launcher_.launch(argv, std::move(on_line));
    if (!launched) {
        return std::unexpected(SpawnError{SpawnErrorKind::SpawnFailed, launched.error()});
    }

    handle_ = ProcessHandle{
        .pid = launched->pid,
        .pgid = launched->pgid,
        .start_time = std::chrono::steady_clock::now(),
    };
    log(std::format("Spawned {} (pid {})", argv.empty() ? "" : argv[0], launched->pid));
    return *handle_;
}

void ProcessSupervisor::stop(bool graceful, DoneCallback done) {
    auto h = handle();
    if (!h) {
        scheduler_.post([done = std::move(done)] { done(true); });
        return;
    }

    pending_stops_.push_back(std::move(done));
    // Already stopping or killing: the running sequence answers this caller too
    if (stopping()) return;

    stop_monitoring();
    output_epoch_->fetch_add(1);

    if (graceful) {
        launcher_.send_signal(h->pid, SIGTERM);
        grace_timer_ = scheduler_.schedule(std::chrono::milliseconds(sweep_.stop_grace_ms), [this, target = *h] {
            grace_timer_ = Scheduler::kInvalidTimer;
            escalate_kill(target);
        });
    } else {
        escalate_kill(*h);
    }
}

void ProcessSupervisor::escalate_kill(ProcessHandle h) {
    {
        std::lock_guard lock(mutex_);
        if (launcher_.is_alive(h.pid)) {
            launcher_.send_signal(h.pid, SIGKILL);
        }
        if (h.pgid > 0 && h.pgid != h.pid) {
            launcher_.signal_group(h.pgid, SIGKILL);
        }
        for (pid_t pid : launcher_.find_by_name(sweep_name_)) {
            launcher_.send_signal(pid, SIGKILL);
        }
    }
    auto deadline = scheduler_.now() + kStopVerifyTimeout;
    stop_verify_timer_ = scheduler_.schedule(kVerifyPoll, [this, h, deadline] {
        stop_verify_timer_ = Scheduler::kInvalidTimer;
        verify_stopped(h, deadline);
    });
}

void ProcessSupervisor::verify_stopped(ProcessHandle h, Scheduler::Clock::time_point deadline) {
    bool alive = launcher_.is_alive(h.pid) || !launcher_.find_by_name(sweep_name_).empty();
    if (!alive) {
        finish_stop(true);
        return;
    }
    if (scheduler_.now() >= deadline) {
        std::println(stderr, "supervisor: pid {} still alive after stop", h.pid);
        finish_stop(false);
        return;
    }
    stop_verify_timer_ = scheduler_.schedule(kVerifyPoll, [this, h, deadline] {
        stop_verify_timer_ = Scheduler::kInvalidTimer;
        verify_stopped(h, deadline);
    });
}

void ProcessSupervisor::finish_stop(bool verified) {
    release_handle();
    auto callbacks = std::move(pending_stops_);
    pending_stops_.clear();
    for (auto& cb : callbacks) cb(verified);
}

void ProcessSupervisor::force_cleanup_all(DoneCallback done) {
    kill_all("force cleanup", std::move(done));
}

void ProcessSupervisor::emergency_kill_all(DoneCallback done) {
    kill_all("emergency kill", std::move(done));
}

void ProcessSupervisor::kill_all(const char* label, DoneCallback done) {
    scheduler_.cancel(grace_timer_);
    scheduler_.cancel(stop_verify_timer_);
    grace_timer_ = Scheduler::kInvalidTimer;
    stop_verify_timer_ = Scheduler::kInvalidTimer;
    stop_monitoring();
    output_epoch_->fetch_add(1);

    auto killed = kill_matching();
    log(std::format("{}: signalled {} process(es)", label, killed.size()));

    pending_kill_all_.push_back(std::move(done));
    if (kill_verify_timer_ != Scheduler::kInvalidTimer) return;

    auto deadline = scheduler_.now() + std::chrono::milliseconds(sweep_.kill_verify_timeout_ms);
    kill_verify_timer_ = scheduler_.schedule(kVerifyPoll, [this, deadline] {
        kill_verify_timer_ = Scheduler::kInvalidTimer;
        verify_kill_all(deadline);
    });
}

void ProcessSupervisor::verify_kill_all(Scheduler::Clock::time_point deadline) {
    auto remaining = remaining_processes();
    bool timed_out = scheduler_.now() >= deadline;

    if (remaining.empty() || timed_out) {
        bool verified = remaining.empty();
        if (!verified) {
            std::println(stderr, "supervisor: {} process(es) survived SIGKILL", remaining.size());
        }
        release_handle();
        auto callbacks = std::move(pending_kill_all_);
        pending_kill_all_.clear();
        auto stops = std::move(pending_stops_);
        pending_stops_.clear();
        for (auto& cb : callbacks) cb(verified);
        for (auto& cb : stops) cb(verified);
        return;
    }

    kill_matching();
    kill_verify_timer_ = scheduler_.schedule(kVerifyPoll, [this, deadline] {
        kill_verify_timer_ = Scheduler::kInvalidTimer;
        verify_kill_all(deadline);
    });
}

std::vector<pid_t> ProcessSupervisor::remaining_processes() {
    std::vector<pid_t> pids;
    {
        std::lock_guard lock(mutex_);
        if (handle_ && launcher_.is_alive(handle_->pid)) pids.push_back(handle_->pid);
    }
    for (pid_t pid : launcher_.find_by_name(sweep_name_)) {
        if (std::ranges::find(pids, pid) == pids.end()) pids.push_back(pid);
    }
    for (pid_t pid : launcher_.find_by_name(info_name_)) {
        if (std::ranges::find(pids, pid) == pids.end()) pids.push_back(pid);
    }
    return pids;
}

std::vector<pid_t> ProcessSupervisor::kill_matching() {
    std::lock_guard lock(mutex_);
    std::vector<pid_t> killed;

    if (handle_) {
        if (launcher_.send_signal(handle_->pid, SIGKILL)) killed.push_back(handle_->pid);
        if (handle_->pgid > 0 && handle_->pgid != handle_->pid) {
            launcher_.signal_group(handle_->pgid, SIGKILL);
        }
    }
    for (const auto& name : {sweep_name_, info_name_}) {
        for (pid_t pid : launcher_.find_by_name(name)) {
            if (std::ranges::find(killed, pid) != killed.end()) continue;
            if (launcher_.send_signal(pid, SIGKILL)) killed.push_back(pid);
        }
    }
    return killed;
}

std::vector<pid_t> ProcessSupervisor::kill_orphans() {
    std::lock_guard lock(mutex_);
    std::vector<pid_t> killed;
    for (pid_t pid : launcher_.find_by_name(sweep_name_)) {
        if (handle_ && handle_->pid == pid) continue;
        if (launcher_.send_signal(pid, SIGKILL)) killed.push_back(pid);
    }
    return killed;
}

void ProcessSupervisor::start_monitoring(DeathCallback on_death) {
    stop_monitoring();
    on_death_ = std::move(on_death);
    monitor_timer_ = scheduler_.schedule_every(std::chrono::milliseconds(sweep_.monitor_interval_ms), [this] {
        auto h = handle();
        if (!h) {
            stop_monitoring();
            return;
        }
        if (launcher_.is_alive(h->pid)) return;

        log(std::format("Sweep process {} died", h->pid));
        auto cb = std::move(on_death_);
        stop_monitoring();
        output_epoch_->fetch_add(1);
        release_handle();
        if (cb) cb();
    });
}

void ProcessSupervisor::stop_monitoring() {
    scheduler_.cancel(monitor_timer_);
    monitor_timer_ = Scheduler::kInvalidTimer;
    on_death_ = nullptr;
}

ProcessObservation ProcessSupervisor::observe() {
    ProcessObservation obs;
    {
        std::lock_guard lock(mutex_);
        if (handle_) {
            obs.pid = handle_->pid;
            obs.handle_alive = launcher_.is_alive(handle_->pid);
        }
    }
    for (pid_t pid : launcher_.find_by_name(sweep_name_)) {
        if (obs.pid && *obs.pid == pid) continue;
        obs.orphan_pids.push_back(pid);
    }
    return obs;
}

std::optional<ProcessHandle> ProcessSupervisor::handle() const {
    std::lock_guard lock(mutex_);
    return handle_;
}

void ProcessSupervisor::release_handle() {
    std::lock_guard lock(mutex_);
    handle_.reset();
}

bool ProcessSupervisor::classify_startup_error(std::string_view message) {
    return std::ranges::any_of(kFatalStartupErrors,
                               [message](std::string_view p) { return contains_ci(message, p); });
}

bool ProcessSupervisor::is_futile_error(std::string_view message) {
    return std::ranges::any_of(kFutileErrors,
                               [message](std::string_view p) { return contains_ci(message, p); });
}

void ProcessSupervisor::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[sweepwatch] {}", msg);
    }
}
