#pragma once

#include "event_source.hpp"
#include "platform/process_launcher.hpp"
#include "platform/scheduler.hpp"
#include "platform/stream_sink.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <deque>
#include <expected>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

// Virtual-time scheduler. offload() runs the work inline and queues `done`,
// so tests see the same ordering as the real loop.
class FakeScheduler : public Scheduler {
public:
    TimerId schedule(std::chrono::milliseconds delay, Task task) override {
        return add(delay, std::chrono::milliseconds(0), std::move(task));
    }

    TimerId schedule_every(std::chrono::milliseconds interval, Task task) override {
        return add(interval, interval, std::move(task));
    }

    void cancel(TimerId id) override { timers_.erase(id); }

    void post(Task task) override { posted_.push_back(std::move(task)); }

    void offload(Task work, Task done) override {
        work();
        post(std::move(done));
    }

    Clock::time_point now() const override { return now_; }

    void run_pending() {
        while (!posted_.empty()) {
            auto task = std::move(posted_.front());
            posted_.pop_front();
            task();
        }
    }

    // Fires due timers in deadline order, draining posted tasks between them.
    void advance(std::chrono::milliseconds d) {
        auto target = now_ + d;
        run_pending();
        for (;;) {
            auto next = timers_.end();
            for (auto it = timers_.begin(); it != timers_.end(); ++it) {
                if (it->second.deadline > target) continue;
                if (next == timers_.end() || it->second.deadline < next->second.deadline) next = it;
            }
            if (next == timers_.end()) break;

            now_ = next->second.deadline;
            Task task = next->second.task;
            if (next->second.interval.count() > 0) {
                next->second.deadline += next->second.interval;
            } else {
                timers_.erase(next);
            }
            task();
            run_pending();
        }
        now_ = target;
        run_pending();
    }

    size_t timer_count() const { return timers_.size(); }
    size_t posted_count() const { return posted_.size(); }

private:
    struct Timer {
        Clock::time_point deadline;
        std::chrono::milliseconds interval{0};
        Task task;
    };

    TimerId add(std::chrono::milliseconds delay, std::chrono::milliseconds interval, Task task) {
        TimerId id = ++next_id_;
        timers_.emplace(id, Timer{.deadline = now_ + delay, .interval = interval, .task = std::move(task)});
        return id;
    }

    Clock::time_point now_{std::chrono::hours(1)};
    TimerId next_id_ = 0;
    std::map<TimerId, Timer> timers_;
    std::deque<Task> posted_;
};

// In-memory process table. Launched processes are named after the
// basename of argv[0]; SIGTERM and SIGKILL kill unless told otherwise.
class FakeProcessLauncher : public ProcessLauncher {
public:
    struct Proc {
        std::string name;
        bool alive = true;
        LineCallback on_line;
    };

    CommandResult info_result{
        .exit_code = 0,
        .out = "hackrf_info version: 2024.02.1\n"
               "Found HackRF\n"
               "Index: 0\n"
               "Serial number: 0000000000000000457863dc2f3b4c4f\n",
    };
    std::optional<std::string> launch_error;

    std::vector<std::vector<std::string>> launches;
    std::vector<std::vector<std::string>> probes;
    std::vector<std::pair<pid_t, int>> signals;
    std::set<pid_t> ignore_term;
    std::set<pid_t> unkillable;
    std::map<pid_t, Proc> procs;
    pid_t next_pid = 1000;

    std::expected<LaunchedProcess, std::string>
    launch(const std::vector<std::string>& argv, LineCallback on_line) override {
        if (launch_error) return std::unexpected(*launch_error);
        pid_t pid = next_pid++;
        launches.push_back(argv);
        procs[pid] = Proc{
            .name = std::filesystem::path(argv.at(0)).filename().string(),
            .alive = true,
            .on_line = std::move(on_line),
        };
        return LaunchedProcess{.pid = pid, .pgid = pid};
    }

    bool is_alive(pid_t pid) override {
        auto it = procs.find(pid);
        return it != procs.end() && it->second.alive;
    }

    bool send_signal(pid_t pid, int sig) override {
        signals.emplace_back(pid, sig);
        if (!is_alive(pid)) return false;
        deliver(pid, sig);
        return true;
    }

    bool signal_group(pid_t pgid, int sig) override {
        if (!is_alive(pgid)) return false;
        deliver(pgid, sig);
        return true;
    }

    std::vector<pid_t> find_by_name(const std::string& name) override {
        std::vector<pid_t> out;
        for (const auto& [pid, p] : procs) {
            if (p.alive && p.name == name) out.push_back(pid);
        }
        return out;
    }

    CommandResult run_with_timeout(const std::vector<std::string>& argv,
                                   std::chrono::milliseconds) override {
        probes.push_back(argv);
        return info_result;
    }

    // Test controls

    void emit(pid_t pid, OutputStream stream, const std::string& line) {
        auto it = procs.find(pid);
        if (it != procs.end() && it->second.on_line) it->second.on_line(stream, line);
    }

    void die(pid_t pid) {
        if (auto it = procs.find(pid); it != procs.end()) it->second.alive = false;
    }

    pid_t add_foreign(const std::string& name) {
        pid_t pid = next_pid++;
        procs[pid] = Proc{.name = name, .alive = true, .on_line = {}};
        return pid;
    }

    bool got_signal(pid_t pid, int sig) const {
        return std::ranges::find(signals, std::pair<pid_t, int>{pid, sig}) != signals.end();
    }

    pid_t last_pid() const { return next_pid - 1; }

    size_t alive_count() const {
        return static_cast<size_t>(std::ranges::count_if(procs, [](const auto& kv) {
            return kv.second.alive;
        }));
    }

private:
    void deliver(pid_t pid, int sig) {
        if (sig == 0) return;
        if (sig == SIGTERM && ignore_term.contains(pid)) return;
        if (unkillable.contains(pid)) return;
        procs[pid].alive = false;
    }
};

// Records every event; delivery and closing are controlled by the test.
class FakeSink : public StreamSink {
public:
    struct Sent {
        std::string event;
        nlohmann::json data;
    };

    std::vector<Sent> sent;
    bool full = false;
    bool auto_deliver = true;
    bool is_closed = false;
    int close_calls = 0;
    uint64_t delivered_count = 0;

    SinkResult send(const std::string& event_name, const std::string& payload) override {
        if (is_closed) return SinkResult::Closed;
        if (full) return SinkResult::Dropped;
        sent.push_back({event_name, nlohmann::json::parse(payload)});
        if (auto_deliver) ++delivered_count;
        return SinkResult::Queued;
    }

    uint64_t delivered() const override { return delivered_count; }
    bool closed() const override { return is_closed; }
    void close() override {
        is_closed = true;
        ++close_calls;
    }

    size_t count(const std::string& event_name) const {
        return static_cast<size_t>(std::ranges::count_if(sent, [&](const Sent& s) {
            return s.event == event_name;
        }));
    }

    const Sent* last(const std::string& event_name) const {
        for (auto it = sent.rbegin(); it != sent.rend(); ++it) {
            if (it->event == event_name) return &*it;
        }
        return nullptr;
    }
};

// Connection attempts are recorded; the test fires the handlers.
class FakeEventSource : public EventSource {
public:
    int open_calls = 0;
    int close_calls = 0;
    bool is_open = false;
    std::string url;
    Handlers handlers;

    void open(const std::string& u, Handlers h) override {
        ++open_calls;
        is_open = true;
        url = u;
        handlers = std::move(h);
    }

    void close() override {
        ++close_calls;
        is_open = false;
    }

    void fire_open() { if (handlers.on_open) handlers.on_open(); }

    void fire_message(const std::string& event, const std::string& data) {
        if (handlers.on_message) handlers.on_message(SseMessage{.event = event, .data = data, .id = {}});
    }

    // Copy first: the error handler reopens and replaces the handlers
    void fire_error(const std::string& reason) {
        auto h = handlers;
        if (h.on_error) h.on_error(reason);
    }
};
