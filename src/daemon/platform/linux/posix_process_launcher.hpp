#pragma once

#include "platform/process_launcher.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

// Splits one output stream into lines. A line longer than the limit is
// cut at the limit and the rest of it, up to the next newline, is dropped.
class OutputLineSplitter {
public:
    static constexpr size_t kMaxLineBytes = 10000;

    using Emit = std::function<void(std::string)>;

    explicit OutputLineSplitter(size_t max_line = kMaxLineBytes) : max_line_(max_line) {}

    void feed(std::string_view data, const Emit& emit);
    // Emits a trailing unterminated line.
    void finish(const Emit& emit);

    size_t truncated_lines() const { return truncated_; }

private:
    void emit_line(const Emit& emit);

    std::string partial_;
    size_t max_line_;
    bool discarding_ = false;
    size_t truncated_ = 0;
};

// fork/exec launcher. Each launched child gets one reader thread that
// splits its stdout and stderr into lines.
class PosixProcessLauncher : public ProcessLauncher {
public:
    // Per stream, for run_with_timeout.
    static constexpr size_t kMaxCapturedBytes = 1024 * 1024;

    PosixProcessLauncher() = default;
    ~PosixProcessLauncher() override;

    PosixProcessLauncher(const PosixProcessLauncher&) = delete;
    PosixProcessLauncher& operator=(const PosixProcessLauncher&) = delete;

    std::expected<LaunchedProcess, std::string>
    launch(const std::vector<std::string>& argv, LineCallback on_line) override;

    bool is_alive(pid_t pid) override;
    bool send_signal(pid_t pid, int sig) override;
    bool signal_group(pid_t pgid, int sig) override;
    std::vector<pid_t> find_by_name(const std::string& name) override;

    CommandResult run_with_timeout(const std::vector<std::string>& argv,
                                   std::chrono::milliseconds timeout) override;

private:
    // Launch may be called from worker threads.
    struct Reader {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    std::mutex readers_mutex_;
    std::vector<Reader> readers_;
};
