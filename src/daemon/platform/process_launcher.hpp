#pragma once

#include <chrono>
#include <expected>
#include <functional>
#include <string>
#include <sys/types.h>
#include <vector>

enum class OutputStream { Stdout, Stderr };

struct LaunchedProcess {
    pid_t pid = -1;
    pid_t pgid = -1;
};

struct CommandResult {
    int exit_code = -1;
    bool timed_out = false;
    // Output beyond the capture limit was discarded.
    bool truncated = false;
    std::string out;
    std::string err;
};

// All OS process access. Line callbacks arrive on reader threads.
class ProcessLauncher {
public:
    using LineCallback = std::function<void(OutputStream, std::string)>;

    virtual ~ProcessLauncher() = default;

    // Starts argv[0] in its own process group with stdin from /dev/null.
    virtual std::expected<LaunchedProcess, std::string>
    launch(const std::vector<std::string>& argv, LineCallback on_line) = 0;

    // Reaps the child if it exited; falls back to kill(pid, 0).
    virtual bool is_alive(pid_t pid) = 0;

    virtual bool send_signal(pid_t pid, int sig) = 0;
    virtual bool signal_group(pid_t pgid, int sig) = 0;

    // Live (non-zombie) processes whose comm equals name.
    virtual std::vector<pid_t> find_by_name(const std::string& name) = 0;

    // Blocking; kills the child when the timeout elapses.
    virtual CommandResult run_with_timeout(const std::vector<std::string>& argv,
                                           std::chrono::milliseconds timeout) = 0;
};
