#include "platform/linux/posix_process_launcher.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <poll.h>
#include <print>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

struct Pipe {
    int read = -1;
    int write = -1;

    bool open() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) < 0) return false;
        read = fds[0];
        write = fds[1];
        return true;
    }
    void close_read() { if (read >= 0) { ::close(read); read = -1; } }
    void close_write() { if (write >= 0) { ::close(write); write = -1; } }
    void close_both() { close_read(); close_write(); }
};

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(const std::vector<std::string>& argv, Pipe& out, Pipe& err,
                             Pipe& exec_err) {
    setpgid(0, 0);

    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        ::close(devnull);
    }
    dup2(out.write, STDOUT_FILENO);
    dup2(err.write, STDERR_FILENO);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    execvp(args[0], args.data());

    int e = errno;
    ssize_t ignored = ::write(exec_err.write, &e, sizeof(e));
    (void)ignored;
    _exit(127);
}

// Drains the child's pipes until both reach EOF or stop is requested.
void read_lines(std::stop_token stop, int out_fd, int err_fd, ProcessLauncher::LineCallback on_line) {
    std::array<OutputLineSplitter, 2> splitters;
    std::array<pollfd, 2> fds{{{.fd = out_fd, .events = POLLIN, .revents = 0},
                               {.fd = err_fd, .events = POLLIN, .revents = 0}}};
    int open_count = 2;

    auto emitter = [&](size_t idx) {
        auto stream = idx == 0 ? OutputStream::Stdout : OutputStream::Stderr;
        return [&on_line, stream](std::string line) {
            if (on_line) on_line(stream, std::move(line));
        };
    };

    while (open_count > 0 && !stop.stop_requested()) {
        int n = ::poll(fds.data(), fds.size(), 200);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) continue;

        for (size_t i = 0; i < fds.size(); i++) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;

            char buf[4096];
            ssize_t r = ::read(fds[i].fd, buf, sizeof(buf));
            if (r > 0) {
                splitters[i].feed(std::string_view(buf, static_cast<size_t>(r)), emitter(i));
            } else if (r == 0 || (errno != EINTR && errno != EAGAIN)) {
                splitters[i].finish(emitter(i));
                ::close(fds[i].fd);
                fds[i].fd = -1;
                open_count--;
            }
        }
    }

    for (auto& p : fds) {
        if (p.fd >= 0) ::close(p.fd);
    }
}

bool is_zombie(pid_t pid) {
    std::ifstream stat(std::format("/proc/{}/stat", pid));
    if (!stat) return false;
    std::string line;
    std::getline(stat, line);
    // State follows the parenthesised comm, which may itself contain ')'
    auto pos = line.rfind(')');
    return pos != std::string::npos && pos + 2 < line.size() && line[pos + 2] == 'Z';
}

} // namespace

void OutputLineSplitter::feed(std::string_view data, const Emit& emit) {
    while (!data.empty()) {
        auto nl = data.find('\n');
        auto chunk = data.substr(0, nl);
        if (discarding_) {
            if (nl == std::string_view::npos) return;
            discarding_ = false;
        } else {
            size_t room = max_line_ - partial_.size();
            partial_.append(chunk.substr(0, room));
            if (chunk.size() > room) {
                ++truncated_;
                std::println(stderr, "launcher: output line longer than {} bytes, truncated", max_line_);
                emit_line(emit);
                discarding_ = nl == std::string_view::npos;
            } else if (nl != std::string_view::npos) {
                emit_line(emit);
            }
        }
        if (nl == std::string_view::npos) return;
        data.remove_prefix(nl + 1);
    }
}

void OutputLineSplitter::finish(const Emit& emit) {
    if (!partial_.empty()) emit_line(emit);
    discarding_ = false;
}

void OutputLineSplitter::emit_line(const Emit& emit) {
    std::string line = std::move(partial_);
    partial_.clear();
    if (!line.empty() && line.back() == '\r') line.pop_back();
    emit(std::move(line));
}

PosixProcessLauncher::~PosixProcessLauncher() {
    std::lock_guard lock(readers_mutex_);
    for (auto& r : readers_) r.thread.request_stop();
    readers_.clear();
}

std::expected<LaunchedProcess, std::string>
PosixProcessLauncher::launch(const std::vector<std::string>& argv, LineCallback on_line) {
    if (argv.empty()) return std::unexpected("empty command line");

    Pipe out, err, exec_err;
    if (!out.open() || !err.open() || !exec_err.open()) {
        int e = errno;
        out.close_both();
        err.close_both();
        exec_err.close_both();
        return std::unexpected(std::format("pipe2 failed: {}", std::strerror(e)));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int e = errno;
        out.close_both();
        err.close_both();
        exec_err.close_both();
        return std::unexpected(std::format("fork failed: {}", std::strerror(e)));
    }
    if (pid == 0) exec_child(argv, out, err, exec_err);

    // Both sides call setpgid so the group exists before either proceeds
    setpgid(pid, pid);
    out.close_write();
    err.close_write();
    exec_err.close_write();

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_err.read, &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    exec_err.close_read();

    if (n == sizeof(child_errno)) {
        waitpid(pid, nullptr, 0);
        out.close_read();
        err.close_read();
        return std::unexpected(std::format("{}: {}", argv[0], std::strerror(child_errno)));
    }

    {
        std::lock_guard lock(readers_mutex_);
        std::erase_if(readers_, [](Reader& r) { return r.finished->load(std::memory_order_acquire); });
        auto finished = std::make_shared<std::atomic<bool>>(false);
        readers_.push_back(Reader{
            .thread = std::jthread([finished, out_fd = out.read, err_fd = err.read,
                                    on_line = std::move(on_line)](std::stop_token stop) {
                read_lines(stop, out_fd, err_fd, on_line);
                finished->store(true, std::memory_order_release);
            }),
            .finished = finished,
        });
    }

    return LaunchedProcess{.pid = pid, .pgid = pid};
}

bool PosixProcessLauncher::is_alive(pid_t pid) {
    if (pid <= 0) return false;

    int status = 0;
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid) return false;
    if (r == 0) return true;

    // Not our child: probe it
    if (::kill(pid, 0) < 0) return errno == EPERM;
    return !is_zombie(pid);
}

bool PosixProcessLauncher::send_signal(pid_t pid, int sig) {
    if (pid <= 0) return false;
    return ::kill(pid, sig) == 0;
}

bool PosixProcessLauncher::signal_group(pid_t pgid, int sig) {
    if (pgid <= 0) return false;
    return ::killpg(pgid, sig) == 0;
}

std::vector<pid_t> PosixProcessLauncher::find_by_name(const std::string& name) {
    std::vector<pid_t> pids;
    std::error_code ec;
    for (auto& entry : fs::directory_iterator("/proc", ec)) {
        auto fname = entry.path().filename().string();
        if (fname.empty() || !std::isdigit(static_cast<unsigned char>(fname[0]))) continue;

        std::ifstream comm(entry.path() / "comm");
        std::string value;
        if (!comm || !std::getline(comm, value)) continue;
        if (value != name) continue;

        pid_t pid = 0;
        auto [end, ec2] = std::from_chars(fname.data(), fname.data() + fname.size(), pid);
        if (ec2 != std::errc{} || end != fname.data() + fname.size()) continue;
        if (is_zombie(pid)) continue;
        pids.push_back(pid);
    }
    return pids;
}

CommandResult PosixProcessLauncher::run_with_timeout(const std::vector<std::string>& argv,
                                                     std::chrono::milliseconds timeout) {
    CommandResult result;
    if (argv.empty()) return result;

    Pipe out, err, exec_err;
    if (!out.open() || !err.open() || !exec_err.open()) {
        out.close_both();
        err.close_both();
        exec_err.close_both();
        result.err = std::format("pipe2 failed: {}", std::strerror(errno));
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        out.close_both();
        err.close_both();
        exec_err.close_both();
        result.err = std::format("fork failed: {}", std::strerror(errno));
        return result;
    }
    if (pid == 0) exec_child(argv, out, err, exec_err);

    setpgid(pid, pid);
    out.close_write();
    err.close_write();
    exec_err.close_write();

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_err.read, &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    exec_err.close_read();

    if (n == sizeof(child_errno)) {
        waitpid(pid, nullptr, 0);
        out.close_read();
        err.close_read();
        result.exit_code = 127;
        result.err = std::format("{}: {}", argv[0], std::strerror(child_errno));
        return result;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<pollfd, 2> fds{{{.fd = out.read, .events = POLLIN, .revents = 0},
                               {.fd = err.read, .events = POLLIN, .revents = 0}}};
    std::array<std::string*, 2> sinks{&result.out, &result.err};
    int open_count = 2;

    while (open_count > 0) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            result.timed_out = true;
            break;
        }
        int r = ::poll(fds.data(), fds.size(), static_cast<int>(left.count()));
        if (r < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (size_t i = 0; i < fds.size(); i++) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            char buf[4096];
            ssize_t got = ::read(fds[i].fd, buf, sizeof(buf));
            if (got > 0) {
                // Keep draining past the cap so the child never blocks on a full pipe
                auto& sink = *sinks[i];
                size_t room = kMaxCapturedBytes - std::min(sink.size(), kMaxCapturedBytes);
                size_t take = std::min(room, static_cast<size_t>(got));
                sink.append(buf, take);
                if (take < static_cast<size_t>(got) && !result.truncated) {
                    result.truncated = true;
                    std::println(stderr, "launcher: {} output exceeds {} bytes, discarding the rest",
                                 argv[0], kMaxCapturedBytes);
                }
            } else {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                open_count--;
            }
        }
    }
    for (auto& p : fds) {
        if (p.fd >= 0) ::close(p.fd);
    }

    if (result.timed_out) {
        ::killpg(pid, SIGKILL);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    if (!result.timed_out) {
        if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
        else if (WIFSIGNALED(status)) result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}
