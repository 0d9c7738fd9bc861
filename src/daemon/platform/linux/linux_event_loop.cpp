#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>
#include <vector>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose, bool http_enabled)
    : config_(std::move(config)), verbose_(verbose), http_enabled_(http_enabled && config_.http.enabled),
      scheduler_(verbose_), ipc_server_(verbose_),
      core_(config_, verbose_, scheduler_, launcher_) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (http_) http_->stop();
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

bool LinuxEventLoop::init() {
    if (!scheduler_.init()) return false;

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }
    if (!scheduler_.watch_fd(signal_fd_, EPOLLIN, [this](uint32_t) { on_signal(); })) return false;

    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    if (!scheduler_.watch_fd(ipc_server_.server_fd(), EPOLLIN, [this](uint32_t) { on_accept(); })) {
        return false;
    }
    log("IPC listening on " + ipc_path);

    // Core init (run history, self-check)
    if (!core_.init()) return false;

    if (http_enabled_) {
        http_ = std::make_unique<HttpServer>(config_, scheduler_, core_, verbose_);
        if (!http_->start()) return false;
    } else {
        log("HTTP surface disabled");
    }

    return true;
}

void LinuxEventLoop::run() {
    scheduler_.run();

    // Clean shutdown: stream clients are closed before the HTTP thread stops
    core_.shutdown();
    if (http_) http_->stop();
    scheduler_.discard_pending();
    ipc_server_.stop();
}

void LinuxEventLoop::request_stop() {
    scheduler_.request_stop();
}

void LinuxEventLoop::on_signal() {
    signalfd_siginfo info;
    if (::read(signal_fd_, &info, sizeof(info)) != sizeof(info)) return;
    log(std::format("Received signal {}, shutting down", info.ssi_signo));
    scheduler_.request_stop();
}

void LinuxEventLoop::on_accept() {
    while (true) {
        int fd = ipc_server_.accept_client();
        if (fd < 0) return;
        client_serials_[fd] = ++next_serial_;
        if (!scheduler_.watch_fd(fd, EPOLLIN, [this, fd](uint32_t events) { on_client(fd, events); })) {
            drop_client(fd);
        }
    }
}

void LinuxEventLoop::on_client(int fd, uint32_t events) {
    std::vector<nlohmann::json> cmds;
    bool open = (events & EPOLLIN) && ipc_server_.read_commands(fd, cmds);

    for (auto& cmd : cmds) {
        auto reply = reply_to(fd);
        if (cmd.contains("parse_error")) {
            reply({{"status", "error"}, {"message", "invalid JSON"}});
            continue;
        }
        std::string cmd_str = cmd.value("cmd", "");
        log("ipc: " + cmd_str);
        core_.handle_command(cmd_str, cmd, std::move(reply));
    }

    if (!open) drop_client(fd);
}

void LinuxEventLoop::drop_client(int fd) {
    scheduler_.unwatch_fd(fd);
    ipc_server_.close_client(fd);
    client_serials_.erase(fd);
}

DaemonCore::Reply LinuxEventLoop::reply_to(int fd) {
    uint64_t serial = client_serials_[fd];
    return [this, fd, serial](nlohmann::json response) {
        auto it = client_serials_.find(fd);
        if (it == client_serials_.end() || it->second != serial) return;
        if (!ipc_server_.send_response(fd, response)) {
            log(std::format("ipc: reply to client {} failed", fd));
        }
    };
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[sweepwatch] {}", msg);
    }
}
