#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "http/http_server.hpp"
#include "platform/linux/epoll_scheduler.hpp"
#include "platform/linux/posix_process_launcher.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>

class LinuxEventLoop {
public:
    LinuxEventLoop(Config config, bool verbose = false, bool http_enabled = true);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void on_signal();
    void on_accept();
    void on_client(int fd, uint32_t events);
    void drop_client(int fd);
    DaemonCore::Reply reply_to(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    bool http_enabled_;

    // Destroyed last: reader threads and HTTP sessions post into it
    EpollScheduler scheduler_;
    PosixProcessLauncher launcher_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    DaemonCore core_;
    std::unique_ptr<HttpServer> http_;

    int signal_fd_ = -1;

    // Deferred replies must not reach a reused fd
    std::map<int, uint64_t> client_serials_;
    uint64_t next_serial_ = 0;
};
