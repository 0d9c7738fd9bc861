#include "platform/linux/unix_socket_client.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketClient::~UnixSocketClient() {
    close();
}

bool UnixSocketClient::fail(std::string msg) {
    error_ = std::move(msg);
    return false;
}

bool UnixSocketClient::connect(const std::string& endpoint) {
    close();
    pending_.clear();

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        return fail(std::format("control socket path too long: {}", endpoint));
    }
    endpoint.copy(addr.sun_path, sizeof(addr.sun_path) - 1);

    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return fail(std::format("socket: {}", std::strerror(errno)));

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close();
        if (err == ENOENT || err == ECONNREFUSED) {
            return fail(std::format("no daemon listening at {}", endpoint));
        }
        return fail(std::format("connect {}: {}", endpoint, std::strerror(err)));
    }
    return true;
}

bool UnixSocketClient::send(const nlohmann::json& cmd) {
    if (fd_ < 0) return fail("not connected");
    std::string msg = cmd.dump() + "\n";
    size_t off = 0;
    while (off < msg.size()) {
        ssize_t n = ::send(fd_, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return fail(std::format("send: {}", std::strerror(errno)));
        off += static_cast<size_t>(n);
    }
    return true;
}

bool UnixSocketClient::recv(nlohmann::json& response, int timeout_ms) {
    if (fd_ < 0) return fail("not connected");

    using Clock = std::chrono::steady_clock;
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};

    for (;;) {
        auto pos = pending_.find('\n');
        if (pos != std::string::npos) {
            std::string line = pending_.substr(0, pos);
            pending_.erase(0, pos + 1);
            try {
                response = nlohmann::json::parse(line);
                return true;
            } catch (const nlohmann::json::exception& e) {
                return fail(std::format("malformed response: {}", e.what()));
            }
        }

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (left.count() <= 0) return fail("timed out waiting for the daemon");

        int ret = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (ret < 0 && errno == EINTR) continue;
        if (ret < 0) return fail(std::format("poll: {}", std::strerror(errno)));
        if (ret == 0) return fail("timed out waiting for the daemon");

        char tmp[4096];
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n == 0) return fail("daemon closed the connection");
        if (n < 0) return fail(std::format("recv: {}", std::strerror(errno)));
        pending_.append(tmp, static_cast<size_t>(n));
    }
}

void UnixSocketClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}
