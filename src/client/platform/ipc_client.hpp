#pragma once

#include <nlohmann/json.hpp>
#include <string>

// Client side of sweepwatchd's newline-delimited JSON control socket.
class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;
    // Waits for one full response line; the timeout covers the whole wait.
    virtual bool recv(nlohmann::json& response, int timeout_ms = 30000) = 0;
    virtual void close() = 0;

    // Why the last call failed, for the user.
    virtual const std::string& last_error() const = 0;

    bool request(const nlohmann::json& cmd, nlohmann::json& response, int timeout_ms = 30000) {
        return send(cmd) && recv(response, timeout_ms);
    }
};
