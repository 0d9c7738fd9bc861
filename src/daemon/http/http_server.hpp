#pragma once

#include "config.hpp"
#include "platform/scheduler.hpp"

#include <boost/asio.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <thread>

class DaemonCore;

struct HttpContext {
    Scheduler& scheduler;
    DaemonCore& core;
    Config::Http config;
    size_t max_queued_events;
    bool verbose;
};

// HTTP/1.1 command surface and text/event-stream endpoint. Runs its own
// io_context thread; every DaemonCore call is posted to the scheduler.
class HttpServer {
public:
    HttpServer(const Config& config, Scheduler& scheduler, DaemonCore& core, bool verbose = false);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool start();
    void stop();

    // Bound port; differs from the configured one when that was 0.
    uint16_t port() const { return bound_port_; }

    // "a=1&b=x%2Cy" -> {a: "1", b: "x,y"}
    static std::map<std::string, std::string> parse_query(std::string_view query);

private:
    void do_accept();
    void log(const std::string& msg);

    HttpContext ctx_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t bound_port_ = 0;
    bool running_ = false;
    std::jthread thread_;
};
