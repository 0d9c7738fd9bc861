#include "http/http_server.hpp"

#include "daemon_core.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <boost/beast.hpp>
#include <charconv>
#include <deque>
#include <format>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <print>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;
using json = nlohmann::json;

namespace {

struct Route {
    std::string_view path;
    std::string_view cmd;
    http::verb method;
};

constexpr std::array kRoutes{
    Route{"/api/sweep/start", "start", http::verb::post},
    Route{"/api/sweep/stop", "stop", http::verb::post},
    Route{"/api/sweep/emergency-stop", "emergency-stop", http::verb::post},
    Route{"/api/sweep/force-cleanup", "force-cleanup", http::verb::post},
    Route{"/api/sweep/sync", "sync", http::verb::post},
    Route{"/api/sweep/reset", "reset", http::verb::post},
    Route{"/api/sweep/cycle-status", "cycle-status", http::verb::get},
    Route{"/api/sweep/health", "health", http::verb::get},
    Route{"/api/sweep/history", "history", http::verb::get},
};

constexpr std::string_view kStreamPath = "/api/sweep/stream";

http::status status_for(const json& resp) {
    auto s = resp.value("status", "");
    if (s == "ok" || s == "accepted") return http::status::ok;
    return http::status::conflict;
}

std::string value_or_empty(const std::map<std::string, std::string>& m, const std::string& key) {
    auto it = m.find(key);
    return it != m.end() ? it->second : std::string{};
}

// One text/event-stream connection. send() may be called from the
// scheduler thread; all socket work happens on the io_context thread.
class SseSession : public StreamSink, public std::enable_shared_from_this<SseSession> {
public:
    SseSession(beast::tcp_stream stream, HttpContext& ctx, SubscriptionFilter filter, unsigned version)
        : stream_(std::move(stream)), ctx_(ctx), filter_(std::move(filter)), version_(version) {}

    void run() {
        stream_.expires_never();

        res_.result(http::status::ok);
        res_.version(version_);
        res_.set(http::field::server, "sweepwatch");
        res_.set(http::field::content_type, "text/event-stream");
        res_.set(http::field::cache_control, "no-cache");
        res_.set(http::field::access_control_allow_origin, "*");
        res_.keep_alive(false);

        http::async_write_header(stream_, sr_,
            [self = shared_from_this()](beast::error_code ec, size_t) { self->on_header(ec); });
    }

    SinkResult send(const std::string& event_name, const std::string& payload) override {
        if (closed_.load(std::memory_order_acquire)) return SinkResult::Closed;

        bool start_write = false;
        {
            std::lock_guard lock(mutex_);
            if (queue_.size() >= ctx_.max_queued_events) return SinkResult::Dropped;
            queue_.push_back(std::format("event: {}\ndata: {}\n\n", event_name, payload));
            if (!writing_) {
                writing_ = true;
                start_write = true;
            }
        }
        if (start_write) {
            asio::post(stream_.get_executor(), [self = shared_from_this()] { self->do_write(); });
        }
        return SinkResult::Queued;
    }

    uint64_t delivered() const override { return delivered_.load(std::memory_order_acquire); }
    bool closed() const override { return closed_.load(std::memory_order_acquire); }

    void close() override {
        if (closed_.exchange(true, std::memory_order_acq_rel)) return;
        asio::post(stream_.get_executor(), [self = shared_from_this()] { self->shutdown_socket(); });
    }

private:
    void on_header(beast::error_code ec) {
        if (ec) {
            closed_.store(true, std::memory_order_release);
            return;
        }
        ctx_.scheduler.post([self = shared_from_this()] {
            self->connection_id_ = self->ctx_.core.subscribe(self, self->filter_);
        });
        do_read();
    }

    // Peers never send after the request; a read completing means EOF or reset.
    void do_read() {
        stream_.async_read_some(asio::buffer(read_buf_),
            [self = shared_from_this()](beast::error_code ec, size_t) {
                if (!ec) return self->do_read();
                self->on_disconnect();
            });
    }

    void do_write() {
        {
            std::lock_guard lock(mutex_);
            if (queue_.empty() || closed_.load(std::memory_order_acquire)) {
                writing_ = false;
                return;
            }
            current_ = std::move(queue_.front());
            queue_.pop_front();
        }
        asio::async_write(stream_, asio::buffer(current_),
            [self = shared_from_this()](beast::error_code ec, size_t) {
                if (ec) return self->on_disconnect();
                self->delivered_.fetch_add(1, std::memory_order_acq_rel);
                self->do_write();
            });
    }

    void on_disconnect() {
        closed_.store(true, std::memory_order_release);
        shutdown_socket();
        ctx_.scheduler.post([self = shared_from_this()] {
            if (!self->connection_id_.empty()) self->ctx_.core.unsubscribe(self->connection_id_);
        });
    }

    void shutdown_socket() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
        stream_.socket().close(ec);
    }

    beast::tcp_stream stream_;
    HttpContext& ctx_;
    SubscriptionFilter filter_;
    unsigned version_;

    http::response<http::empty_body> res_;
    http::response_serializer<http::empty_body> sr_{res_};
    std::array<char, 256> read_buf_{};

    std::mutex mutex_;
    std::deque<std::string> queue_;
    bool writing_ = false;
    std::string current_;

    std::atomic<bool> closed_{false};
    std::atomic<uint64_t> delivered_{0};

    // Scheduler thread only
    std::string connection_id_;
};

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, HttpContext& ctx)
        : stream_(std::move(socket)), ctx_(ctx), timer_(stream_.get_executor()) {}

    void run() { do_read(); }

private:
    void do_read() {
        req_ = {};
        stream_.expires_after(std::chrono::seconds(30));
        http::async_read(stream_, buffer_, req_,
            [self = shared_from_this()](beast::error_code ec, size_t) { self->on_read(ec); });
    }

    void on_read(beast::error_code ec) {
        if (ec == http::error::end_of_stream) return do_close();
        if (ec) return;

        std::string_view target(req_.target().data(), req_.target().size());
        std::string_view path = target;
        std::string_view query;
        if (auto q = target.find('?'); q != std::string_view::npos) {
            path = target.substr(0, q);
            query = target.substr(q + 1);
        }
        auto params = HttpServer::parse_query(query);

        if (path == kStreamPath) {
            if (req_.method() != http::verb::get) {
                return send_json(http::status::method_not_allowed,
                                 {{"status", "error"}, {"message", "method not allowed"}});
            }
            auto filter = SubscriptionFilter::from_query(value_or_empty(params, "types"),
                                                         value_or_empty(params, "min_signal"),
                                                         value_or_empty(params, "device_types"));
            std::make_shared<SseSession>(std::move(stream_), ctx_, std::move(filter), req_.version())->run();
            return;
        }

        auto route = std::ranges::find_if(kRoutes, [path](const Route& r) { return r.path == path; });
        if (route == kRoutes.end()) {
            return send_json(http::status::not_found, {{"status", "error"}, {"message", "not found"}});
        }
        if (req_.method() != route->method) {
            return send_json(http::status::method_not_allowed,
                             {{"status", "error"}, {"message", "method not allowed"}});
        }

        json cmd = json::object();
        if (!req_.body().empty()) {
            cmd = json::parse(req_.body(), nullptr, false);
            if (cmd.is_discarded() || !cmd.is_object()) {
                return send_json(http::status::bad_request,
                                 {{"status", "error"}, {"message", "invalid JSON body"}});
            }
        }
        if (auto limit = value_or_empty(params, "limit"); !limit.empty()) {
            int n = 0;
            auto [ptr, perr] = std::from_chars(limit.data(), limit.data() + limit.size(), n);
            if (perr == std::errc{} && ptr == limit.data() + limit.size() && n > 0) cmd["limit"] = n;
        }

        dispatch(std::string(route->cmd), std::move(cmd));
    }

    void dispatch(std::string cmd_str, json cmd) {
        answered_ = false;
        uint64_t seq = ++request_seq_;

        timer_.expires_after(std::chrono::milliseconds(ctx_.config.command_timeout_ms));
        timer_.async_wait([self = shared_from_this(), cmd_str](beast::error_code ec) {
            if (ec || self->answered_) return;
            self->answered_ = true;
            self->send_json(http::status::gateway_timeout,
                            {{"status", "error"}, {"message", cmd_str + " timed out"}});
        });

        std::weak_ptr<HttpSession> weak = shared_from_this();
        auto& core = ctx_.core;
        ctx_.scheduler.post([weak, &core, cmd_str = std::move(cmd_str), cmd = std::move(cmd)] {
            core.handle_command(cmd_str, cmd, [weak, seq](json resp) {
                auto self = weak.lock();
                if (!self) return;
                asio::post(self->stream_.get_executor(), [self, seq, resp = std::move(resp)] {
                    self->on_reply(seq, resp);
                });
            });
        });
    }

    // Replies to a request that already timed out are dropped.
    void on_reply(uint64_t seq, const json& resp) {
        if (answered_ || seq != request_seq_) return;
        answered_ = true;
        timer_.cancel();
        send_json(status_for(resp), resp);
    }

    void send_json(http::status status, const json& body) {
        auto res = std::make_shared<http::response<http::string_body>>(status, req_.version());
        res->set(http::field::server, "sweepwatch");
        res->set(http::field::content_type, "application/json");
        res->set(http::field::access_control_allow_origin, "*");
        res->keep_alive(req_.keep_alive());
        res->body() = body.dump();
        res->prepare_payload();

        http::async_write(stream_, *res, [self = shared_from_this(), res](beast::error_code ec, size_t) {
            if (ec) return;
            if (!res->keep_alive()) return self->do_close();
            self->do_read();
        });
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    HttpContext& ctx_;
    asio::steady_timer timer_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    bool answered_ = true;
    uint64_t request_seq_ = 0;
};

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); i++) {
        if (in[i] == '+') {
            out += ' ';
        } else if (in[i] == '%' && i + 2 < in.size() &&
                   hex_value(in[i + 1]) >= 0 && hex_value(in[i + 2]) >= 0) {
            out += static_cast<char>(hex_value(in[i + 1]) * 16 + hex_value(in[i + 2]));
            i += 2;
        } else {
            out += in[i];
        }
    }
    return out;
}

} // namespace

HttpServer::HttpServer(const Config& config, Scheduler& scheduler, DaemonCore& core, bool verbose)
    : ctx_{.scheduler = scheduler,
           .core = core,
           .config = config.http,
           .max_queued_events = config.stream.max_queued_events,
           .verbose = verbose},
      acceptor_(ioc_) {}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    beast::error_code ec;
    auto address = asio::ip::make_address(ctx_.config.address, ec);
    if (ec) {
        std::println(stderr, "http: invalid address {}: {}", ctx_.config.address, ec.message());
        return false;
    }
    tcp::endpoint endpoint{address, ctx_.config.port};

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        std::println(stderr, "http: cannot listen on {}:{}: {}", ctx_.config.address,
                     ctx_.config.port, ec.message());
        beast::error_code ignored;
        acceptor_.close(ignored);
        return false;
    }
    bound_port_ = acceptor_.local_endpoint().port();

    do_accept();
    running_ = true;
    thread_ = std::jthread([this] {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            std::println(stderr, "http: io thread stopped: {}", e.what());
        }
    });

    log(std::format("HTTP listening on {}:{}", ctx_.config.address, bound_port_));
    return true;
}

void HttpServer::stop() {
    if (!running_) return;
    running_ = false;

    asio::post(ioc_, [this] {
        beast::error_code ec;
        acceptor_.close(ec);
    });
    ioc_.stop();
    if (thread_.joinable()) thread_.join();
}

void HttpServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted) return;
        if (ec) {
            log("accept failed: " + ec.message());
        } else {
            std::make_shared<HttpSession>(std::move(socket), ctx_)->run();
        }
        do_accept();
    });
}

std::map<std::string, std::string> HttpServer::parse_query(std::string_view query) {
    std::map<std::string, std::string> params;
    while (!query.empty()) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
        if (pair.empty()) continue;

        auto eq = pair.find('=');
        auto key = url_decode(pair.substr(0, eq));
        auto value = eq == std::string_view::npos ? std::string{} : url_decode(pair.substr(eq + 1));
        if (!key.empty()) params[key] = std::move(value);
    }
    return params;
}

void HttpServer::log(const std::string& msg) {
    if (ctx_.verbose) {
        std::println(stderr, "[sweepwatch] {}", msg);
    }
}
