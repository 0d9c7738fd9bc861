#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <algorithm>
#include <charconv>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start --freq MHZ [--freq MHZ ...] [--range LO:HI] [--cycle MS]");
    std::println(stderr, "                                    Start sweeping (cycles when >1 frequency)");
    std::println(stderr, "  stop                              Stop the sweep gracefully");
    std::println(stderr, "  emergency-stop                    Kill every sweep process now");
    std::println(stderr, "  force-cleanup                     Kill stray sweep processes, reset to idle");
    std::println(stderr, "  cycle-status                      Show sweep state");
    std::println(stderr, "  sync                              Reconcile state with running processes");
    std::println(stderr, "  reset [--reason TEXT]             Drop stream clients and reset");
    std::println(stderr, "  health                            Hardware and supervisor health");
    std::println(stderr, "  history [--limit N]               Show recent sweep runs");
}

static bool parse_number(std::string_view s, double& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

static void print_status(const json& r) {
    std::println("State: {}", r.value("state", "unknown"));
    if (r.contains("frequencies") && r["frequencies"].is_array() && !r["frequencies"].empty()) {
        auto idx = r.value("current_index", 0);
        for (size_t i = 0; i < r["frequencies"].size(); i++) {
            auto& f = r["frequencies"][i];
            std::println("  {} {:.3f} MHz (span {:.3f} MHz)", static_cast<int>(i) == idx ? '*' : ' ',
                         f.value("center_mhz", 0.0), f.value("span_mhz", 0.0));
        }
        std::println("Cycle time: {} ms", r.value("cycle_time_ms", 0));
    }
    if (r.contains("consecutive_errors")) {
        std::println("Consecutive errors: {}", r["consecutive_errors"].dump());
    }
    if (auto err = r.value("last_error", ""); !err.empty()) {
        std::println("Last error: {}", err);
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    json frequencies = json::array();
    std::optional<int> cycle_ms;
    std::string reason;
    int limit = 10;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--freq" && i + 1 < argc) {
            double mhz = 0;
            if (!parse_number(argv[++i], mhz)) {
                std::println(stderr, "Invalid frequency: {}", argv[i]);
                return 1;
            }
            frequencies.push_back(mhz);
        } else if (arg == "--range" && i + 1 < argc) {
            std::string_view range = argv[++i];
            auto colon = range.find(':');
            double lo = 0, hi = 0;
            if (colon == std::string_view::npos || !parse_number(range.substr(0, colon), lo) ||
                !parse_number(range.substr(colon + 1), hi)) {
                std::println(stderr, "Invalid range (expected LO:HI in MHz): {}", range);
                return 1;
            }
            frequencies.push_back({{"start", lo}, {"stop", hi}});
        } else if (arg == "--cycle" && i + 1 < argc) {
            double ms = 0;
            if (!parse_number(argv[++i], ms) || ms <= 0) {
                std::println(stderr, "Invalid cycle time: {}", argv[i]);
                return 1;
            }
            cycle_ms = static_cast<int>(ms);
        } else if (arg == "--reason" && i + 1 < argc) {
            reason = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            double n = 0;
            if (parse_number(argv[++i], n) && n > 0) limit = static_cast<int>(n);
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    static const std::vector<std::string> plain = {
        "stop", "emergency-stop", "force-cleanup", "cycle-status", "sync", "health",
    };

    json cmd;
    if (command == "start") {
        if (frequencies.empty()) {
            std::println(stderr, "start needs at least one --freq or --range");
            return 1;
        }
        cmd = {{"cmd", "start"}, {"frequencies", frequencies}};
        if (cycle_ms) cmd["cycle_time_ms"] = *cycle_ms;
    } else if (command == "reset") {
        cmd = {{"cmd", "reset"}};
        if (!reason.empty()) cmd["reason"] = reason;
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
    } else if (std::ranges::find(plain, command) != plain.end()) {
        cmd = {{"cmd", command}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect: {}", client.last_error());
        std::println(stderr, "Is sweepwatchd running?");
        return 1;
    }

    json response;
    if (!client.request(cmd, response)) {
        std::println(stderr, "Request failed: {}", client.last_error());
        return 1;
    }

    auto status = response.value("status", "");

    if (status == "error" || status == "rejected") {
        std::println(stderr, "Error: {}",
                     response.value("message", response.value("reason", "unknown error")));
        return 1;
    }

    if (command == "cycle-status") {
        print_status(response);
    } else if (command == "history") {
        for (auto& run : response.value("runs", json::array())) {
            std::println("#{} {} -> {} [{}] errors={}", run.value("id", 0),
                         run.value("started_at", ""),
                         run["stopped_at"].is_string() ? run["stopped_at"].get<std::string>() : "-",
                         run.value("final_phase", ""), run.value("error_count", 0));
            std::println("  {}", run["frequencies"].dump());
            if (run["last_error"].is_string()) {
                std::println("  Last error: {}", run["last_error"].get<std::string>());
            }
        }
    } else if (command == "start") {
        std::println("Sweep accepted");
    } else {
        std::println("{}", response.dump(2));
    }

    return 0;
}
