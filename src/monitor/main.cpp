#include "client_reconnector.hpp"
#include "curl_event_source.hpp"
#include "event_printer.hpp"
#include "platform/linux/epoll_scheduler.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <string>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

int main(int argc, char* argv[]) {
    std::string url = "http://127.0.0.1:8092/api/sweep/stream";
    std::string types;
    std::string min_signal;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--url" && i + 1 < argc) {
            url = argv[++i];
        } else if (arg == "--types" && i + 1 < argc) {
            types = argv[++i];
        } else if (arg == "--min-signal" && i + 1 < argc) {
            min_signal = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: sweepwatch-monitor [options]");
            std::println("Options:");
            std::println("  --url URL           Stream endpoint (default {})", url);
            std::println("  --types a,b         Only these event types");
            std::println("  --min-signal DB     Drop sweep data with a weaker peak");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("Signals: SIGUSR1 hides the session, SIGUSR2 or SIGCONT shows it.");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            return 1;
        }
    }

    std::string query;
    if (!types.empty()) query += "types=" + types;
    if (!min_signal.empty()) query += (query.empty() ? "" : "&") + std::string("min_signal=") + min_signal;
    if (!query.empty()) url += (url.find('?') == std::string::npos ? "?" : "&") + query;

    EpollScheduler scheduler(verbose);
    if (!scheduler.init()) return 1;

    sigset_t mask;
    sigemptyset(&mask);
    for (int sig : {SIGINT, SIGTERM, SIGUSR1, SIGUSR2, SIGCONT}) sigaddset(&mask, sig);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    int signal_fd = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return 1;
    }

    CurlEventSource source(scheduler, verbose);
    ClientReconnector reconnector(scheduler, source, url, {}, verbose);
    int exit_code = 0;

    reconnector.on_message([](const SseMessage& msg) { std::println("{}", format_event(msg)); });
    reconnector.on_state([&](ConnectionState state, const std::string& detail) {
        if (detail.empty()) {
            std::println(stderr, "-- {}", to_string(state));
        } else {
            std::println(stderr, "-- {}: {}", to_string(state), detail);
        }
        if (state == ConnectionState::Terminal) {
            exit_code = 2;
            scheduler.request_stop();
        }
    });

    scheduler.watch_fd(signal_fd, EPOLLIN, [&](uint32_t) {
        signalfd_siginfo info;
        if (::read(signal_fd, &info, sizeof(info)) != sizeof(info)) return;
        switch (info.ssi_signo) {
        case SIGUSR1:
            reconnector.set_visible(false);
            break;
        case SIGUSR2:
        case SIGCONT:
            reconnector.set_visible(true);
            break;
        default:
            scheduler.request_stop();
            break;
        }
    });

    reconnector.start();
    scheduler.run();

    reconnector.stop();
    scheduler.unwatch_fd(signal_fd);
    ::close(signal_fd);
    return exit_code;
}
