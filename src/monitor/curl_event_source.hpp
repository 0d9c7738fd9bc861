#pragma once

#include "event_source.hpp"
#include "platform/scheduler.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>

// libcurl transport. Each open() runs one blocking transfer on its own
// thread; parsed messages are posted back to the scheduler.
class CurlEventSource : public EventSource {
public:
    explicit CurlEventSource(Scheduler& scheduler, bool verbose = false);
    ~CurlEventSource() override;

    CurlEventSource(const CurlEventSource&) = delete;
    CurlEventSource& operator=(const CurlEventSource&) = delete;

    void open(const std::string& url, Handlers handlers) override;
    void close() override;

private:
    void log(const std::string& msg);

    Scheduler& scheduler_;
    bool verbose_;
    // Bumped by open/close; posted callbacks compare against it
    std::shared_ptr<std::atomic<uint64_t>> generation_;
    std::jthread thread_;
};
