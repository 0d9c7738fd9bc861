#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

// Single-threaded timer/task loop. Everything except post() must be called
// from the loop thread; callbacks always run on the loop thread.
class Scheduler {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;
    using Clock = std::chrono::steady_clock;

    static constexpr TimerId kInvalidTimer = 0;

    virtual ~Scheduler() = default;

    virtual TimerId schedule(std::chrono::milliseconds delay, Task task) = 0;
    virtual TimerId schedule_every(std::chrono::milliseconds interval, Task task) = 0;

    // Cancelling an unknown or already fired timer is a no-op.
    virtual void cancel(TimerId id) = 0;

    // Thread-safe: queue a task for the loop thread.
    virtual void post(Task task) = 0;

    // Run `work` on a worker thread, then `done` on the loop thread.
    virtual void offload(Task work, Task done) = 0;

    virtual Clock::time_point now() const = 0;
};
