#pragma once

#include "platform/scheduler.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <utility>
#include <vector>

// epoll loop with a timerfd for timers, an eventfd for posted tasks and
// one jthread per offloaded job.
class EpollScheduler : public Scheduler {
public:
    using FdCallback = std::function<void(uint32_t events)>;

    explicit EpollScheduler(bool verbose = false);
    ~EpollScheduler() override;

    EpollScheduler(const EpollScheduler&) = delete;
    EpollScheduler& operator=(const EpollScheduler&) = delete;

    bool init();

    // Runs until request_stop(). Must be called from the thread that owns the loop.
    void run();
    // Thread-safe.
    void request_stop();
    // Joins offloaded jobs, then drops queued tasks and timers without running them.
    void discard_pending();

    bool watch_fd(int fd, uint32_t events, FdCallback callback);
    void unwatch_fd(int fd);

    TimerId schedule(std::chrono::milliseconds delay, Task task) override;
    TimerId schedule_every(std::chrono::milliseconds interval, Task task) override;
    void cancel(TimerId id) override;
    void post(Task task) override;
    void offload(Task work, Task done) override;
    Clock::time_point now() const override { return Clock::now(); }

private:
    struct Timer {
        Clock::time_point deadline;
        std::chrono::milliseconds interval{0};
        Task task;
    };

    struct Worker {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    TimerId add_timer(std::chrono::milliseconds delay, std::chrono::milliseconds interval, Task task);
    void arm_timerfd();
    void run_due_timers();
    void run_posted();
    void reap_workers();

    bool verbose_;
    int epoll_fd_ = -1;
    int timer_fd_ = -1;
    int wake_fd_ = -1;
    std::atomic<bool> running_{false};

    TimerId next_timer_id_ = 0;
    std::map<TimerId, Timer> timers_;
    std::set<std::pair<Clock::time_point, TimerId>> deadlines_;

    std::mutex post_mutex_;
    std::deque<Task> posted_;

    std::map<int, FdCallback> watches_;
    std::vector<Worker> workers_;
};
