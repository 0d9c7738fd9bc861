#include "platform/linux/epoll_scheduler.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

EpollScheduler::EpollScheduler(bool verbose) : verbose_(verbose) {}

EpollScheduler::~EpollScheduler() {
    for (auto& w : workers_) {
        w.thread.request_stop();
    }
    workers_.clear();

    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (timer_fd_ >= 0) ::close(timer_fd_);
    if (wake_fd_ >= 0) ::close(wake_fd_);
}

bool EpollScheduler::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    for (int fd : {timer_fd_, wake_fd_}) {
        epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void EpollScheduler::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_acquire)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n && running_.load(std::memory_order_acquire); i++) {
            int fd = events[i].data.fd;

            if (fd == timer_fd_) {
                uint64_t expirations;
                while (::read(timer_fd_, &expirations, sizeof(expirations)) > 0) {}
                run_due_timers();
                continue;
            }

            if (fd == wake_fd_) {
                uint64_t val;
                while (::read(wake_fd_, &val, sizeof(val)) > 0) {}
                run_posted();
                continue;
            }

            // Copy: the callback may unwatch itself
            auto it = watches_.find(fd);
            if (it == watches_.end()) continue;
            auto cb = it->second;
            cb(events[i].events);
        }

        reap_workers();
    }
}

void EpollScheduler::request_stop() {
    running_.store(false, std::memory_order_release);
    if (wake_fd_ >= 0) {
        uint64_t val = 1;
        ::write(wake_fd_, &val, sizeof(val));
    }
}

void EpollScheduler::discard_pending() {
    workers_.clear();

    std::deque<Task> dropped;
    {
        std::lock_guard lock(post_mutex_);
        dropped.swap(posted_);
    }
    timers_.clear();
    deadlines_.clear();
    arm_timerfd();
}

bool EpollScheduler::watch_fd(int fd, uint32_t events, FdCallback callback) {
    epoll_event ev{.events = events, .data = {.fd = fd}};
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        std::println(stderr, "epoll_ctl(ADD, {}) failed: {}", fd, std::strerror(errno));
        return false;
    }
    watches_[fd] = std::move(callback);
    return true;
}

void EpollScheduler::unwatch_fd(int fd) {
    if (watches_.erase(fd) > 0) {
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    }
}

Scheduler::TimerId EpollScheduler::schedule(std::chrono::milliseconds delay, Task task) {
    return add_timer(delay, std::chrono::milliseconds(0), std::move(task));
}

Scheduler::TimerId EpollScheduler::schedule_every(std::chrono::milliseconds interval, Task task) {
    return add_timer(interval, interval, std::move(task));
}

Scheduler::TimerId EpollScheduler::add_timer(std::chrono::milliseconds delay,
                                             std::chrono::milliseconds interval, Task task) {
    TimerId id = ++next_timer_id_;
    auto deadline = now() + delay;
    timers_.emplace(id, Timer{.deadline = deadline, .interval = interval, .task = std::move(task)});
    deadlines_.emplace(deadline, id);
    arm_timerfd();
    return id;
}

void EpollScheduler::cancel(TimerId id) {
    if (id == kInvalidTimer) return;
    auto it = timers_.find(id);
    if (it == timers_.end()) return;
    deadlines_.erase({it->second.deadline, id});
    timers_.erase(it);
    arm_timerfd();
}

void EpollScheduler::post(Task task) {
    {
        std::lock_guard lock(post_mutex_);
        posted_.push_back(std::move(task));
    }
    uint64_t val = 1;
    ::write(wake_fd_, &val, sizeof(val));
}

void EpollScheduler::offload(Task work, Task done) {
    reap_workers();

    auto finished = std::make_shared<std::atomic<bool>>(false);
    workers_.push_back(Worker{
        .thread = std::jthread([this, finished, work = std::move(work), done = std::move(done)] {
            work();
            post(done);
            finished->store(true, std::memory_order_release);
        }),
        .finished = finished,
    });
    if (verbose_ && workers_.size() > 8) {
        std::println(stderr, "[sweepwatch] {} offloaded jobs in flight", workers_.size());
    }
}

void EpollScheduler::arm_timerfd() {
    itimerspec spec{};
    if (!deadlines_.empty()) {
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
            deadlines_.begin()->first.time_since_epoch()).count();
        // An all-zero it_value disarms the timer
        if (ns <= 0) ns = 1;
        spec.it_value.tv_sec = ns / 1'000'000'000;
        spec.it_value.tv_nsec = ns % 1'000'000'000;
    }
    if (timerfd_settime(timer_fd_, TFD_TIMER_ABSTIME, &spec, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
    }
}

void EpollScheduler::run_due_timers() {
    auto current = now();
    std::vector<TimerId> due;
    for (auto& [deadline, id] : deadlines_) {
        if (deadline > current) break;
        due.push_back(id);
    }

    for (TimerId id : due) {
        // An earlier callback may have cancelled this one
        auto it = timers_.find(id);
        if (it == timers_.end()) continue;

        Task task = it->second.task;
        deadlines_.erase({it->second.deadline, id});
        if (it->second.interval.count() > 0) {
            it->second.deadline = current + it->second.interval;
            deadlines_.emplace(it->second.deadline, id);
        } else {
            timers_.erase(it);
        }
        task();
    }
    arm_timerfd();
}

void EpollScheduler::run_posted() {
    std::deque<Task> tasks;
    {
        std::lock_guard lock(post_mutex_);
        tasks.swap(posted_);
    }
    for (auto& t : tasks) {
        if (!running_.load(std::memory_order_acquire)) break;
        t();
    }
}

void EpollScheduler::reap_workers() {
    std::erase_if(workers_, [](Worker& w) {
        return w.finished->load(std::memory_order_acquire);
    });
}
