#include "kernel/reactor.hpp"
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstring>

namespace warden::kernel {

// ============================================================================
// TaskQueue Implementation
// ============================================================================

TaskQueue::TaskQueue() {
    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        spdlog::error("Failed to create eventfd: {}", strerror(errno));
    }
}

TaskQueue::~TaskQueue() {
    if (wake_fd_ >= 0) {
        ::close(wake_fd_);
    }
}

bool TaskQueue::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    uint64_t one = 1;
    if (write(wake_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
        spdlog::warn("Failed to wake reactor: {}", strerror(errno));
    }
    return true;
}

std::vector<Task> TaskQueue::drain() {
    uint64_t count = 0;
    while (read(wake_fd_, &count, sizeof(count)) > 0) {}

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Task> out;
    out.swap(tasks_);
    return out;
}

void TaskQueue::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    tasks_.clear();
}

// ============================================================================
// Reactor Implementation
// ============================================================================

Reactor::Reactor()
    : queue_(std::make_shared<TaskQueue>()) {}

Reactor::~Reactor() {
    queue_->close();
    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
    }
}

bool Reactor::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        spdlog::error("Failed to create epoll: {}", strerror(errno));
        return false;
    }
    if (queue_->wake_fd() < 0) {
        return false;
    }

    struct epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = queue_->wake_fd();
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, queue_->wake_fd(), &ev) < 0) {
        spdlog::error("Failed to register wake fd: {}", strerror(errno));
        return false;
    }
    return true;
}

bool Reactor::add(int fd, uint32_t events, EventCallback callback) {
    struct epoll_event ev{};
    ev.events = events;
    ev.data.fd = fd;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        spdlog::error("epoll_ctl ADD failed for fd {}: {}", fd, strerror(errno));
        return false;
    }
    handlers_[fd] = std::make_shared<EventCallback>(std::move(callback));
    return true;
}

bool Reactor::modify(int fd, uint32_t events) {
    struct epoll_event ev{};
    ev.events = events;
    ev.data.fd = fd;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) < 0) {
        spdlog::error("epoll_ctl MOD failed for fd {}: {}", fd, strerror(errno));
        return false;
    }
    return true;
}

bool Reactor::remove(int fd) {
    handlers_.erase(fd);
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) < 0) {
        if (errno != EBADF && errno != ENOENT) {
            spdlog::warn("epoll_ctl DEL failed for fd {}: {}", fd, strerror(errno));
        }
        return false;
    }
    return true;
}

double Reactor::now() const {
    auto t = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration<double>(t).count();
}

int Reactor::next_timeout_ms(int requested) const {
    if (timer_order_.empty()) {
        return requested;
    }
    double wait = timer_order_.begin()->first - now();
    int wait_ms = wait <= 0 ? 0 : static_cast<int>(std::ceil(wait * 1000.0));
    return requested < 0 ? wait_ms : std::min(requested, wait_ms);
}

int Reactor::poll(int timeout_ms) {
    constexpr int MAX_EVENTS = 64;
    struct epoll_event events[MAX_EVENTS];

    int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, next_timeout_ms(timeout_ms));
    if (n < 0) {
        if (errno == EINTR) {
            return 0;
        }
        spdlog::error("epoll_wait failed: {}", strerror(errno));
        return -1;
    }

    int handled = 0;
    for (int i = 0; i < n; ++i) {
        int fd = events[i].data.fd;
        if (fd == queue_->wake_fd()) {
            continue;
        }
        auto it = handlers_.find(fd);
        if (it == handlers_.end()) {
            continue;
        }
        // Hold a reference so the callback may remove itself
        auto callback = it->second;
        (*callback)(fd, events[i].events);
        handled++;
    }

    handled += run_timers();
    handled += run_posted();
    return handled;
}

bool Reactor::run_until(const std::function<bool()>& done, int timeout_ms) {
    double deadline = now() + timeout_ms / 1000.0;
    while (!done()) {
        double remaining = deadline - now();
        if (remaining <= 0) {
            break;
        }
        if (poll(std::max(1, static_cast<int>(remaining * 1000.0))) < 0) {
            break;
        }
    }
    return done();
}

TimerId Reactor::call_later(double delay_seconds, Task task) {
    TimerId id = next_timer_id_++;
    double due = now() + std::max(0.0, delay_seconds);
    timers_[id] = Timer{due, std::move(task)};
    timer_order_.emplace(due, id);
    return id;
}

bool Reactor::cancel(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) {
        return false;
    }
    auto range = timer_order_.equal_range(it->second.due);
    for (auto o = range.first; o != range.second; ++o) {
        if (o->second == id) {
            timer_order_.erase(o);
            break;
        }
    }
    timers_.erase(it);
    return true;
}

void Reactor::post(Task task) {
    queue_->post(std::move(task));
}

int Reactor::run_timers() {
    int fired = 0;
    double current = now();
    while (!timer_order_.empty() && timer_order_.begin()->first <= current) {
        TimerId id = timer_order_.begin()->second;
        timer_order_.erase(timer_order_.begin());

        auto it = timers_.find(id);
        if (it == timers_.end()) {
            continue;
        }
        Task task = std::move(it->second.task);
        timers_.erase(it);
        task();
        fired++;
    }
    return fired;
}

int Reactor::run_posted() {
    auto tasks = queue_->drain();
    for (auto& task : tasks) {
        task();
    }
    return static_cast<int>(tasks.size());
}

} // namespace warden::kernel
