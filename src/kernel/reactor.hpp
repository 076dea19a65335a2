/**
 * Warden Reactor
 *
 * Single-threaded epoll event loop. File descriptor callbacks, one-shot
 * timers and tasks posted from other threads all run on the thread that
 * calls poll(). Everything scheduled here must not block.
 */
#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace warden::kernel {

using EventCallback = std::function<void(int fd, uint32_t events)>;
using Task = std::function<void()>;
using TimerId = uint64_t;

// Cross-thread task queue, woken through an eventfd. Shared so that a
// worker thread may outlive the reactor it posts to.
class TaskQueue {
public:
    TaskQueue();
    ~TaskQueue();

    // Non-copyable
    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    int wake_fd() const { return wake_fd_; }

    // False once the owning reactor has gone away
    bool post(Task task);
    std::vector<Task> drain();
    void close();

private:
    std::mutex mutex_;
    std::vector<Task> tasks_;
    bool closed_ = false;
    int wake_fd_ = -1;
};

class Reactor {
public:
    Reactor();
    ~Reactor();

    // Non-copyable
    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    bool init();

    bool add(int fd, uint32_t events, EventCallback callback);
    bool modify(int fd, uint32_t events);
    bool remove(int fd);

    // Wait up to timeout_ms, then dispatch ready fds, due timers and
    // posted tasks. Returns the number of callbacks run, -1 on error.
    int poll(int timeout_ms);

    // Poll until done() holds or timeout_ms elapses; returns done()
    bool run_until(const std::function<bool()>& done, int timeout_ms);

    TimerId call_later(double delay_seconds, Task task);
    bool cancel(TimerId id);

    // Thread-safe
    void post(Task task);
    std::shared_ptr<TaskQueue> task_queue() const { return queue_; }

    size_t pending_timers() const { return timers_.size(); }
    double now() const;

private:
    int epoll_fd_ = -1;
    std::unordered_map<int, std::shared_ptr<EventCallback>> handlers_;

    struct Timer {
        double due;
        Task task;
    };
    TimerId next_timer_id_ = 1;
    std::map<TimerId, Timer> timers_;
    std::multimap<double, TimerId> timer_order_;

    std::shared_ptr<TaskQueue> queue_;

    int next_timeout_ms(int requested) const;
    int run_timers();
    int run_posted();
};

} // namespace warden::kernel
