#ifndef NETREC_EVENT_LOOP_HPP
#define NETREC_EVENT_LOOP_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace netrec {

// Single consumer work queue with named one-shot timers.
//
// Tasks run strictly in the order they were posted, one at a time, either on
// the worker thread started by start() or on whichever thread calls
// runReady(). Never mix the two modes. A timer becomes runnable once its
// deadline has passed and runs after every task queued before that point.
class EventLoop {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Task = std::function<void()>;
    using NowFunction = std::function<TimePoint()>;

    explicit EventLoop(NowFunction now = &Clock::now);
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post(Task task);

    // Schedules `task` after `delay`. A pending timer with the same token is
    // replaced.
    void postDelayed(const std::string& token, std::chrono::milliseconds delay, Task task);

    void cancel(const std::string& token);
    bool hasPending(const std::string& token) const;

    TimePoint now() const { return now_(); }

    std::size_t runReady();

    void start();
    void stop();
    bool isRunning() const;

private:
    struct Timer {
        TimePoint due;
        uint64_t sequence;
        Task task;
    };

    bool takeReady(Task& task);
    void workerLoop();
    void runTask(const Task& task);

    NowFunction now_;
    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    std::deque<Task> tasks_;
    std::map<std::string, Timer> timers_;
    uint64_t nextSequence_ = 0;
    uint64_t generation_ = 0;
    bool stopRequested_ = false;
    std::thread worker_;
};

} // namespace netrec

#endif
