#include "netrec/event_loop.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace netrec {

// Upper bound on a worker sleep, so a stopped clock cannot wedge it.
static const std::chrono::milliseconds kMaxIdleWait(1000);

EventLoop::EventLoop(NowFunction now) : now_(std::move(now)) {}

EventLoop::~EventLoop() {
    stop();
}

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
        generation_++;
    }
    wakeup_.notify_one();
}

void EventLoop::postDelayed(const std::string& token, std::chrono::milliseconds delay, Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Timer timer{now_() + delay, nextSequence_++, std::move(task)};
        timers_[token] = std::move(timer);
        generation_++;
    }
    wakeup_.notify_one();
}

void EventLoop::cancel(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (timers_.erase(token) > 0) {
        generation_++;
    }
}

bool EventLoop::hasPending(const std::string& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.count(token) > 0;
}

bool EventLoop::takeReady(Task& task) {
    if (!tasks_.empty()) {
        task = std::move(tasks_.front());
        tasks_.pop_front();
        return true;
    }

    TimePoint current = now_();
    auto next = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.due > current) {
            continue;
        }
        if (next == timers_.end()
            || it->second.due < next->second.due
            || (it->second.due == next->second.due
                && it->second.sequence < next->second.sequence)) {
            next = it;
        }
    }
    if (next == timers_.end()) {
        return false;
    }
    task = std::move(next->second.task);
    timers_.erase(next);
    return true;
}

void EventLoop::runTask(const Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        spdlog::error("[EventLoop] Task failed: {}", e.what());
    }
}

std::size_t EventLoop::runReady() {
    std::size_t count = 0;
    for (;;) {
        Task task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!takeReady(task)) {
                break;
            }
        }
        runTask(task);
        count++;
    }
    return count;
}

void EventLoop::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) {
        return;
    }
    stopRequested_ = false;
    worker_ = std::thread(&EventLoop::workerLoop, this);
    spdlog::debug("[EventLoop] Worker started");
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!worker_.joinable()) {
            return;
        }
        stopRequested_ = true;
    }
    wakeup_.notify_all();
    worker_.join();
    spdlog::debug("[EventLoop] Worker stopped");
}

bool EventLoop::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_.joinable() && !stopRequested_;
}

void EventLoop::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopRequested_) {
        Task task;
        if (takeReady(task)) {
            lock.unlock();
            runTask(task);
            lock.lock();
            continue;
        }

        std::chrono::milliseconds wait = kMaxIdleWait;
        TimePoint current = now_();
        for (const auto& entry : timers_) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                entry.second.due - current);
            if (remaining < wait) {
                wait = remaining;
            }
        }
        if (wait.count() <= 0) {
            wait = std::chrono::milliseconds(1);
        }

        uint64_t seen = generation_;
        wakeup_.wait_for(lock, wait, [this, seen] {
            return stopRequested_ || generation_ != seen;
        });
    }
}

} // namespace netrec
