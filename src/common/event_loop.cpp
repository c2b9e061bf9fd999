#include "common/event_loop.hpp"

#include "common/logger.hpp"

#include <exception>

namespace dispatch {
namespace common {

std::int64_t UnixMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

EventLoop::~EventLoop() {
    Stop();
}

void EventLoop::Start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    worker_ = std::thread([this]() { Run(); });
}

void EventLoop::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    worker_id_.store(std::thread::id{});
    running_.store(false);
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.clear();
    timer_order_.clear();
    timers_.clear();
}

bool EventLoop::InLoopThread() const noexcept {
    return std::this_thread::get_id() == worker_id_.load();
}

void EventLoop::Post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

Scheduler::TimerId EventLoop::ScheduleAfter(std::chrono::milliseconds delay, Task task) {
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return 0;
        }
        id = next_timer_id_++;
        timers_.emplace(id, std::move(task));
        timer_order_.emplace(Clock::now() + delay, id);
    }
    cv_.notify_one();
    return id;
}

void EventLoop::Cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    // timer_order_ 中的残留条目在到期时因找不到任务而被跳过
    timers_.erase(id);
}

std::size_t EventLoop::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size() + timers_.size();
}

void EventLoop::Run() {
    // 循环线程在执行任何任务前记录自己的ID
    worker_id_.store(std::this_thread::get_id());
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        // 把已到期的定时器移入任务队列
        auto now = Clock::now();
        while (!timer_order_.empty() && timer_order_.begin()->first <= now) {
            auto id = timer_order_.begin()->second;
            timer_order_.erase(timer_order_.begin());
            auto it = timers_.find(id);
            if (it != timers_.end()) {
                tasks_.push_back(std::move(it->second));
                timers_.erase(it);
            }
        }

        if (tasks_.empty()) {
            if (timer_order_.empty()) {
                cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty() || !timer_order_.empty(); });
            } else {
                cv_.wait_until(lock, timer_order_.begin()->first);
            }
            continue;
        }

        auto task = std::move(tasks_.front());
        tasks_.pop_front();
        lock.unlock();
        try {
            task();
        } catch (const std::exception& ex) {
            DISPATCH_LOG_ERROR("[EventLoop] task threw: {}", ex.what());
        }
        lock.lock();
    }
}

}
}
