#pragma once

#include "common/scheduler.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace dispatch {
namespace common {

// 单线程事件循环: 所有核心状态只在循环线程上访问
class EventLoop : public Scheduler {
public:
    EventLoop() = default;
    ~EventLoop() override;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void Start();
    // 停止循环, 未执行的任务被丢弃
    void Stop();
    bool Running() const noexcept { return running_.load(); }
    bool InLoopThread() const noexcept;

    void Post(Task task) override;
    TimerId ScheduleAfter(std::chrono::milliseconds delay, Task task) override;
    void Cancel(TimerId id) override;
    Clock::time_point Now() const override { return Clock::now(); }

    // 从其他线程提交任务并等待结果
    template <typename Func>
    auto Submit(Func&& f) -> std::future<std::invoke_result_t<Func>>;

    std::size_t Pending() const;
private:
    void Run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    std::multimap<Clock::time_point, TimerId> timer_order_; // 触发时间 -> 定时器ID
    std::unordered_map<TimerId, Task> timers_;              // 定时器ID -> 任务
    TimerId next_timer_id_ = 1;
    std::atomic<bool> running_{false};
    bool stopping_ = false;
    std::thread worker_;
    std::atomic<std::thread::id> worker_id_{};
};

template <typename Func>
auto EventLoop::Submit(Func&& f) -> std::future<std::invoke_result_t<Func>> {
    using Result = std::invoke_result_t<Func>;
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Func>(f));
    auto future = task->get_future();
    Post([task]() { (*task)(); });
    return future;
}

}
}
