#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace dispatch {
namespace common {

// 事件循环调度接口, 核心组件只通过它投递任务和定时器
class Scheduler {
public:
    using Clock = std::chrono::steady_clock;
    using TimerId = std::uint64_t;
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;

    // 投递一个任务, 按投递顺序执行
    virtual void Post(Task task) = 0;
    // 延迟执行任务, 返回可用于取消的定时器ID
    virtual TimerId ScheduleAfter(std::chrono::milliseconds delay, Task task) = 0;
    // 取消尚未触发的定时器, 已触发或不存在时无操作
    virtual void Cancel(TimerId id) = 0;
    virtual Clock::time_point Now() const = 0;
};

// 当前 Unix 毫秒时间戳, 用于对外事件和过期时间
std::int64_t UnixMillis();

}
}
