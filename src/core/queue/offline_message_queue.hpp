#pragma once

#include "common/config.hpp"
#include "common/scheduler.hpp"
#include "core/queue/queue_store.hpp"

#include "dispatch.pb.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dispatch {
namespace core {

// 暂存发给离线用户的事件. 入队从不失败: 主存储不可用时退回进程内存储.
class OfflineMessageQueue {
public:
    OfflineMessageQueue(dispatch::common::Scheduler& scheduler,
                        std::shared_ptr<QueueStore> primary,
                        dispatch::common::QueueConfig config);
    ~OfflineMessageQueue();

    OfflineMessageQueue(const OfflineMessageQueue&) = delete;
    OfflineMessageQueue& operator=(const OfflineMessageQueue&) = delete;

    void Start();
    void Stop();

    void Enqueue(const std::string& user_id, const proto::dispatch::ServerEvent& event);
    // 按入队顺序取出全部未过期消息, 取出即清空
    std::vector<proto::dispatch::ServerEvent> DrainAndClear(const std::string& user_id);
    // 清理过期消息, 返回清理条数
    std::size_t Sweep();

private:
    void ScheduleSweep();

private:
    dispatch::common::Scheduler& scheduler_;
    std::shared_ptr<QueueStore> primary_;
    InMemoryQueueStore fallback_;
    dispatch::common::QueueConfig config_;
    std::uint64_t next_sequence_ = 1;
    std::optional<dispatch::common::Scheduler::TimerId> sweep_timer_;
};

}
}
