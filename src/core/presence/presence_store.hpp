#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace dispatch {
namespace core {

// 跨节点频道
inline constexpr char kPresenceChannel[] = "dispatch:presence";
inline constexpr char kUserEventsChannel[] = "dispatch:user-events";

// 跨进程在线状态与消息转发的能力接口. 所有写操作幂等, 可重复执行.
class PresenceStore {
public:
    using MessageHandler = std::function<void(const std::string& channel, const std::string& payload)>;

    virtual ~PresenceStore() = default;

    // 记录用户在某个节点上在线
    virtual dispatch::common::Status SetOnline(const std::string& user_id, const std::string& node_id) = 0;
    virtual dispatch::common::Status SetOffline(const std::string& user_id, const std::string& node_id) = 0;
    // 用户是否在 node_id 以外的节点上在线
    virtual dispatch::common::StatusOr<bool> IsOnlineElsewhere(const std::string& user_id,
                                                               const std::string& node_id) = 0;

    virtual dispatch::common::Status Publish(const std::string& channel, const std::string& payload) = 0;
    // 注册频道消息回调, 回调可能在任意线程上执行
    virtual dispatch::common::Status Subscribe(MessageHandler handler) = 0;
};

// 进程内实现, 多个节点共享同一实例时可模拟跨节点转发
class InMemoryPresenceStore : public PresenceStore {
public:
    dispatch::common::Status SetOnline(const std::string& user_id, const std::string& node_id) override;
    dispatch::common::Status SetOffline(const std::string& user_id, const std::string& node_id) override;
    dispatch::common::StatusOr<bool> IsOnlineElsewhere(const std::string& user_id,
                                                       const std::string& node_id) override;
    dispatch::common::Status Publish(const std::string& channel, const std::string& payload) override;
    dispatch::common::Status Subscribe(MessageHandler handler) override;

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::set<std::string>> nodes_by_user_;
    std::vector<MessageHandler> handlers_;
};

}
}
