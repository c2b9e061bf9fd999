#pragma once

#include "core/connection/connection_registry.hpp"
#include "core/presence/presence_store.hpp"
#include "core/queue/offline_message_queue.hpp"

#include "dispatch.pb.h"

#include <memory>
#include <string>

namespace dispatch {
namespace core {

enum class DeliveryPath {
    kPushed,   // 推送到本节点连接
    kRelayed,  // 用户在其他节点在线, 经频道转发
    kQueued,   // 进入离线队列
    kDropped,  // 仅推送的事件没有在线接收方
};

// 事件投递的唯一入口: 每条事件只走推送、转发、入队中的一条路径
class EventRouter {
public:
    EventRouter(ConnectionRegistry& registry,
                OfflineMessageQueue& queue,
                std::shared_ptr<PresenceStore> presence_store,
                std::string node_id);

    // 在线则推送, 其他节点在线则转发, 否则入队
    DeliveryPath NotifyUser(const std::string& user_id, const proto::dispatch::ServerEvent& event);
    // 只推送给本节点连接, 从不入队
    DeliveryPath PushToUser(const std::string& user_id, const proto::dispatch::ServerEvent& event);
    // 推送给某角色的全部连接, 返回成功条数
    std::size_t NotifyRole(Role role, const proto::dispatch::ServerEvent& event);
    // 推送给单个连接
    bool SendToConnection(const std::string& connection_id, const proto::dispatch::ServerEvent& event);
    // 处理其他节点转发来的事件: 本地推送失败则入队
    DeliveryPath DeliverRelayed(const std::string& user_id, const proto::dispatch::ServerEvent& event);

private:
    std::size_t PushLocal(const std::string& user_id, const proto::dispatch::ServerEvent& event);

private:
    ConnectionRegistry& registry_;
    OfflineMessageQueue& queue_;
    std::shared_ptr<PresenceStore> presence_store_;
    std::string node_id_;
};

}
}
