#pragma once

#include "common/config.hpp"
#include "common/scheduler.hpp"
#include "core/assignment/assignment_engine.hpp"
#include "core/auth/authenticator.hpp"
#include "core/connection/connection_registry.hpp"
#include "core/dispatch_errors.hpp"
#include "core/presence/presence_broadcaster.hpp"
#include "core/presence/presence_store.hpp"
#include "core/queue/event_router.hpp"
#include "core/queue/offline_message_queue.hpp"

#include "dispatch.pb.h"

#include <memory>
#include <string>

namespace dispatch {
namespace server {

// 协议适配层: 把上行事件翻译成核心调用, 把结果翻译成下行事件.
// 所有方法都在事件循环线程上调用.
class DispatchGateway {
public:
    DispatchGateway(dispatch::common::Scheduler& scheduler,
                    dispatch::core::ConnectionRegistry& registry,
                    dispatch::core::PresenceBroadcaster& broadcaster,
                    dispatch::core::OfflineMessageQueue& queue,
                    dispatch::core::EventRouter& router,
                    dispatch::core::AssignmentEngine& engine,
                    dispatch::core::Authenticator& authenticator,
                    std::shared_ptr<dispatch::core::PresenceStore> presence_store,
                    const dispatch::common::AppConfig& config);

    // 订阅跨节点频道并启动各组件的定时任务
    void Start();
    void Stop();

    // 新的双工连接, 返回服务端生成的连接ID
    std::string OnConnect(std::shared_ptr<dispatch::core::OutboundChannel> channel);
    void OnEvent(const std::string& connection_id, const proto::dispatch::ClientEvent& event);
    void OnDisconnect(const std::string& connection_id);

    // 强制关闭某用户的全部连接, 返回关闭数量
    int DisconnectUser(const std::string& user_id);
    // 处理从其他节点转发来的频道消息
    void HandleRelay(const std::string& channel, const std::string& payload);

private:
    void HandleAuthenticate(const dispatch::core::Connection& connection,
                            const proto::dispatch::Authenticate& request);
    void HandleLocationUpdate(const dispatch::core::Connection& connection,
                              const proto::dispatch::LocationUpdate& update);
    void HandleAssignmentRequest(const dispatch::core::Connection& connection,
                                 const proto::dispatch::AssignmentRequest& request);
    void HandleAccept(const dispatch::core::Connection& connection, const proto::dispatch::Accept& accept);
    void HandleDecline(const dispatch::core::Connection& connection, const proto::dispatch::Decline& decline);

    void SendError(const std::string& connection_id,
                   dispatch::core::DispatchErrorCode code,
                   const dispatch::common::Status& status,
                   const std::string& action,
                   bool can_retry);
    void SendAuthError(const std::string& connection_id, const std::string& reason, bool can_retry);

private:
    dispatch::common::Scheduler& scheduler_;
    dispatch::core::ConnectionRegistry& registry_;
    dispatch::core::PresenceBroadcaster& broadcaster_;
    dispatch::core::OfflineMessageQueue& queue_;
    dispatch::core::EventRouter& router_;
    dispatch::core::AssignmentEngine& engine_;
    dispatch::core::Authenticator& authenticator_;
    std::shared_ptr<dispatch::core::PresenceStore> presence_store_;
    std::string node_id_;
    double assumed_speed_kmh_;
};

} // namespace server
} // namespace dispatch
