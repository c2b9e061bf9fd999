#pragma once

#include "cache/redis_client.hpp"
#include "common/config.hpp"
#include "common/scheduler.hpp"
#include "core/assignment/assignment_engine.hpp"
#include "core/assignment/dispatch_repository.hpp"
#include "core/assignment/location_cache.hpp"
#include "core/auth/authenticator.hpp"
#include "core/auth/session_repository.hpp"
#include "core/connection/connection_registry.hpp"
#include "core/presence/presence_broadcaster.hpp"
#include "core/presence/presence_store.hpp"
#include "core/queue/event_router.hpp"
#include "core/queue/offline_message_queue.hpp"
#include "core/queue/queue_store.hpp"
#include "server/dispatch_gateway.hpp"

#include <memory>

namespace dispatch {
namespace server {

// 外部依赖的具体实现, Redis/MySQL 不可用时退回进程内实现
struct Backends {
    std::shared_ptr<dispatch::cache::RedisClient> redis;
    std::shared_ptr<dispatch::core::DispatchRepository> repository;
    std::shared_ptr<dispatch::core::SessionRepository> sessions;
    std::shared_ptr<dispatch::core::PresenceStore> presence;
    std::shared_ptr<dispatch::core::QueueStore> queue;
    std::shared_ptr<dispatch::core::LocationCache> locations;
};

Backends CreateBackends(const dispatch::common::AppConfig& config);
// 全部使用进程内实现, 单节点或测试使用
Backends CreateInMemoryBackends(const dispatch::common::AppConfig& config);

// 一个节点上全部组件的所有者, 负责按依赖顺序构造和连接
class DispatchContext {
public:
    DispatchContext(dispatch::common::Scheduler& scheduler,
                    const dispatch::common::AppConfig& config,
                    Backends backends);

    DispatchContext(const DispatchContext&) = delete;
    DispatchContext& operator=(const DispatchContext&) = delete;

    DispatchGateway& Gateway() { return *gateway_; }
    dispatch::core::ConnectionRegistry& Registry() { return *registry_; }
    dispatch::core::AssignmentEngine& Engine() { return *engine_; }
    dispatch::core::PresenceBroadcaster& Broadcaster() { return *broadcaster_; }
    const Backends& GetBackends() const { return backends_; }

private:
    dispatch::common::AppConfig config_;
    Backends backends_;
    std::unique_ptr<dispatch::core::ConnectionRegistry> registry_;
    std::unique_ptr<dispatch::core::PresenceBroadcaster> broadcaster_;
    std::unique_ptr<dispatch::core::OfflineMessageQueue> queue_;
    std::unique_ptr<dispatch::core::EventRouter> router_;
    std::unique_ptr<dispatch::core::AssignmentEngine> engine_;
    std::unique_ptr<dispatch::core::Authenticator> authenticator_;
    std::unique_ptr<DispatchGateway> gateway_;
};

} // namespace server
} // namespace dispatch
