#pragma once

#include "common/config.hpp"
#include "common/scheduler.hpp"
#include "core/connection/connection_registry.hpp"
#include "core/presence/presence_store.hpp"

#include "dispatch.pb.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace dispatch {
namespace core {

// 根据连接增减推导用户在线状态, 只在状态变化时广播.
// 离线经过防抖窗口后才生效, 窗口内重连不产生任何事件.
class PresenceBroadcaster : public ConnectionListener {
public:
    PresenceBroadcaster(dispatch::common::Scheduler& scheduler,
                        ConnectionRegistry& registry,
                        std::shared_ptr<PresenceStore> store,
                        dispatch::common::PresenceConfig config,
                        std::string node_id);
    ~PresenceBroadcaster() override;

    // 启动在线记录的周期续期
    void Start();
    void Stop();

    void OnConnectionAdded(const Connection& connection) override;
    void OnConnectionRemoved(const Connection& connection) override;

    // 最近一次广播的状态
    bool IsOnline(const std::string& user_id) const;
    // 当前持有状态的用户数, 只包含在线或处于防抖窗口内的用户
    std::size_t TrackedUsers() const { return states_.size(); }

    // 把其他节点的在线状态变化投递给本节点的受众
    void DeliverRemote(const proto::dispatch::PresenceUpdate& update);

private:
    struct UserPresence {
        bool online = false;
        Role role = Role::kUnknown;
        std::optional<dispatch::common::Scheduler::TimerId> pending_offline;
    };

    void FinalizeOffline(const std::string& user_id);
    void Emit(const proto::dispatch::PresenceUpdate& update, const std::string& exclude_connection, bool publish);
    std::set<std::string> AudienceFor(const std::string& user_id) const;
    void ScheduleRefresh();
    void RefreshOnlineUsers();

private:
    dispatch::common::Scheduler& scheduler_;
    ConnectionRegistry& registry_;
    std::shared_ptr<PresenceStore> store_;
    dispatch::common::PresenceConfig config_;
    std::string node_id_;
    std::set<Role> audience_roles_;
    std::unordered_map<std::string, UserPresence> states_;
    std::optional<dispatch::common::Scheduler::TimerId> refresh_timer_;
};

}
}
