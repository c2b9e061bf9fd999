#include "core/presence/presence_broadcaster.hpp"

#include "common/logger.hpp"

#include <utility>

namespace dispatch {
namespace core {

PresenceBroadcaster::PresenceBroadcaster(dispatch::common::Scheduler& scheduler,
                                         ConnectionRegistry& registry,
                                         std::shared_ptr<PresenceStore> store,
                                         dispatch::common::PresenceConfig config,
                                         std::string node_id)
    : scheduler_(scheduler)
    , registry_(registry)
    , store_(std::move(store))
    , config_(std::move(config))
    , node_id_(std::move(node_id)) {
    for (const auto& name : config_.audience_roles) {
        auto role = RoleFromString(name);
        if (role.IsOk()) {
            audience_roles_.insert(role.Value());
        } else {
            DISPATCH_LOG_WARN("[Presence] Ignoring audience role '{}'", name);
        }
    }
}

PresenceBroadcaster::~PresenceBroadcaster() {
    Stop();
}

void PresenceBroadcaster::Start() {
    if (refresh_timer_ || config_.presence_ttl_seconds <= 0) {
        return;
    }
    ScheduleRefresh();
}

void PresenceBroadcaster::Stop() {
    if (refresh_timer_) {
        scheduler_.Cancel(*refresh_timer_);
        refresh_timer_.reset();
    }
    for (auto& entry : states_) {
        if (entry.second.pending_offline) {
            scheduler_.Cancel(*entry.second.pending_offline);
            entry.second.pending_offline.reset();
        }
    }
}

// 在线记录带 TTL, 以一半 TTL 为周期续期, 节点宕机后记录自然过期
void PresenceBroadcaster::ScheduleRefresh() {
    auto interval = std::chrono::milliseconds(config_.presence_ttl_seconds * 1000 / 2);
    refresh_timer_ = scheduler_.ScheduleAfter(interval, [this]() {
        RefreshOnlineUsers();
        ScheduleRefresh();
    });
}

void PresenceBroadcaster::RefreshOnlineUsers() {
    for (const auto& entry : states_) {
        if (!entry.second.online) {
            continue;
        }
        auto status = store_->SetOnline(entry.first, node_id_);
        if (!status.IsOk()) {
            DISPATCH_LOG_WARN("[Presence] DegradedCache: refresh failed for {}: {}", entry.first, status.Message());
            return;
        }
    }
}

void PresenceBroadcaster::OnConnectionAdded(const Connection& connection) {
    if (!connection.user_id) {
        return;
    }
    const std::string& user_id = *connection.user_id;
    auto& state = states_[user_id];
    state.role = connection.role;
    if (state.pending_offline) {
        // 防抖窗口内重连, 之前的离线不生效
        scheduler_.Cancel(*state.pending_offline);
        state.pending_offline.reset();
    }
    if (state.online) {
        return;
    }
    state.online = true;

    auto status = store_->SetOnline(user_id, node_id_);
    if (!status.IsOk()) {
        DISPATCH_LOG_WARN("[Presence] DegradedCache: SetOnline {} failed: {}", user_id, status.Message());
    }

    proto::dispatch::PresenceUpdate update;
    update.set_user_id(user_id);
    update.set_status(proto::dispatch::PRESENCE_ONLINE);
    update.set_role(RoleToProto(connection.role));
    update.set_timestamp(dispatch::common::UnixMillis());
    update.set_last_seen(update.timestamp());
    Emit(update, connection.connection_id, true);
}

void PresenceBroadcaster::OnConnectionRemoved(const Connection& connection) {
    if (!connection.user_id) {
        return;
    }
    const std::string user_id = *connection.user_id;
    if (registry_.IsOnline(user_id)) {
        return;
    }
    auto it = states_.find(user_id);
    if (it == states_.end() || !it->second.online || it->second.pending_offline) {
        return;
    }
    it->second.pending_offline = scheduler_.ScheduleAfter(
        std::chrono::milliseconds(config_.grace_window_ms), [this, user_id]() {
            FinalizeOffline(user_id);
        });
}

void PresenceBroadcaster::FinalizeOffline(const std::string& user_id) {
    auto it = states_.find(user_id);
    if (it == states_.end()) {
        return;
    }
    it->second.pending_offline.reset();
    if (registry_.IsOnline(user_id)) {
        return;
    }
    const bool was_online = it->second.online;
    const Role role = it->second.role;
    // 离线用户不保留状态
    states_.erase(it);
    if (!was_online) {
        return;
    }
    const std::int64_t last_seen = dispatch::common::UnixMillis();

    auto status = store_->SetOffline(user_id, node_id_);
    if (!status.IsOk()) {
        DISPATCH_LOG_WARN("[Presence] DegradedCache: SetOffline {} failed: {}", user_id, status.Message());
    }
    // 其他节点上仍有连接时不对外宣告离线
    auto elsewhere = store_->IsOnlineElsewhere(user_id, node_id_);
    if (elsewhere.IsOk() && elsewhere.Value()) {
        DISPATCH_LOG_INFO("[Presence] {} left this node but is online elsewhere", user_id);
        return;
    }

    proto::dispatch::PresenceUpdate update;
    update.set_user_id(user_id);
    update.set_status(proto::dispatch::PRESENCE_OFFLINE);
    update.set_role(RoleToProto(role));
    update.set_timestamp(last_seen);
    update.set_last_seen(last_seen);
    Emit(update, "", true);
}

bool PresenceBroadcaster::IsOnline(const std::string& user_id) const {
    auto it = states_.find(user_id);
    return it != states_.end() && it->second.online;
}

void PresenceBroadcaster::DeliverRemote(const proto::dispatch::PresenceUpdate& update) {
    Emit(update, "", false);
}

std::set<std::string> PresenceBroadcaster::AudienceFor(const std::string& user_id) const {
    std::set<std::string> audience = registry_.ConnectionsFor(user_id);
    for (auto role : audience_roles_) {
        auto ids = registry_.ConnectionsForRole(role);
        audience.insert(ids.begin(), ids.end());
    }
    if (config_.share_publicly) {
        for (auto role : {Role::kConsumer, Role::kDriver, Role::kMerchant, Role::kAdmin}) {
            auto ids = registry_.ConnectionsForRole(role);
            audience.insert(ids.begin(), ids.end());
        }
    }
    return audience;
}

// 逐个投递, 单个连接失败只记录日志, 不影响其他受众
void PresenceBroadcaster::Emit(const proto::dispatch::PresenceUpdate& update,
                               const std::string& exclude_connection,
                               bool publish) {
    proto::dispatch::ServerEvent event;
    *event.mutable_presence_update() = update;

    std::size_t delivered = 0;
    for (const auto& connection_id : AudienceFor(update.user_id())) {
        if (connection_id == exclude_connection) {
            continue;
        }
        auto channel = registry_.Channel(connection_id);
        if (!channel || !channel->Send(event)) {
            DISPATCH_LOG_WARN("[Presence] Failed to deliver presence of {} to {}", update.user_id(), connection_id);
            continue;
        }
        ++delivered;
    }

    if (publish) {
        proto::dispatch::NodeRelay relay;
        relay.set_origin_node(node_id_);
        *relay.mutable_event() = event;
        auto status = store_->Publish(kPresenceChannel, relay.SerializeAsString());
        if (!status.IsOk()) {
            DISPATCH_LOG_WARN("[Presence] DegradedCache: publish failed: {}", status.Message());
        }
    }
    DISPATCH_LOG_INFO("[Presence] {} is {} (delivered={})", update.user_id(),
                      update.status() == proto::dispatch::PRESENCE_ONLINE ? "online" : "offline", delivered);
}

}
}
