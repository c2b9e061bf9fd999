#include "core/queue/event_router.hpp"

#include "common/logger.hpp"

#include <utility>

namespace dispatch {
namespace core {

EventRouter::EventRouter(ConnectionRegistry& registry,
                         OfflineMessageQueue& queue,
                         std::shared_ptr<PresenceStore> presence_store,
                         std::string node_id)
    : registry_(registry)
    , queue_(queue)
    , presence_store_(std::move(presence_store))
    , node_id_(std::move(node_id)) {}

DeliveryPath EventRouter::NotifyUser(const std::string& user_id, const proto::dispatch::ServerEvent& event) {
    if (registry_.IsOnline(user_id)) {
        if (PushLocal(user_id, event) > 0) {
            return DeliveryPath::kPushed;
        }
        // 所有连接都写失败, 视为离线
        queue_.Enqueue(user_id, event);
        return DeliveryPath::kQueued;
    }

    if (presence_store_) {
        auto elsewhere = presence_store_->IsOnlineElsewhere(user_id, node_id_);
        if (elsewhere.IsOk() && elsewhere.Value()) {
            proto::dispatch::NodeRelay relay;
            relay.set_origin_node(node_id_);
            relay.set_target_user_id(user_id);
            *relay.mutable_event() = event;
            auto status = presence_store_->Publish(kUserEventsChannel, relay.SerializeAsString());
            if (status.IsOk()) {
                return DeliveryPath::kRelayed;
            }
            DISPATCH_LOG_WARN("[Router] DegradedCache: relay to {} failed, queueing: {}", user_id, status.Message());
        } else if (!elsewhere.IsOk()) {
            DISPATCH_LOG_WARN("[Router] DegradedCache: presence lookup for {} failed: {}",
                              user_id, elsewhere.GetStatus().Message());
        }
    }

    queue_.Enqueue(user_id, event);
    return DeliveryPath::kQueued;
}

DeliveryPath EventRouter::PushToUser(const std::string& user_id, const proto::dispatch::ServerEvent& event) {
    return PushLocal(user_id, event) > 0 ? DeliveryPath::kPushed : DeliveryPath::kDropped;
}

std::size_t EventRouter::NotifyRole(Role role, const proto::dispatch::ServerEvent& event) {
    std::size_t delivered = 0;
    for (const auto& connection_id : registry_.ConnectionsForRole(role)) {
        if (SendToConnection(connection_id, event)) {
            ++delivered;
        }
    }
    return delivered;
}

bool EventRouter::SendToConnection(const std::string& connection_id, const proto::dispatch::ServerEvent& event) {
    auto channel = registry_.Channel(connection_id);
    if (!channel) {
        return false;
    }
    if (!channel->Send(event)) {
        DISPATCH_LOG_WARN("[Router] Push to {} failed", connection_id);
        return false;
    }
    return true;
}

DeliveryPath EventRouter::DeliverRelayed(const std::string& user_id, const proto::dispatch::ServerEvent& event) {
    if (PushLocal(user_id, event) > 0) {
        return DeliveryPath::kPushed;
    }
    queue_.Enqueue(user_id, event);
    return DeliveryPath::kQueued;
}

std::size_t EventRouter::PushLocal(const std::string& user_id, const proto::dispatch::ServerEvent& event) {
    std::size_t delivered = 0;
    for (const auto& connection_id : registry_.ConnectionsFor(user_id)) {
        if (SendToConnection(connection_id, event)) {
            ++delivered;
        }
    }
    return delivered;
}

}
}
