#include "server/dispatch_gateway.hpp"

#include "common/logger.hpp"
#include "geo/geo_math.hpp"

#include <utility>

namespace dispatch {
namespace server {

using dispatch::common::Status;
using dispatch::core::Connection;
using dispatch::core::DispatchErrorCode;
using dispatch::core::Role;

DispatchGateway::DispatchGateway(dispatch::common::Scheduler& scheduler,
                                 dispatch::core::ConnectionRegistry& registry,
                                 dispatch::core::PresenceBroadcaster& broadcaster,
                                 dispatch::core::OfflineMessageQueue& queue,
                                 dispatch::core::EventRouter& router,
                                 dispatch::core::AssignmentEngine& engine,
                                 dispatch::core::Authenticator& authenticator,
                                 std::shared_ptr<dispatch::core::PresenceStore> presence_store,
                                 const dispatch::common::AppConfig& config)
    : scheduler_(scheduler)
    , registry_(registry)
    , broadcaster_(broadcaster)
    , queue_(queue)
    , router_(router)
    , engine_(engine)
    , authenticator_(authenticator)
    , presence_store_(std::move(presence_store))
    , node_id_(config.server.node_id)
    , assumed_speed_kmh_(config.assignment.assumed_speed_kmh) {}

void DispatchGateway::Start() {
    registry_.Start();
    queue_.Start();
    broadcaster_.Start();
    if (presence_store_) {
        // 订阅回调可能在订阅线程上执行, 统一投递回事件循环
        auto status = presence_store_->Subscribe([this](const std::string& channel, const std::string& payload) {
            scheduler_.Post([this, channel, payload]() { HandleRelay(channel, payload); });
        });
        if (!status.IsOk()) {
            DISPATCH_LOG_WARN("[Gateway] DegradedCache: cross-node subscription unavailable: {}", status.Message());
        }
    }
    DISPATCH_LOG_INFO("[Gateway] Started on node {}", node_id_);
}

void DispatchGateway::Stop() {
    broadcaster_.Stop();
    queue_.Stop();
    registry_.Stop();
}

std::string DispatchGateway::OnConnect(std::shared_ptr<dispatch::core::OutboundChannel> channel) {
    Connection connection;
    connection.connection_id = registry_.NewConnectionId();
    connection.channel = std::move(channel);
    std::string connection_id = connection.connection_id;
    auto status = registry_.Add(std::move(connection));
    if (!status.IsOk()) {
        DISPATCH_LOG_ERROR("[Gateway] Failed to register connection: {}", status.Message());
        return "";
    }
    return connection_id;
}

void DispatchGateway::OnEvent(const std::string& connection_id, const proto::dispatch::ClientEvent& event) {
    const auto* found = registry_.Get(connection_id);
    if (!found) {
        return;
    }
    // 任意上行事件都视为活动
    registry_.Touch(connection_id);
    const Connection connection = *found;

    using Payload = proto::dispatch::ClientEvent::PayloadCase;
    switch (event.payload_case()) {
        case Payload::kAuthenticate:
            HandleAuthenticate(connection, event.authenticate());
            return;
        case Payload::kHeartbeat: {
            proto::dispatch::ServerEvent ack;
            ack.mutable_heartbeat_ack()->set_server_time(dispatch::common::UnixMillis());
            router_.SendToConnection(connection_id, ack);
            return;
        }
        case Payload::PAYLOAD_NOT_SET:
            SendError(connection_id, DispatchErrorCode::kMalformedEvent,
                      dispatch::core::FromDispatchError(DispatchErrorCode::kMalformedEvent, "Event has no payload"),
                      "unknown", false);
            return;
        default:
            break;
    }

    if (!connection.user_id) {
        SendError(connection_id, DispatchErrorCode::kAuthenticationFailed,
                  dispatch::core::FromDispatchError(DispatchErrorCode::kAuthenticationFailed, "Not authenticated"),
                  "authenticate", true);
        return;
    }

    switch (event.payload_case()) {
        case Payload::kLocationUpdate:
            HandleLocationUpdate(connection, event.location_update());
            break;
        case Payload::kAssignmentRequest:
            HandleAssignmentRequest(connection, event.assignment_request());
            break;
        case Payload::kAccept:
            HandleAccept(connection, event.accept());
            break;
        case Payload::kDecline:
            HandleDecline(connection, event.decline());
            break;
        default:
            break;
    }
}

void DispatchGateway::OnDisconnect(const std::string& connection_id) {
    auto removed = registry_.Remove(connection_id);
    if (removed) {
        DISPATCH_LOG_INFO("[Gateway] Connection {} closed (user={})", connection_id,
                          removed->user_id ? *removed->user_id : std::string("-"));
    }
}

int DispatchGateway::DisconnectUser(const std::string& user_id) {
    int closed = 0;
    for (const auto& connection_id : registry_.ConnectionsFor(user_id)) {
        auto channel = registry_.Channel(connection_id);
        registry_.Remove(connection_id);
        if (channel) {
            channel->Close();
        }
        ++closed;
    }
    DISPATCH_LOG_INFO("[Gateway] Disconnected {} connection(s) of {}", closed, user_id);
    return closed;
}

void DispatchGateway::HandleRelay(const std::string& channel, const std::string& payload) {
    proto::dispatch::NodeRelay relay;
    if (!relay.ParseFromString(payload)) {
        DISPATCH_LOG_WARN("[Gateway] Ignoring malformed relay on {}", channel);
        return;
    }
    if (relay.origin_node() == node_id_) {
        return;
    }
    if (channel == dispatch::core::kPresenceChannel && relay.event().has_presence_update()) {
        broadcaster_.DeliverRemote(relay.event().presence_update());
        return;
    }
    if (channel == dispatch::core::kUserEventsChannel && !relay.target_user_id().empty()) {
        router_.DeliverRelayed(relay.target_user_id(), relay.event());
    }
}

void DispatchGateway::HandleAuthenticate(const Connection& connection,
                                         const proto::dispatch::Authenticate& request) {
    auto identity = request.reconnect_token().empty()
                        ? authenticator_.Authenticate(request.token())
                        : authenticator_.Resume(request.reconnect_token());
    if (!identity.IsOk()) {
        DISPATCH_LOG_WARN("[Gateway] Authentication failed on {}: {}",
                          connection.connection_id, identity.GetStatus().Message());
        SendAuthError(connection.connection_id, identity.GetStatus().Message(), true);
        return;
    }
    const auto& who = identity.Value();

    Connection binding;
    binding.connection_id = connection.connection_id;
    binding.user_id = who.user_id;
    binding.role = who.role;
    auto status = registry_.Add(std::move(binding));
    if (!status.IsOk()) {
        SendAuthError(connection.connection_id, status.Message(), false);
        return;
    }

    // 绑定成功后才签发重连令牌
    std::string reconnect_token;
    auto issued = authenticator_.IssueReconnectToken(who);
    if (issued.IsOk()) {
        reconnect_token = issued.Value();
        Connection with_token;
        with_token.connection_id = connection.connection_id;
        with_token.reconnect_token = reconnect_token;
        auto recorded = registry_.Add(std::move(with_token));
        if (!recorded.IsOk()) {
            DISPATCH_LOG_WARN("[Gateway] Reconnect token not recorded on {}: {}",
                              connection.connection_id, recorded.Message());
        }
    } else {
        DISPATCH_LOG_WARN("[Gateway] Reconnect token not issued for {}: {}", who.user_id, issued.GetStatus().Message());
    }

    // 绑定后立刻取出离线消息, 先于任何实时事件发给该连接
    auto queued = queue_.DrainAndClear(who.user_id);

    proto::dispatch::ServerEvent reply;
    auto* authenticated = reply.mutable_authenticated();
    authenticated->set_user_id(who.user_id);
    authenticated->set_role(dispatch::core::RoleToProto(who.role));
    authenticated->set_queued_count(static_cast<int32_t>(queued.size()));
    authenticated->set_connection_id(connection.connection_id);
    authenticated->set_reconnect_token(reconnect_token);
    authenticated->set_server_time(dispatch::common::UnixMillis());
    router_.SendToConnection(connection.connection_id, reply);

    if (!queued.empty()) {
        proto::dispatch::ServerEvent flush;
        for (auto& event : queued) {
            *flush.mutable_queued_message_flush()->add_events() = std::move(event);
        }
        router_.SendToConnection(connection.connection_id, flush);
    }
    DISPATCH_LOG_INFO("[Gateway] {} authenticated as {} ({}) queued={}", connection.connection_id,
                      who.user_id, dispatch::core::RoleToString(who.role), queued.size());
}

void DispatchGateway::HandleLocationUpdate(const Connection& connection,
                                           const proto::dispatch::LocationUpdate& update) {
    if (connection.role != Role::kDriver) {
        SendError(connection.connection_id, DispatchErrorCode::kPermissionDenied,
                  dispatch::core::FromDispatchError(DispatchErrorCode::kPermissionDenied,
                                                    "Only drivers can send location updates"),
                  "location_update", false);
        return;
    }
    auto point = dispatch::geo::GeoPoint::Create(update.latitude(), update.longitude());
    if (!point.IsOk()) {
        SendError(connection.connection_id, DispatchErrorCode::kInvalidLocation, point.GetStatus(),
                  "location_update", false);
        return;
    }
    const std::string& driver_id = *connection.user_id;

    dispatch::core::DriverLocation location;
    location.point = point.Value();
    if (update.has_heading()) {
        location.heading = update.heading();
    }
    if (update.has_speed()) {
        location.speed_kmh = update.speed();
    }
    location.updated_at_ms = dispatch::common::UnixMillis();
    // 位置缓存失败不影响实时推送
    auto cache_status = engine_.UpdateDriverLocation(driver_id, location);
    if (!cache_status.IsOk()) {
        DISPATCH_LOG_WARN("[Gateway] DegradedCache: location of {} not cached: {}", driver_id, cache_status.Message());
    }

    proto::dispatch::ServerEvent event;
    auto* tracking = event.mutable_driver_location_update();
    tracking->set_request_id(update.request_id());
    tracking->set_driver_id(driver_id);
    tracking->mutable_location()->set_latitude(update.latitude());
    tracking->mutable_location()->set_longitude(update.longitude());
    tracking->set_timestamp(location.updated_at_ms);

    if (!update.request_id().empty()) {
        auto request = engine_.RequestStatus(update.request_id());
        if (request.IsOk()) {
            const auto& delivery = request.Value();
            const bool held = delivery.driver_id && *delivery.driver_id == driver_id &&
                              (delivery.state == dispatch::core::RequestState::kClaimed ||
                               delivery.state == dispatch::core::RequestState::kAccepted);
            if (held && !delivery.requester_id.empty()) {
                const auto& target = delivery.dropoff ? *delivery.dropoff : delivery.pickup;
                const double distance = dispatch::geo::DistanceKm(location.point, target);
                const double speed = update.has_speed() && update.speed() > dispatch::geo::kMinAssumedSpeedKmh
                                         ? update.speed()
                                         : assumed_speed_kmh_;
                tracking->set_distance_km(distance);
                tracking->set_eta_minutes(dispatch::geo::EtaMinutes(distance, speed));
                // 实时追踪只推送, 不进入离线队列
                router_.PushToUser(delivery.requester_id, event);
            }
        }
    }

    tracking->set_online_drivers(static_cast<int32_t>(registry_.OnlineUsersWithRole(Role::kDriver)));
    router_.NotifyRole(Role::kAdmin, event);
}

void DispatchGateway::HandleAssignmentRequest(const Connection& connection,
                                              const proto::dispatch::AssignmentRequest& request) {
    if (connection.role != Role::kConsumer && connection.role != Role::kMerchant && connection.role != Role::kAdmin) {
        SendError(connection.connection_id, DispatchErrorCode::kPermissionDenied,
                  dispatch::core::FromDispatchError(DispatchErrorCode::kPermissionDenied,
                                                    "Role cannot request assignments"),
                  "assignment_request", false);
        return;
    }
    if (request.request_id().empty()) {
        SendError(connection.connection_id, DispatchErrorCode::kMalformedEvent,
                  dispatch::core::FromDispatchError(DispatchErrorCode::kMalformedEvent, "request_id is required"),
                  "assignment_request", false);
        return;
    }
    auto point = dispatch::geo::GeoPoint::Create(request.latitude(), request.longitude());
    if (!point.IsOk()) {
        SendError(connection.connection_id, DispatchErrorCode::kInvalidLocation, point.GetStatus(),
                  "assignment_request", false);
        return;
    }

    dispatch::core::AssignCommand command;
    command.request_id = request.request_id();
    command.location = point.Value();
    command.requester_id = *connection.user_id;
    const std::string connection_id = connection.connection_id;
    engine_.Assign(std::move(command), [this, connection_id](const dispatch::core::AssignmentOutcome& outcome) {
        // 成功结果已经由引擎通知下单方, 失败只回给发起的连接
        if (outcome.assigned) {
            return;
        }
        proto::dispatch::ServerEvent event;
        *event.mutable_assignment_result() = dispatch::core::OutcomeToProto(outcome);
        router_.SendToConnection(connection_id, event);
    });
}

void DispatchGateway::HandleAccept(const Connection& connection, const proto::dispatch::Accept& accept) {
    if (connection.role != Role::kDriver) {
        SendError(connection.connection_id, DispatchErrorCode::kPermissionDenied,
                  dispatch::core::FromDispatchError(DispatchErrorCode::kPermissionDenied, "Only drivers can accept"),
                  "accept", false);
        return;
    }
    auto status = engine_.Accept(accept.request_id(), *connection.user_id);
    if (!status.IsOk()) {
        SendError(connection.connection_id, dispatch::core::ToDispatchError(status), status, "accept",
                  status.Code() == dispatch::common::StatusCode::kUnavailable);
    }
}

void DispatchGateway::HandleDecline(const Connection& connection, const proto::dispatch::Decline& decline) {
    if (connection.role != Role::kDriver) {
        SendError(connection.connection_id, DispatchErrorCode::kPermissionDenied,
                  dispatch::core::FromDispatchError(DispatchErrorCode::kPermissionDenied, "Only drivers can decline"),
                  "decline", false);
        return;
    }
    std::string requester_id;
    auto request = engine_.RequestStatus(decline.request_id());
    if (request.IsOk()) {
        requester_id = request.Value().requester_id;
    }
    auto status = engine_.Release(decline.request_id(), *connection.user_id,
                                  [this, requester_id](const dispatch::core::AssignmentOutcome& outcome) {
        // 重新派单失败时告知下单方
        if (outcome.assigned || requester_id.empty()) {
            return;
        }
        proto::dispatch::ServerEvent event;
        *event.mutable_assignment_result() = dispatch::core::OutcomeToProto(outcome);
        router_.NotifyUser(requester_id, event);
    });
    if (!status.IsOk()) {
        SendError(connection.connection_id, dispatch::core::ToDispatchError(status), status, "decline",
                  status.Code() == dispatch::common::StatusCode::kUnavailable);
    }
}

void DispatchGateway::SendError(const std::string& connection_id,
                                DispatchErrorCode code,
                                const Status& status,
                                const std::string& action,
                                bool can_retry) {
    proto::dispatch::ServerEvent event;
    auto* error = event.mutable_error();
    dispatch::core::ErrorToProto(code, status, error->mutable_error());
    error->set_action(action);
    error->set_can_retry(can_retry);
    router_.SendToConnection(connection_id, event);
}

void DispatchGateway::SendAuthError(const std::string& connection_id, const std::string& reason, bool can_retry) {
    proto::dispatch::ServerEvent event;
    event.mutable_auth_error()->set_reason(reason);
    event.mutable_auth_error()->set_can_retry(can_retry);
    router_.SendToConnection(connection_id, event);
}

} // namespace server
} // namespace dispatch
