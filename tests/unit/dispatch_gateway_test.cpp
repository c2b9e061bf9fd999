#include "server/dispatch_context.hpp"
#include "server/dispatch_gateway.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>

using dispatch::core::DispatchErrorCode;
using dispatch::core::DriverCandidate;
using dispatch::core::InMemoryDispatchRepository;
using dispatch::core::RequestState;
using dispatch::server::DispatchContext;
using testutils::ManualScheduler;
using testutils::RecordingChannel;
using Payload = proto::dispatch::ServerEvent::PayloadCase;

namespace {

constexpr double kPickupLat = 31.2304;
constexpr double kPickupLng = 121.4737;

struct Client {
    std::string connection_id;
    std::shared_ptr<RecordingChannel> channel;
};

dispatch::common::AppConfig TestConfig() {
    dispatch::common::AppConfig config;
    config.server.node_id = "node-a";
    config.auth.allow_dev_tokens = true;
    config.assignment.max_radius_km = 10.0;
    return config;
}

int ErrorCode(const proto::dispatch::ServerEvent* event) {
    return event ? event->error().error().code() : -1;
}

class DispatchGatewayTest : public ::testing::Test {
protected:
    DispatchGatewayTest()
        : config_(TestConfig())
        , context_(scheduler_, config_, dispatch::server::CreateInMemoryBackends(config_)) {
        repo_ = std::dynamic_pointer_cast<InMemoryDispatchRepository>(context_.GetBackends().repository);
        context_.Gateway().Start();
    }

    ~DispatchGatewayTest() override { context_.Gateway().Stop(); }

    Client Open() {
        Client client;
        client.channel = std::make_shared<RecordingChannel>();
        client.connection_id = context_.Gateway().OnConnect(client.channel);
        return client;
    }

    void Send(const Client& client, const proto::dispatch::ClientEvent& event) {
        context_.Gateway().OnEvent(client.connection_id, event);
        scheduler_.RunPending();
    }

    void Authenticate(const Client& client, const std::string& token, const std::string& reconnect = "") {
        proto::dispatch::ClientEvent event;
        event.mutable_authenticate()->set_token(token);
        event.mutable_authenticate()->set_reconnect_token(reconnect);
        Send(client, event);
    }

    Client Login(const std::string& token) {
        auto client = Open();
        Authenticate(client, token);
        return client;
    }

    void RequestAssignment(const Client& client, const std::string& request_id,
                           double lat = kPickupLat, double lng = kPickupLng) {
        proto::dispatch::ClientEvent event;
        event.mutable_assignment_request()->set_request_id(request_id);
        event.mutable_assignment_request()->set_latitude(lat);
        event.mutable_assignment_request()->set_longitude(lng);
        Send(client, event);
    }

    void AddDriver(const std::string& id, double lat_offset) {
        DriverCandidate driver;
        driver.driver_id = id;
        driver.location = dispatch::geo::GeoPoint::Create(kPickupLat + lat_offset, kPickupLng).Value();
        driver.rating = 4.5;
        driver.online = true;
        driver.available = true;
        driver.verified = true;
        repo_->UpsertDriver(driver);
    }

    ManualScheduler scheduler_;
    dispatch::common::AppConfig config_;
    DispatchContext context_;
    std::shared_ptr<InMemoryDispatchRepository> repo_;
};

} // namespace

TEST_F(DispatchGatewayTest, AuthenticateBindsConnection) {
    auto client = Login("driver:d-1");
    const auto* reply = client.channel->Last(Payload::kAuthenticated);
    ASSERT_NE(reply, nullptr);
    EXPECT_EQ(reply->authenticated().user_id(), "d-1");
    EXPECT_EQ(reply->authenticated().role(), proto::common::ROLE_DRIVER);
    EXPECT_EQ(reply->authenticated().connection_id(), client.connection_id);
    EXPECT_EQ(reply->authenticated().queued_count(), 0);
    EXPECT_EQ(reply->authenticated().reconnect_token().size(), 64u);
    EXPECT_TRUE(context_.Registry().IsOnline("d-1"));
}

TEST_F(DispatchGatewayTest, BadTokenGetsRetryableAuthError) {
    auto client = Login("not-a-token");
    const auto* reply = client.channel->Last(Payload::kAuthError);
    ASSERT_NE(reply, nullptr);
    EXPECT_TRUE(reply->auth_error().can_retry());
    EXPECT_FALSE(context_.Registry().IsOnline("not-a-token"));
}

TEST_F(DispatchGatewayTest, RebindingToAnotherUserIsRejected) {
    auto sessions = std::dynamic_pointer_cast<dispatch::core::InMemorySessionRepository>(
        context_.GetBackends().sessions);
    ASSERT_NE(sessions, nullptr);

    auto client = Login("consumer:c-1");
    const std::string token = client.channel->Last(Payload::kAuthenticated)->authenticated().reconnect_token();
    const auto* bound = context_.Registry().Get(client.connection_id);
    ASSERT_NE(bound, nullptr);
    EXPECT_EQ(bound->reconnect_token, token);
    EXPECT_EQ(sessions->SessionCount(), 1u);

    Authenticate(client, "consumer:c-2");
    const auto* reply = client.channel->Last(Payload::kAuthError);
    ASSERT_NE(reply, nullptr);
    EXPECT_FALSE(reply->auth_error().can_retry());
    EXPECT_FALSE(context_.Registry().IsOnline("c-2"));
    // 被拒绝的绑定不留下任何重连令牌
    EXPECT_EQ(sessions->SessionCount(), 1u);
}

TEST_F(DispatchGatewayTest, ReconnectTokenResumesSession) {
    auto first = Login("merchant:m-1");
    const std::string token = first.channel->Last(Payload::kAuthenticated)->authenticated().reconnect_token();

    auto second = Open();
    Authenticate(second, "", token);
    const auto* reply = second.channel->Last(Payload::kAuthenticated);
    ASSERT_NE(reply, nullptr);
    EXPECT_EQ(reply->authenticated().user_id(), "m-1");
    EXPECT_EQ(reply->authenticated().role(), proto::common::ROLE_MERCHANT);
    EXPECT_EQ(context_.Registry().ConnectionsFor("m-1").size(), 2u);

    // 已用过的重连令牌失效
    auto third = Open();
    Authenticate(third, "", token);
    EXPECT_NE(third.channel->Last(Payload::kAuthError), nullptr);
    EXPECT_EQ(third.channel->Last(Payload::kAuthenticated), nullptr);
}

TEST_F(DispatchGatewayTest, EventsBeforeAuthenticationAreRejected) {
    auto client = Open();
    proto::dispatch::ClientEvent event;
    event.mutable_accept()->set_request_id("r-1");
    Send(client, event);

    const auto* error = client.channel->Last(Payload::kError);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(ErrorCode(error), static_cast<int>(DispatchErrorCode::kAuthenticationFailed));
    EXPECT_EQ(error->error().action(), "authenticate");
    EXPECT_TRUE(error->error().can_retry());
}

TEST_F(DispatchGatewayTest, EmptyEventIsMalformed) {
    auto client = Login("consumer:c-1");
    Send(client, proto::dispatch::ClientEvent());
    const auto* error = client.channel->Last(Payload::kError);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(ErrorCode(error), static_cast<int>(DispatchErrorCode::kMalformedEvent));
}

TEST_F(DispatchGatewayTest, HeartbeatIsAcknowledgedWithoutAuthentication) {
    auto client = Open();
    proto::dispatch::ClientEvent event;
    event.mutable_heartbeat();
    Send(client, event);
    const auto* ack = client.channel->Last(Payload::kHeartbeatAck);
    ASSERT_NE(ack, nullptr);
    EXPECT_GT(ack->heartbeat_ack().server_time(), 0);
}

TEST_F(DispatchGatewayTest, RoleChecks) {
    auto consumer = Login("consumer:c-1");
    proto::dispatch::ClientEvent location;
    location.mutable_location_update()->set_latitude(kPickupLat);
    location.mutable_location_update()->set_longitude(kPickupLng);
    Send(consumer, location);
    EXPECT_EQ(ErrorCode(consumer.channel->Last(Payload::kError)),
              static_cast<int>(DispatchErrorCode::kPermissionDenied));

    auto driver = Login("driver:d-1");
    RequestAssignment(driver, "r-1");
    EXPECT_EQ(ErrorCode(driver.channel->Last(Payload::kError)),
              static_cast<int>(DispatchErrorCode::kPermissionDenied));

    location.mutable_location_update()->set_latitude(123.0);
    Send(driver, location);
    EXPECT_EQ(ErrorCode(driver.channel->Last(Payload::kError)),
              static_cast<int>(DispatchErrorCode::kInvalidLocation));
}

TEST_F(DispatchGatewayTest, AssignmentRequestValidation) {
    auto consumer = Login("consumer:c-1");
    RequestAssignment(consumer, "");
    EXPECT_EQ(ErrorCode(consumer.channel->Last(Payload::kError)),
              static_cast<int>(DispatchErrorCode::kMalformedEvent));

    RequestAssignment(consumer, "r-1", 0.0, 200.0);
    EXPECT_EQ(ErrorCode(consumer.channel->Last(Payload::kError)),
              static_cast<int>(DispatchErrorCode::kInvalidLocation));
}

TEST_F(DispatchGatewayTest, NoDriverIsReportedToRequestingConnection) {
    auto consumer = Login("consumer:c-1");
    auto other_tab = Login("consumer:c-1");
    RequestAssignment(consumer, "r-1");

    const auto* result = consumer.channel->Last(Payload::kAssignmentResult);
    ASSERT_NE(result, nullptr);
    EXPECT_FALSE(result->assignment_result().has_driver_id());
    EXPECT_EQ(result->assignment_result().reason(), "no eligible driver");
    EXPECT_EQ(other_tab.channel->Count(Payload::kAssignmentResult), 0u);
}

TEST_F(DispatchGatewayTest, AssignAcceptAndTrack) {
    AddDriver("d-1", 0.01);
    auto admin = Login("admin:ops");
    auto driver = Login("driver:d-1");
    auto consumer = Login("consumer:c-1");

    RequestAssignment(consumer, "r-1");
    const auto* offered = driver.channel->Last(Payload::kAssignmentResult);
    ASSERT_NE(offered, nullptr);
    EXPECT_EQ(offered->assignment_result().driver_id(), "d-1");
    const auto* to_consumer = consumer.channel->Last(Payload::kAssignmentResult);
    ASSERT_NE(to_consumer, nullptr);
    EXPECT_TRUE(to_consumer->assignment_result().has_eta_minutes());
    EXPECT_EQ(consumer.channel->Count(Payload::kAssignmentResult), 1u);

    proto::dispatch::ClientEvent accept;
    accept.mutable_accept()->set_request_id("r-1");
    Send(driver, accept);
    const auto* update = consumer.channel->Last(Payload::kAssignmentUpdate);
    ASSERT_NE(update, nullptr);
    EXPECT_EQ(update->assignment_update().status(), "accepted");
    EXPECT_EQ(repo_->GetRequest("r-1").Value().state, RequestState::kAccepted);

    proto::dispatch::ClientEvent location;
    location.mutable_location_update()->set_latitude(kPickupLat + 0.005);
    location.mutable_location_update()->set_longitude(kPickupLng);
    location.mutable_location_update()->set_request_id("r-1");
    Send(driver, location);

    const auto* tracking = consumer.channel->Last(Payload::kDriverLocationUpdate);
    ASSERT_NE(tracking, nullptr);
    EXPECT_EQ(tracking->driver_location_update().driver_id(), "d-1");
    EXPECT_NEAR(tracking->driver_location_update().distance_km(), 0.556, 0.01);
    EXPECT_GT(tracking->driver_location_update().eta_minutes(), 0.0);

    const auto* admin_view = admin.channel->Last(Payload::kDriverLocationUpdate);
    ASSERT_NE(admin_view, nullptr);
    EXPECT_EQ(admin_view->driver_location_update().online_drivers(), 1);
}

TEST_F(DispatchGatewayTest, TrackingIsNotSentForUnheldRequest) {
    AddDriver("d-1", 0.01);
    auto driver = Login("driver:d-1");
    auto consumer = Login("consumer:c-1");
    RequestAssignment(consumer, "r-1");

    auto other = Login("driver:d-2");
    proto::dispatch::ClientEvent location;
    location.mutable_location_update()->set_latitude(kPickupLat);
    location.mutable_location_update()->set_longitude(kPickupLng);
    location.mutable_location_update()->set_request_id("r-1");
    Send(other, location);
    EXPECT_EQ(consumer.channel->Count(Payload::kDriverLocationUpdate), 0u);
}

TEST_F(DispatchGatewayTest, AcceptOfUnknownRequestFails) {
    auto driver = Login("driver:d-1");
    proto::dispatch::ClientEvent accept;
    accept.mutable_accept()->set_request_id("missing");
    Send(driver, accept);
    const auto* error = driver.channel->Last(Payload::kError);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(ErrorCode(error), static_cast<int>(DispatchErrorCode::kRequestNotFound));
    EXPECT_EQ(error->error().action(), "accept");
    EXPECT_FALSE(error->error().can_retry());
}

TEST_F(DispatchGatewayTest, DeclineReassignsOrNotifiesRequester) {
    AddDriver("d-1", 0.01);
    auto driver = Login("driver:d-1");
    auto consumer = Login("consumer:c-1");
    RequestAssignment(consumer, "r-1");
    ASSERT_EQ(*repo_->GetRequest("r-1").Value().driver_id, "d-1");

    proto::dispatch::ClientEvent decline;
    decline.mutable_decline()->set_request_id("r-1");
    Send(driver, decline);

    // 没有其他司机, 下单方收到失败结果
    const auto* result = consumer.channel->Last(Payload::kAssignmentResult);
    ASSERT_NE(result, nullptr);
    EXPECT_FALSE(result->assignment_result().has_driver_id());
    EXPECT_TRUE(repo_->GetDriver("d-1").Value().available);
    EXPECT_EQ(repo_->GetRequest("r-1").Value().state, RequestState::kUnassigned);

    Send(driver, decline);
    EXPECT_EQ(ErrorCode(driver.channel->Last(Payload::kError)),
              static_cast<int>(DispatchErrorCode::kPermissionDenied));
}

TEST_F(DispatchGatewayTest, OfflineEventsAreFlushedOnAuthenticate) {
    AddDriver("d-1", 0.01);
    auto consumer = Login("consumer:c-1");
    RequestAssignment(consumer, "r-1");
    ASSERT_EQ(*repo_->GetRequest("r-1").Value().driver_id, "d-1");

    auto driver = Login("driver:d-1");
    ASSERT_GE(driver.channel->events.size(), 2u);
    const auto* reply = driver.channel->Last(Payload::kAuthenticated);
    ASSERT_NE(reply, nullptr);
    EXPECT_EQ(reply->authenticated().queued_count(), 1);

    const auto* flush = driver.channel->Last(Payload::kQueuedMessageFlush);
    ASSERT_NE(flush, nullptr);
    ASSERT_EQ(flush->queued_message_flush().events_size(), 1);
    EXPECT_EQ(flush->queued_message_flush().events(0).assignment_result().request_id(), "r-1");

    // 队列已清空, 重新登录不再重复投递
    auto again = Login("driver:d-1");
    EXPECT_EQ(again.channel->Last(Payload::kAuthenticated)->authenticated().queued_count(), 0);
}

TEST_F(DispatchGatewayTest, DisconnectUserClosesAllConnections) {
    auto first = Login("consumer:c-1");
    auto second = Login("consumer:c-1");
    EXPECT_EQ(context_.Gateway().DisconnectUser("c-1"), 2);
    EXPECT_TRUE(first.channel->closed);
    EXPECT_TRUE(second.channel->closed);
    EXPECT_FALSE(context_.Registry().IsOnline("c-1"));
    EXPECT_EQ(context_.Gateway().DisconnectUser("c-1"), 0);
}

TEST_F(DispatchGatewayTest, OnDisconnectRemovesConnection) {
    auto client = Login("consumer:c-1");
    context_.Gateway().OnDisconnect(client.connection_id);
    EXPECT_FALSE(context_.Registry().IsOnline("c-1"));
    // 断开后的事件被忽略
    Send(client, proto::dispatch::ClientEvent());
    EXPECT_EQ(client.channel->Count(Payload::kError), 0u);
}

TEST_F(DispatchGatewayTest, RelayedEventsReachLocalUser) {
    auto consumer = Login("consumer:c-1");

    proto::dispatch::NodeRelay relay;
    relay.set_origin_node("node-b");
    relay.set_target_user_id("c-1");
    relay.mutable_event()->mutable_assignment_update()->set_request_id("r-9");
    context_.Gateway().HandleRelay(dispatch::core::kUserEventsChannel, relay.SerializeAsString());
    EXPECT_EQ(consumer.channel->Count(Payload::kAssignmentUpdate), 1u);

    relay.set_origin_node("node-a");
    context_.Gateway().HandleRelay(dispatch::core::kUserEventsChannel, relay.SerializeAsString());
    EXPECT_EQ(consumer.channel->Count(Payload::kAssignmentUpdate), 1u);

    context_.Gateway().HandleRelay(dispatch::core::kUserEventsChannel, "\xff\xff garbage");
    EXPECT_EQ(consumer.channel->Count(Payload::kAssignmentUpdate), 1u);
}

TEST_F(DispatchGatewayTest, RemotePresenceReachesAdmins) {
    auto admin = Login("admin:ops");
    const auto before = admin.channel->Count(Payload::kPresenceUpdate);

    proto::dispatch::NodeRelay relay;
    relay.set_origin_node("node-b");
    auto* presence = relay.mutable_event()->mutable_presence_update();
    presence->set_user_id("d-7");
    presence->set_status(proto::dispatch::PRESENCE_ONLINE);
    presence->set_role(proto::common::ROLE_DRIVER);
    context_.Gateway().HandleRelay(dispatch::core::kPresenceChannel, relay.SerializeAsString());

    EXPECT_EQ(admin.channel->Count(Payload::kPresenceUpdate), before + 1);
    EXPECT_EQ(admin.channel->Last(Payload::kPresenceUpdate)->presence_update().user_id(), "d-7");
}

TEST(DispatchGatewayClusterTest, EventsRelayBetweenNodes) {
    ManualScheduler scheduler;
    auto config_a = TestConfig();
    auto config_b = TestConfig();
    config_b.server.node_id = "node-b";
    auto shared = dispatch::server::CreateInMemoryBackends(config_a);
    DispatchContext node_a(scheduler, config_a, shared);
    DispatchContext node_b(scheduler, config_b, shared);
    node_a.Gateway().Start();
    node_b.Gateway().Start();

    auto repo = std::dynamic_pointer_cast<InMemoryDispatchRepository>(shared.repository);
    DriverCandidate driver;
    driver.driver_id = "d-1";
    driver.location = dispatch::geo::GeoPoint::Create(kPickupLat + 0.01, kPickupLng).Value();
    driver.online = true;
    driver.available = true;
    driver.verified = true;
    repo->UpsertDriver(driver);

    auto login = [&scheduler](DispatchContext& node, const std::string& token) {
        Client client;
        client.channel = std::make_shared<RecordingChannel>();
        client.connection_id = node.Gateway().OnConnect(client.channel);
        proto::dispatch::ClientEvent event;
        event.mutable_authenticate()->set_token(token);
        node.Gateway().OnEvent(client.connection_id, event);
        scheduler.RunPending();
        return client;
    };
    auto driver_client = login(node_a, "driver:d-1");
    auto consumer_client = login(node_b, "consumer:c-1");

    proto::dispatch::ClientEvent request;
    request.mutable_assignment_request()->set_request_id("r-1");
    request.mutable_assignment_request()->set_latitude(kPickupLat);
    request.mutable_assignment_request()->set_longitude(kPickupLng);
    node_b.Gateway().OnEvent(consumer_client.connection_id, request);
    scheduler.RunPending();

    const auto* offered = driver_client.channel->Last(Payload::kAssignmentResult);
    ASSERT_NE(offered, nullptr);
    EXPECT_EQ(offered->assignment_result().driver_id(), "d-1");
    EXPECT_EQ(driver_client.channel->Count(Payload::kAssignmentResult), 1u);

    node_b.Gateway().Stop();
    node_a.Gateway().Stop();
}
