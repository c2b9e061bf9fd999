#include "server/dispatch_service_impl.hpp"

#include "common/logger.hpp"
#include "core/dispatch_errors.hpp"
#include "geo/geo_math.hpp"

#include <future>
#include <utility>

namespace dispatch {
namespace server {

using dispatch::common::Status;
using dispatch::core::AssignmentOutcome;
using dispatch::core::DispatchErrorCode;

namespace {

// 在事件循环线程上执行并等待完成, 事件循环已停止时返回 false
template <typename Func>
bool RunOnLoop(dispatch::common::EventLoop& loop, Func&& func) {
    try {
        loop.Submit(std::forward<Func>(func)).get();
        return true;
    } catch (const std::future_error& ex) {
        DISPATCH_LOG_WARN("[DispatchService] Event loop rejected task: {}", ex.what());
        return false;
    }
}

Status LoopUnavailable() {
    return Status::Unavailable("Dispatch node is shutting down");
}

// 派单结果: 没有司机属于正常业务结果, 其余失败映射成 gRPC 错误
grpc::Status FillAssignment(const AssignmentOutcome& outcome, proto::dispatch::AssignmentResult* result,
                            proto::common::Error* error) {
    *result = dispatch::core::OutcomeToProto(outcome);
    if (outcome.assigned) {
        result->set_eta_minutes(outcome.eta_minutes);
        return grpc::Status::OK;
    }
    auto status = dispatch::core::FromDispatchError(outcome.error, outcome.reason);
    dispatch::core::ErrorToProto(outcome.error, status, error);
    if (outcome.degraded) {
        return DispatchServiceImpl::ToGrpcStatus(
            dispatch::core::FromDispatchError(DispatchErrorCode::kTransientStorage, outcome.reason));
    }
    if (outcome.error == DispatchErrorCode::kNoEligibleDriver) {
        return grpc::Status::OK;
    }
    return DispatchServiceImpl::ToGrpcStatus(status);
}

} // namespace

GrpcSession::GrpcSession(grpc::ServerContext* context, Stream* stream)
    : context_(context)
    , stream_(stream) {}

bool GrpcSession::Send(const proto::dispatch::ServerEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }
    if (!stream_->Write(event)) {
        closed_ = true;
        return false;
    }
    return true;
}

void GrpcSession::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    // 取消后阻塞中的 Read 返回 false, Connect 随之结束
    context_->TryCancel();
}

void GrpcSession::MarkFinished() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

DispatchServiceImpl::DispatchServiceImpl(dispatch::common::EventLoop& loop, DispatchContext& context)
    : loop_(loop)
    , context_(context) {}

grpc::Status DispatchServiceImpl::Connect(grpc::ServerContext* context
                                         , grpc::ServerReaderWriter<proto::dispatch::ServerEvent, proto::dispatch::ClientEvent>* stream) {
    auto session = std::make_shared<GrpcSession>(context, stream);
    std::string connection_id;
    if (!RunOnLoop(loop_, [this, &connection_id, session]() {
            connection_id = context_.Gateway().OnConnect(session);
        })) {
        return ToGrpcStatus(LoopUnavailable());
    }
    if (connection_id.empty()) {
        return ToGrpcStatus(Status::Internal("Failed to register connection"));
    }
    DISPATCH_LOG_INFO("[DispatchService] Connect peer={} connection={}", context->peer(), connection_id);

    proto::dispatch::ClientEvent event;
    while (stream->Read(&event)) {
        loop_.Post([this, connection_id, event]() { context_.Gateway().OnEvent(connection_id, event); });
    }

    session->MarkFinished();
    loop_.Post([this, connection_id]() { context_.Gateway().OnDisconnect(connection_id); });
    return grpc::Status::OK;
}

grpc::Status DispatchServiceImpl::RequestAssignment(grpc::ServerContext*
                                                   , const proto::dispatch::RequestAssignmentRequest* request
                                                   , proto::dispatch::RequestAssignmentResponse* response) {
    if (request->request_id().empty()) {
        auto status = dispatch::core::FromDispatchError(DispatchErrorCode::kMalformedEvent, "request_id is required");
        dispatch::core::ErrorToProto(DispatchErrorCode::kMalformedEvent, status, response->mutable_error());
        return ToGrpcStatus(status);
    }
    auto point = dispatch::geo::GeoPoint::Create(request->location().latitude(), request->location().longitude());
    if (!point.IsOk()) {
        dispatch::core::ErrorToProto(DispatchErrorCode::kInvalidLocation, point.GetStatus(), response->mutable_error());
        return ToGrpcStatus(point.GetStatus());
    }
    DISPATCH_LOG_INFO("[DispatchService] RequestAssignment request={}", request->request_id());

    dispatch::core::AssignCommand command;
    command.request_id = request->request_id();
    command.location = point.Value();
    command.requester_id = request->requester_id();

    auto promise = std::make_shared<std::promise<AssignmentOutcome>>();
    auto future = promise->get_future();
    loop_.Post([this, command, promise]() mutable {
        context_.Engine().Assign(std::move(command), [promise](const AssignmentOutcome& outcome) {
            promise->set_value(outcome);
        });
    });

    AssignmentOutcome outcome;
    try {
        outcome = future.get();
    } catch (const std::future_error& ex) {
        DISPATCH_LOG_WARN("[DispatchService] RequestAssignment abandoned: {}", ex.what());
        return ToGrpcStatus(LoopUnavailable());
    }
    return FillAssignment(outcome, response->mutable_result(), response->mutable_error());
}

grpc::Status DispatchServiceImpl::GetAssignmentStatus(grpc::ServerContext*
                                                     , const proto::dispatch::GetAssignmentStatusRequest* request
                                                     , proto::dispatch::GetAssignmentStatusResponse* response) {
    Status status;
    dispatch::core::DeliveryRequest delivery;
    if (!RunOnLoop(loop_, [this, request, &status, &delivery]() {
            auto result = context_.Engine().RequestStatus(request->request_id());
            status = result.GetStatus();
            if (result.IsOk()) {
                delivery = std::move(result).Value();
            }
        })) {
        return ToGrpcStatus(LoopUnavailable());
    }
    if (!status.IsOk()) {
        dispatch::core::ErrorToProto(dispatch::core::ToDispatchError(status), status, response->mutable_error());
        return ToGrpcStatus(status);
    }
    response->set_has_driver(delivery.driver_id.has_value());
    response->set_state(dispatch::core::RequestStateToString(delivery.state));
    if (delivery.driver_id) {
        response->set_driver_id(*delivery.driver_id);
        response->set_claimed_at(delivery.claimed_at_ms);
    }
    return grpc::Status::OK;
}

grpc::Status DispatchServiceImpl::GetConnectionMetrics(grpc::ServerContext*
                                                      , const proto::dispatch::GetConnectionMetricsRequest*
                                                      , proto::dispatch::GetConnectionMetricsResponse* response) {
    dispatch::core::ConnectionMetrics metrics;
    if (!RunOnLoop(loop_, [this, &metrics]() { metrics = context_.Registry().GetMetrics(); })) {
        return ToGrpcStatus(LoopUnavailable());
    }
    response->set_total_connections(metrics.total_connections);
    response->set_active_connections(metrics.active_connections);
    response->set_online_users(metrics.online_users);
    for (const auto& entry : metrics.connections_by_role) {
        auto* count = response->add_connections_by_role();
        count->set_role(dispatch::core::RoleToProto(entry.first));
        count->set_count(static_cast<std::int32_t>(entry.second));
    }
    return grpc::Status::OK;
}

grpc::Status DispatchServiceImpl::DisconnectUser(grpc::ServerContext*
                                                , const proto::dispatch::DisconnectUserRequest* request
                                                , proto::dispatch::DisconnectUserResponse* response) {
    if (request->user_id().empty()) {
        auto status = Status::InvalidArgument("user_id is required");
        dispatch::core::ErrorToProto(DispatchErrorCode::kMalformedEvent, status, response->mutable_error());
        return ToGrpcStatus(status);
    }
    DISPATCH_LOG_INFO("[DispatchService] DisconnectUser user={}", request->user_id());
    int closed = 0;
    if (!RunOnLoop(loop_, [this, request, &closed]() {
            closed = context_.Gateway().DisconnectUser(request->user_id());
        })) {
        return ToGrpcStatus(LoopUnavailable());
    }
    response->set_closed_connections(closed);
    return grpc::Status::OK;
}

grpc::Status DispatchServiceImpl::AssignNextRequest(grpc::ServerContext*
                                                   , const proto::dispatch::AssignNextRequestRequest* request
                                                   , proto::dispatch::AssignNextRequestResponse* response) {
    struct NextResult {
        Status status;
        bool found = false;
        AssignmentOutcome outcome;
    };
    auto promise = std::make_shared<std::promise<NextResult>>();
    auto future = promise->get_future();
    const std::string driver_id = request->driver_id();
    loop_.Post([this, driver_id, promise]() {
        auto found = context_.Engine().AssignNextRequest(driver_id, [promise](const AssignmentOutcome& outcome) {
            NextResult result;
            result.found = true;
            result.outcome = outcome;
            promise->set_value(std::move(result));
        });
        // 找到请求时由派单回调完成 promise
        if (!found.IsOk() || !found.Value()) {
            NextResult result;
            result.status = found.GetStatus();
            promise->set_value(std::move(result));
        }
    });

    NextResult result;
    try {
        result = future.get();
    } catch (const std::future_error& ex) {
        DISPATCH_LOG_WARN("[DispatchService] AssignNextRequest abandoned: {}", ex.what());
        return ToGrpcStatus(LoopUnavailable());
    }
    if (!result.status.IsOk()) {
        dispatch::core::ErrorToProto(dispatch::core::ToDispatchError(result.status), result.status,
                                     response->mutable_error());
        return ToGrpcStatus(result.status);
    }
    response->set_found(result.found);
    if (!result.found) {
        return grpc::Status::OK;
    }
    return FillAssignment(result.outcome, response->mutable_result(), response->mutable_error());
}

grpc::Status DispatchServiceImpl::ToGrpcStatus(const Status& status) {
    using dispatch::common::StatusCode;
    switch (status.Code()) {
        case StatusCode::kOk:
        return grpc::Status::OK;
        case StatusCode::kInvalidArgument:
        return {grpc::StatusCode::INVALID_ARGUMENT, status.Message()};
        case StatusCode::kNotFound:
        return {grpc::StatusCode::NOT_FOUND, status.Message()};
        case StatusCode::kAlreadyExists:
        return {grpc::StatusCode::ALREADY_EXISTS, status.Message()};
        case StatusCode::kPermissionDenied:
        return {grpc::StatusCode::PERMISSION_DENIED, status.Message()};
        case StatusCode::kAborted:
        return {grpc::StatusCode::ABORTED, status.Message()};
        case StatusCode::kUnauthenticated:
        return {grpc::StatusCode::UNAUTHENTICATED, status.Message()};
        case StatusCode::kInternal:
        return {grpc::StatusCode::INTERNAL, status.Message()};
        case StatusCode::kUnavailable:
        return {grpc::StatusCode::UNAVAILABLE, status.Message()};
    }
    return {grpc::StatusCode::UNKNOWN, status.Message()};
}

} // namespace server
} // namespace dispatch
