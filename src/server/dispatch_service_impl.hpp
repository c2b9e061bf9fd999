#pragma once

// 项目头文件
#include "common/event_loop.hpp"
#include "common/status.hpp"
#include "core/connection/connection.hpp"
#include "server/dispatch_context.hpp"

// gRPC 生成的头文件
#include "dispatch.grpc.pb.h"

// 第三方库
#include <grpcpp/grpcpp.h>

// C++ 标准库
#include <memory>
#include <mutex>

namespace dispatch {
namespace server {

// 把一条 gRPC 双向流适配成下行通道.
// Write 由互斥锁串行化, 流结束后不再触碰流对象.
class GrpcSession : public dispatch::core::OutboundChannel {
public:
    using Stream = grpc::ServerReaderWriter<proto::dispatch::ServerEvent, proto::dispatch::ClientEvent>;

    GrpcSession(grpc::ServerContext* context, Stream* stream);

    bool Send(const proto::dispatch::ServerEvent& event) override;
    void Close() override;
    // Connect 返回前调用, 之后的 Send 直接失败
    void MarkFinished();

private:
    std::mutex mutex_;
    grpc::ServerContext* context_;
    Stream* stream_;
    bool closed_ = false;
};

class DispatchServiceImpl final : public proto::dispatch::DispatchService::Service {
public:
    DispatchServiceImpl(dispatch::common::EventLoop& loop, DispatchContext& context);

    grpc::Status Connect(grpc::ServerContext* context
                        , grpc::ServerReaderWriter<proto::dispatch::ServerEvent, proto::dispatch::ClientEvent>* stream) override;

    grpc::Status RequestAssignment(grpc::ServerContext* context
                                  , const proto::dispatch::RequestAssignmentRequest* request
                                  , proto::dispatch::RequestAssignmentResponse* response) override;

    grpc::Status GetAssignmentStatus(grpc::ServerContext* context
                                    , const proto::dispatch::GetAssignmentStatusRequest* request
                                    , proto::dispatch::GetAssignmentStatusResponse* response) override;

    grpc::Status GetConnectionMetrics(grpc::ServerContext* context
                                     , const proto::dispatch::GetConnectionMetricsRequest* request
                                     , proto::dispatch::GetConnectionMetricsResponse* response) override;

    grpc::Status DisconnectUser(grpc::ServerContext* context
                               , const proto::dispatch::DisconnectUserRequest* request
                               , proto::dispatch::DisconnectUserResponse* response) override;

    grpc::Status AssignNextRequest(grpc::ServerContext* context
                                  , const proto::dispatch::AssignNextRequestRequest* request
                                  , proto::dispatch::AssignNextRequestResponse* response) override;

    // 辅助函数: 转换状态码
    static grpc::Status ToGrpcStatus(const dispatch::common::Status& status);

private:
    dispatch::common::EventLoop& loop_;
    DispatchContext& context_;
};

} // namespace server
} // namespace dispatch
