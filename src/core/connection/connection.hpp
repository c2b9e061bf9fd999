#pragma once

#include "common/scheduler.hpp"
#include "common/status_or.hpp"

#include "dispatch.pb.h"

#include <memory>
#include <optional>
#include <string>

namespace dispatch {
namespace core {

enum class Role {
    kUnknown = 0,
    kConsumer = 1,
    kDriver = 2,
    kMerchant = 3,
    kAdmin = 4,
};

std::string RoleToString(Role role);
dispatch::common::StatusOr<Role> RoleFromString(const std::string& value);
proto::common::Role RoleToProto(Role role);

// 一条连接的下行通道, 由协议层实现
class OutboundChannel {
public:
    virtual ~OutboundChannel() = default;
    // 发送下行事件, 通道已关闭或写入失败时返回 false
    virtual bool Send(const proto::dispatch::ServerEvent& event) = 0;
    // 主动关闭连接, 可重复调用
    virtual void Close() = 0;
};

// 一条存活的双工会话
struct Connection {
    using TimePoint = dispatch::common::Scheduler::Clock::time_point;

    std::string connection_id;
    std::optional<std::string> user_id; // 认证完成前为空
    Role role = Role::kUnknown;
    TimePoint established_at{};
    TimePoint last_activity{};
    std::string reconnect_token;
    std::optional<TimePoint> ping_sent_at; // 已发送探活但尚未收到任何上行事件
    std::shared_ptr<OutboundChannel> channel;
};

}
}
