#pragma once

#include "common/config.hpp"
#include "common/scheduler.hpp"
#include "common/status.hpp"
#include "core/connection/connection.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace dispatch {
namespace core {

// 连接绑定/解绑用户时的通知, 在线状态广播器实现该接口
class ConnectionListener {
public:
    virtual ~ConnectionListener() = default;
    virtual void OnConnectionAdded(const Connection& connection) = 0;
    virtual void OnConnectionRemoved(const Connection& connection) = 0;
};

struct ConnectionMetrics {
    std::uint64_t total_connections = 0;  // 启动以来接受过的连接数
    std::uint64_t active_connections = 0;
    std::uint64_t online_users = 0;
    std::map<Role, std::uint64_t> connections_by_role;
};

// 跟踪本进程所有存活连接, 按用户和角色建立索引.
// 只在事件循环线程上访问, 内部不加锁.
class ConnectionRegistry {
public:
    ConnectionRegistry(dispatch::common::Scheduler& scheduler, dispatch::common::RegistryConfig config);
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    // 启动/停止周期巡检
    void Start();
    void Stop();

    void AddListener(ConnectionListener* listener);

    std::string NewConnectionId();

    // 按连接ID幂等; 重复添加更新角色与用户绑定, 已绑定的用户ID不可更换
    dispatch::common::Status Add(Connection connection);
    // 移除连接并返回其快照, 不存在时返回空
    std::optional<Connection> Remove(const std::string& connection_id);
    // 刷新最近活动时间, 同时清除未完成的探活
    bool Touch(const std::string& connection_id);

    std::set<std::string> ConnectionsFor(const std::string& user_id) const;
    std::set<std::string> ConnectionsForRole(Role role) const;
    bool IsOnline(const std::string& user_id) const;
    std::size_t OnlineUsersWithRole(Role role) const;

    const Connection* Get(const std::string& connection_id) const;
    std::shared_ptr<OutboundChannel> Channel(const std::string& connection_id) const;
    ConnectionMetrics GetMetrics() const;

    // 执行一次巡检: 空闲超时发送探活, 探活超时强制关闭
    void Sweep();

private:
    void ScheduleSweep();
    void IndexConnection(const Connection& connection);
    void UnindexConnection(const Connection& connection);

private:
    dispatch::common::Scheduler& scheduler_;
    dispatch::common::RegistryConfig config_;
    std::unordered_map<std::string, Connection> connections_;
    std::unordered_map<std::string, std::set<std::string>> by_user_;
    std::map<Role, std::set<std::string>> by_role_;
    std::vector<ConnectionListener*> listeners_;
    std::uint64_t total_connections_ = 0;
    std::optional<dispatch::common::Scheduler::TimerId> sweep_timer_;
};

}
}
