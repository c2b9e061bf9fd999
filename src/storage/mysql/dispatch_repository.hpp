#pragma once

#include "core/assignment/dispatch_repository.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <memory>

namespace dispatch {
namespace storage {

// drivers / delivery_requests 两张表上的派单存储.
// 认领是一条多表 UPDATE, 由 InnoDB 行锁保证原子性.
class MySqlDispatchRepository : public dispatch::core::DispatchRepository {
public:
    explicit MySqlDispatchRepository(std::shared_ptr<ConnectionPool> pool);

    dispatch::common::StatusOr<std::vector<dispatch::core::DriverCandidate>> FetchEligibleDrivers() override;
    dispatch::common::StatusOr<dispatch::core::DriverCandidate> GetDriver(const std::string& driver_id) override;
    dispatch::common::Status SetDriverAvailability(const std::string& driver_id, bool available) override;

    dispatch::common::Status RegisterRequest(const dispatch::core::DeliveryRequest& request) override;
    dispatch::common::StatusOr<dispatch::core::DeliveryRequest> GetRequest(const std::string& request_id) override;
    dispatch::common::StatusOr<bool> ConditionalClaim(const std::string& request_id,
                                                      const std::string& driver_id) override;
    dispatch::common::StatusOr<bool> ReleaseClaim(const std::string& request_id,
                                                  const std::string& driver_id) override;
    dispatch::common::StatusOr<bool> MarkAccepted(const std::string& request_id,
                                                  const std::string& driver_id) override;
    dispatch::common::StatusOr<std::vector<dispatch::core::DeliveryRequest>> FetchPendingRequests(
        std::size_t limit) override;

private:
    // 执行写语句, 网络类错误时丢弃连接
    dispatch::common::StatusOr<std::uint64_t> ExecuteWrite(ConnectionPool::Lease& lease, const std::string& sql);
    dispatch::common::StatusOr<bool> RequestExists(ConnectionPool::Lease& lease, const std::string& request_id);

    std::shared_ptr<ConnectionPool> pool_;
};

} // namespace storage
} // namespace dispatch
