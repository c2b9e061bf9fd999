#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/assignment/assignment_types.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace dispatch {
namespace core {

// 司机与配送请求的存储协作方
class DispatchRepository {
public:
    virtual ~DispatchRepository() = default;

    // 在线、空闲且已认证的司机, 不做距离过滤
    virtual dispatch::common::StatusOr<std::vector<DriverCandidate>> FetchEligibleDrivers() = 0;
    virtual dispatch::common::StatusOr<DriverCandidate> GetDriver(const std::string& driver_id) = 0;
    virtual dispatch::common::Status SetDriverAvailability(const std::string& driver_id, bool available) = 0;

    // 请求不存在时写入, 已存在时不做任何修改
    virtual dispatch::common::Status RegisterRequest(const DeliveryRequest& request) = 0;
    virtual dispatch::common::StatusOr<DeliveryRequest> GetRequest(const std::string& request_id) = 0;
    // 原子条件认领: 仅当请求尚无司机且司机空闲时写入, 同时把司机置为忙碌
    virtual dispatch::common::StatusOr<bool> ConditionalClaim(const std::string& request_id,
                                                              const std::string& driver_id) = 0;
    // 仅当请求仍由 driver_id 持有时释放
    virtual dispatch::common::StatusOr<bool> ReleaseClaim(const std::string& request_id,
                                                          const std::string& driver_id) = 0;
    virtual dispatch::common::StatusOr<bool> MarkAccepted(const std::string& request_id,
                                                          const std::string& driver_id) = 0;
    // 最近创建的未分配请求, 新的在前
    virtual dispatch::common::StatusOr<std::vector<DeliveryRequest>> FetchPendingRequests(std::size_t limit) = 0;
};

class InMemoryDispatchRepository : public DispatchRepository {
public:
    dispatch::common::StatusOr<std::vector<DriverCandidate>> FetchEligibleDrivers() override;
    dispatch::common::StatusOr<DriverCandidate> GetDriver(const std::string& driver_id) override;
    dispatch::common::Status SetDriverAvailability(const std::string& driver_id, bool available) override;

    dispatch::common::Status RegisterRequest(const DeliveryRequest& request) override;
    dispatch::common::StatusOr<DeliveryRequest> GetRequest(const std::string& request_id) override;
    dispatch::common::StatusOr<bool> ConditionalClaim(const std::string& request_id,
                                                      const std::string& driver_id) override;
    dispatch::common::StatusOr<bool> ReleaseClaim(const std::string& request_id,
                                                  const std::string& driver_id) override;
    dispatch::common::StatusOr<bool> MarkAccepted(const std::string& request_id,
                                                  const std::string& driver_id) override;
    dispatch::common::StatusOr<std::vector<DeliveryRequest>> FetchPendingRequests(std::size_t limit) override;

    // 写入或覆盖司机档案
    void UpsertDriver(const DriverCandidate& driver);

private:
    std::mutex mutex_;
    std::unordered_map<std::string, DriverCandidate> drivers_;
    std::unordered_map<std::string, DeliveryRequest> requests_;
};

}
}
