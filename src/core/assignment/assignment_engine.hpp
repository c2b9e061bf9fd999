#pragma once

#include "common/config.hpp"
#include "common/scheduler.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/assignment/dispatch_repository.hpp"
#include "core/assignment/driver_scorer.hpp"
#include "core/assignment/location_cache.hpp"
#include "core/dispatch_errors.hpp"
#include "core/queue/event_router.hpp"

#include "dispatch.pb.h"

#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dispatch {
namespace core {

struct AssignCommand {
    std::string request_id;
    dispatch::geo::GeoPoint location;
    std::string requester_id;               // 为空时不通知下单方
    std::set<std::string> excluded_drivers;
};

struct AssignmentOutcome {
    std::string request_id;
    bool assigned = false;
    std::string driver_id;
    int score = 0;
    double distance_km = 0.0;
    double eta_minutes = 0.0;
    DispatchErrorCode error = DispatchErrorCode::kOk;
    bool degraded = false;                  // 存储重试耗尽, 而不是确实没有司机
    std::string reason;
    int attempts = 0;
};

proto::dispatch::AssignmentResult OutcomeToProto(const AssignmentOutcome& outcome);

// 派单编排: 取候选、打分、原子认领、通知.
// 只在事件循环线程上调用, 重试通过调度器投递.
class AssignmentEngine {
public:
    using AssignCallback = std::function<void(const AssignmentOutcome&)>;

    AssignmentEngine(dispatch::common::Scheduler& scheduler,
                     std::shared_ptr<DispatchRepository> repository,
                     std::shared_ptr<LocationCache> location_cache,
                     EventRouter& router,
                     dispatch::common::AssignmentConfig config);

    // 异步派单, 结束时回调恰好一次
    void Assign(AssignCommand command, AssignCallback callback);

    // 司机接单: 仅当前持有者可以接受
    dispatch::common::Status Accept(const std::string& request_id, const std::string& driver_id);
    // 司机拒单: 释放认领、恢复司机空闲并排除该司机重新派单
    dispatch::common::Status Release(const std::string& request_id, const std::string& driver_id,
                                     AssignCallback callback);
    // 为空闲司机挑选附近最近的待分配请求并派单, 没有合适请求时返回 false
    dispatch::common::StatusOr<bool> AssignNextRequest(const std::string& driver_id, AssignCallback callback);

    dispatch::common::Status UpdateDriverLocation(const std::string& driver_id, const DriverLocation& location);
    dispatch::common::StatusOr<DeliveryRequest> RequestStatus(const std::string& request_id);

private:
    struct Attempt;

    void RunAttempt(std::shared_ptr<Attempt> attempt);
    void RetryTransient(std::shared_ptr<Attempt> attempt, const dispatch::common::Status& status);
    void Finish(std::shared_ptr<Attempt> attempt, AssignmentOutcome outcome);
    void ApplyCachedLocations(std::vector<DriverCandidate>& candidates);
    void NotifyAssigned(const AssignCommand& command, const AssignmentOutcome& outcome);
    void NotifyAdmins(const proto::dispatch::ServerEvent& event);
    std::optional<dispatch::geo::GeoPoint> DriverPosition(const std::string& driver_id);
    bool HeldBy(const std::string& request_id, const std::string& driver_id);

private:
    dispatch::common::Scheduler& scheduler_;
    std::shared_ptr<DispatchRepository> repository_;
    std::shared_ptr<LocationCache> location_cache_;
    EventRouter& router_;
    dispatch::common::AssignmentConfig config_;
    DriverScorer scorer_;
};

}
}
