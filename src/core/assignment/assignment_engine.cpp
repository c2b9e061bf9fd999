#include "core/assignment/assignment_engine.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace dispatch {
namespace core {

using dispatch::common::Status;
using dispatch::common::StatusOr;

struct AssignmentEngine::Attempt {
    AssignCommand command;
    AssignCallback callback;
    int claim_attempts = 0;
    int transient_failures = 0;
    bool request_registered = false;
};

proto::dispatch::AssignmentResult OutcomeToProto(const AssignmentOutcome& outcome) {
    proto::dispatch::AssignmentResult result;
    result.set_request_id(outcome.request_id);
    if (outcome.assigned) {
        result.set_driver_id(outcome.driver_id);
        result.set_score(outcome.score);
        result.set_distance_km(outcome.distance_km);
    }
    result.set_reason(outcome.reason);
    result.set_degraded(outcome.degraded);
    return result;
}

AssignmentEngine::AssignmentEngine(dispatch::common::Scheduler& scheduler,
                                   std::shared_ptr<DispatchRepository> repository,
                                   std::shared_ptr<LocationCache> location_cache,
                                   EventRouter& router,
                                   dispatch::common::AssignmentConfig config)
    : scheduler_(scheduler)
    , repository_(std::move(repository))
    , location_cache_(std::move(location_cache))
    , router_(router)
    , config_(std::move(config))
    , scorer_(config_) {}

void AssignmentEngine::Assign(AssignCommand command, AssignCallback callback) {
    auto attempt = std::make_shared<Attempt>();
    attempt->command = std::move(command);
    attempt->callback = std::move(callback);
    DISPATCH_LOG_INFO("[Assignment] Assign request={} excluded={}",
                      attempt->command.request_id, attempt->command.excluded_drivers.size());
    scheduler_.Post([this, attempt]() { RunAttempt(attempt); });
}

void AssignmentEngine::RunAttempt(std::shared_ptr<Attempt> attempt) {
    auto& command = attempt->command;

    auto fetched = repository_->FetchEligibleDrivers();
    if (!fetched.IsOk()) {
        RetryTransient(attempt, fetched.GetStatus());
        return;
    }
    auto candidates = std::move(fetched).Value();
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(), [&command](const DriverCandidate& c) {
        return command.excluded_drivers.count(c.driver_id) > 0;
    }), candidates.end());
    ApplyCachedLocations(candidates);

    auto ranked = scorer_.Rank(candidates, command.location);
    if (ranked.empty()) {
        AssignmentOutcome outcome;
        outcome.request_id = command.request_id;
        outcome.error = DispatchErrorCode::kNoEligibleDriver;
        outcome.reason = attempt->claim_attempts > 0 ? "claim conflict" : "no eligible driver";
        outcome.attempts = attempt->claim_attempts;
        Finish(attempt, std::move(outcome));
        return;
    }
    const ScoredCandidate best = ranked.front();

    if (!attempt->request_registered) {
        DeliveryRequest request;
        request.request_id = command.request_id;
        request.requester_id = command.requester_id;
        request.pickup = command.location;
        request.created_at_ms = dispatch::common::UnixMillis();
        auto status = repository_->RegisterRequest(request);
        if (!status.IsOk()) {
            RetryTransient(attempt, status);
            return;
        }
        attempt->request_registered = true;
    }

    bool won = false;
    auto claimed = repository_->ConditionalClaim(command.request_id, best.driver_id);
    if (!claimed.IsOk()) {
        if (claimed.GetStatus().Code() == dispatch::common::StatusCode::kNotFound) {
            AssignmentOutcome outcome;
            outcome.request_id = command.request_id;
            outcome.error = DispatchErrorCode::kRequestNotFound;
            outcome.reason = claimed.GetStatus().Message();
            outcome.attempts = attempt->claim_attempts;
            Finish(attempt, std::move(outcome));
            return;
        }
        // 认领可能已经提交, 只是应答丢失
        if (!HeldBy(command.request_id, best.driver_id)) {
            RetryTransient(attempt, claimed.GetStatus());
            return;
        }
        DISPATCH_LOG_WARN("[Assignment] TransientStorage: claim of {} by {} committed despite error: {}",
                          command.request_id, best.driver_id, claimed.GetStatus().Message());
        won = true;
    } else {
        won = claimed.Value();
    }
    ++attempt->claim_attempts;

    if (!won) {
        DISPATCH_LOG_WARN("[Assignment] ClaimConflict request={} driver={} attempt={}/{}",
                          command.request_id, best.driver_id, attempt->claim_attempts, config_.max_claim_attempts);
        command.excluded_drivers.insert(best.driver_id);
        if (attempt->claim_attempts >= config_.max_claim_attempts) {
            AssignmentOutcome outcome;
            outcome.request_id = command.request_id;
            outcome.error = DispatchErrorCode::kNoEligibleDriver;
            outcome.reason = "claim conflict";
            outcome.attempts = attempt->claim_attempts;
            Finish(attempt, std::move(outcome));
            return;
        }
        scheduler_.Post([this, attempt]() { RunAttempt(attempt); });
        return;
    }

    // 认领语句已把司机置为忙碌, 这里重复写一次保证幂等
    auto availability = repository_->SetDriverAvailability(best.driver_id, false);
    if (!availability.IsOk()) {
        DISPATCH_LOG_WARN("[Assignment] TransientStorage: mark driver {} busy failed: {}",
                          best.driver_id, availability.Message());
    }

    AssignmentOutcome outcome;
    outcome.request_id = command.request_id;
    outcome.assigned = true;
    outcome.driver_id = best.driver_id;
    outcome.score = best.score;
    outcome.distance_km = best.distance_km;
    outcome.eta_minutes = dispatch::geo::DeliveryEtaMinutes(best.distance_km, config_.assumed_speed_kmh);
    outcome.attempts = attempt->claim_attempts;
    NotifyAssigned(command, outcome);
    Finish(attempt, std::move(outcome));
}

void AssignmentEngine::RetryTransient(std::shared_ptr<Attempt> attempt, const Status& status) {
    DISPATCH_LOG_WARN("[Assignment] TransientStorage request={} failure={}: {}",
                      attempt->command.request_id, attempt->transient_failures + 1, status.Message());
    if (attempt->transient_failures < config_.transient_retries) {
        auto delay = std::chrono::milliseconds(config_.retry_backoff_ms * (1 << attempt->transient_failures));
        ++attempt->transient_failures;
        scheduler_.ScheduleAfter(delay, [this, attempt]() { RunAttempt(attempt); });
        return;
    }

    AssignmentOutcome outcome;
    outcome.request_id = attempt->command.request_id;
    outcome.error = DispatchErrorCode::kNoEligibleDriver;
    outcome.degraded = true;
    outcome.reason = "storage unavailable";
    outcome.attempts = attempt->claim_attempts;

    proto::dispatch::ServerEvent event;
    *event.mutable_assignment_result() = OutcomeToProto(outcome);
    NotifyAdmins(event);
    Finish(attempt, std::move(outcome));
}

void AssignmentEngine::Finish(std::shared_ptr<Attempt> attempt, AssignmentOutcome outcome) {
    if (outcome.assigned) {
        DISPATCH_LOG_INFO("[Assignment] request={} driver={} score={} distance={:.2f}km attempts={}",
                          outcome.request_id, outcome.driver_id, outcome.score, outcome.distance_km, outcome.attempts);
    } else {
        DISPATCH_LOG_INFO("[Assignment] request={} unmatched reason='{}' degraded={}",
                          outcome.request_id, outcome.reason, outcome.degraded);
    }
    if (attempt->callback) {
        attempt->callback(outcome);
    }
}

// 位置缓存中的条目都在 TTL 内, 比档案中的位置新
void AssignmentEngine::ApplyCachedLocations(std::vector<DriverCandidate>& candidates) {
    if (!location_cache_) {
        return;
    }
    for (auto& candidate : candidates) {
        auto cached = location_cache_->Get(candidate.driver_id);
        if (cached.IsOk()) {
            candidate.location = cached.Value().point;
        } else if (cached.GetStatus().Code() != dispatch::common::StatusCode::kNotFound) {
            DISPATCH_LOG_WARN("[Assignment] DegradedCache: location lookup for {} failed: {}",
                              candidate.driver_id, cached.GetStatus().Message());
            return;
        }
    }
}

void AssignmentEngine::NotifyAssigned(const AssignCommand& command, const AssignmentOutcome& outcome) {
    proto::dispatch::ServerEvent driver_event;
    *driver_event.mutable_assignment_result() = OutcomeToProto(outcome);
    router_.NotifyUser(outcome.driver_id, driver_event);

    proto::dispatch::ServerEvent requester_event = driver_event;
    requester_event.mutable_assignment_result()->set_eta_minutes(outcome.eta_minutes);
    if (!command.requester_id.empty() && command.requester_id != outcome.driver_id) {
        router_.NotifyUser(command.requester_id, requester_event);
    }
    NotifyAdmins(requester_event);
}

void AssignmentEngine::NotifyAdmins(const proto::dispatch::ServerEvent& event) {
    router_.NotifyRole(Role::kAdmin, event);
}

Status AssignmentEngine::Accept(const std::string& request_id, const std::string& driver_id) {
    auto request = repository_->GetRequest(request_id);
    if (!request.IsOk()) {
        return request.GetStatus();
    }
    auto accepted = repository_->MarkAccepted(request_id, driver_id);
    if (!accepted.IsOk()) {
        return accepted.GetStatus();
    }
    if (!accepted.Value()) {
        return FromDispatchError(DispatchErrorCode::kPermissionDenied,
                                 "Request " + request_id + " is not held by driver " + driver_id);
    }

    proto::dispatch::ServerEvent event;
    auto* update = event.mutable_assignment_update();
    update->set_request_id(request_id);
    update->set_driver_id(driver_id);
    update->set_status("accepted");
    update->set_timestamp(dispatch::common::UnixMillis());
    if (!request.Value().requester_id.empty()) {
        router_.NotifyUser(request.Value().requester_id, event);
    }
    NotifyAdmins(event);
    DISPATCH_LOG_INFO("[Assignment] request={} accepted by {}", request_id, driver_id);
    return Status::OK();
}

Status AssignmentEngine::Release(const std::string& request_id, const std::string& driver_id,
                                 AssignCallback callback) {
    auto request = repository_->GetRequest(request_id);
    if (!request.IsOk()) {
        return request.GetStatus();
    }
    auto released = repository_->ReleaseClaim(request_id, driver_id);
    if (!released.IsOk()) {
        return released.GetStatus();
    }
    if (!released.Value()) {
        return FromDispatchError(DispatchErrorCode::kPermissionDenied,
                                 "Request " + request_id + " is not held by driver " + driver_id);
    }

    auto availability = repository_->SetDriverAvailability(driver_id, true);
    if (!availability.IsOk()) {
        DISPATCH_LOG_WARN("[Assignment] TransientStorage: restore driver {} failed: {}",
                          driver_id, availability.Message());
    }

    proto::dispatch::ServerEvent event;
    auto* update = event.mutable_assignment_update();
    update->set_request_id(request_id);
    update->set_driver_id(driver_id);
    update->set_status("declined");
    update->set_timestamp(dispatch::common::UnixMillis());
    NotifyAdmins(event);
    DISPATCH_LOG_INFO("[Assignment] request={} declined by {}, reassigning", request_id, driver_id);

    AssignCommand command;
    command.request_id = request_id;
    command.location = request.Value().pickup;
    command.requester_id = request.Value().requester_id;
    command.excluded_drivers.insert(driver_id);
    Assign(std::move(command), std::move(callback));
    return Status::OK();
}

StatusOr<bool> AssignmentEngine::AssignNextRequest(const std::string& driver_id, AssignCallback callback) {
    auto position = DriverPosition(driver_id);
    if (!position) {
        return FromDispatchError(DispatchErrorCode::kInvalidLocation, "Location of driver " + driver_id + " is unknown");
    }
    auto pending = repository_->FetchPendingRequests(static_cast<std::size_t>(config_.pending_scan_limit));
    if (!pending.IsOk()) {
        return FromDispatchError(DispatchErrorCode::kTransientStorage, pending.GetStatus().Message());
    }

    const DeliveryRequest* closest = nullptr;
    double closest_distance = std::numeric_limits<double>::max();
    for (const auto& request : pending.Value()) {
        const double distance = dispatch::geo::DistanceKm(*position, request.pickup);
        if (distance <= config_.next_request_radius_km && distance < closest_distance) {
            closest = &request;
            closest_distance = distance;
        }
    }
    if (!closest) {
        DISPATCH_LOG_INFO("[Assignment] No pending request near driver {}", driver_id);
        return StatusOr<bool>(false);
    }

    AssignCommand command;
    command.request_id = closest->request_id;
    command.location = closest->pickup;
    command.requester_id = closest->requester_id;
    Assign(std::move(command), std::move(callback));
    return StatusOr<bool>(true);
}

Status AssignmentEngine::UpdateDriverLocation(const std::string& driver_id, const DriverLocation& location) {
    if (!location_cache_) {
        return Status::OK();
    }
    auto status = location_cache_->Put(driver_id, location);
    if (!status.IsOk()) {
        DISPATCH_LOG_WARN("[Assignment] DegradedCache: location update for {} failed: {}", driver_id, status.Message());
    }
    return status;
}

StatusOr<DeliveryRequest> AssignmentEngine::RequestStatus(const std::string& request_id) {
    return repository_->GetRequest(request_id);
}

bool AssignmentEngine::HeldBy(const std::string& request_id, const std::string& driver_id) {
    auto request = repository_->GetRequest(request_id);
    return request.IsOk() && request.Value().driver_id && *request.Value().driver_id == driver_id &&
           request.Value().state == RequestState::kClaimed;
}

std::optional<dispatch::geo::GeoPoint> AssignmentEngine::DriverPosition(const std::string& driver_id) {
    if (location_cache_) {
        auto cached = location_cache_->Get(driver_id);
        if (cached.IsOk()) {
            return cached.Value().point;
        }
    }
    auto driver = repository_->GetDriver(driver_id);
    if (driver.IsOk() && driver.Value().location) {
        return driver.Value().location;
    }
    return std::nullopt;
}

}
}
