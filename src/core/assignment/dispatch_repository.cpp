#include "core/assignment/dispatch_repository.hpp"

#include "common/scheduler.hpp"

#include <algorithm>

namespace dispatch {
namespace core {

using dispatch::common::Status;
using dispatch::common::StatusOr;

std::string RequestStateToString(RequestState state) {
    switch (state) {
        case RequestState::kUnassigned:
            return "unassigned";
        case RequestState::kClaimed:
            return "claimed";
        case RequestState::kAccepted:
            return "accepted";
        case RequestState::kFulfilled:
            return "fulfilled";
        case RequestState::kCancelled:
            return "cancelled";
    }
    return "unassigned";
}

RequestState RequestStateFromString(const std::string& value) {
    if (value == "claimed") {
        return RequestState::kClaimed;
    }
    if (value == "accepted") {
        return RequestState::kAccepted;
    }
    if (value == "fulfilled") {
        return RequestState::kFulfilled;
    }
    if (value == "cancelled") {
        return RequestState::kCancelled;
    }
    return RequestState::kUnassigned;
}

StatusOr<std::vector<DriverCandidate>> InMemoryDispatchRepository::FetchEligibleDrivers() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DriverCandidate> result;
    for (const auto& entry : drivers_) {
        const auto& driver = entry.second;
        if (driver.online && driver.available && driver.verified) {
            result.push_back(driver);
        }
    }
    // 哈希表遍历顺序不稳定, 按ID排序保证结果可复现
    std::sort(result.begin(), result.end(), [](const DriverCandidate& a, const DriverCandidate& b) {
        return a.driver_id < b.driver_id;
    });
    return StatusOr<std::vector<DriverCandidate>>(std::move(result));
}

StatusOr<DriverCandidate> InMemoryDispatchRepository::GetDriver(const std::string& driver_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = drivers_.find(driver_id);
    if (it == drivers_.end()) {
        return Status::NotFound("Driver not found: " + driver_id);
    }
    return StatusOr<DriverCandidate>(it->second);
}

Status InMemoryDispatchRepository::SetDriverAvailability(const std::string& driver_id, bool available) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = drivers_.find(driver_id);
    if (it == drivers_.end()) {
        return Status::NotFound("Driver not found: " + driver_id);
    }
    it->second.available = available;
    return Status::OK();
}

Status InMemoryDispatchRepository::RegisterRequest(const DeliveryRequest& request) {
    if (request.request_id.empty()) {
        return Status::InvalidArgument("Request id is required");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.emplace(request.request_id, request);
    return Status::OK();
}

StatusOr<DeliveryRequest> InMemoryDispatchRepository::GetRequest(const std::string& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return Status::NotFound("Request not found: " + request_id);
    }
    return StatusOr<DeliveryRequest>(it->second);
}

StatusOr<bool> InMemoryDispatchRepository::ConditionalClaim(const std::string& request_id,
                                                            const std::string& driver_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto request_it = requests_.find(request_id);
    if (request_it == requests_.end()) {
        return Status::NotFound("Request not found: " + request_id);
    }
    auto driver_it = drivers_.find(driver_id);
    if (driver_it == drivers_.end()) {
        return StatusOr<bool>(false);
    }
    auto& request = request_it->second;
    auto& driver = driver_it->second;
    if (request.driver_id || request.state != RequestState::kUnassigned || !driver.available) {
        return StatusOr<bool>(false);
    }
    request.driver_id = driver_id;
    request.state = RequestState::kClaimed;
    request.claimed_at_ms = dispatch::common::UnixMillis();
    driver.available = false;
    return StatusOr<bool>(true);
}

StatusOr<bool> InMemoryDispatchRepository::ReleaseClaim(const std::string& request_id,
                                                        const std::string& driver_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return Status::NotFound("Request not found: " + request_id);
    }
    auto& request = it->second;
    if (!request.driver_id || *request.driver_id != driver_id || request.state != RequestState::kClaimed) {
        return StatusOr<bool>(false);
    }
    request.driver_id.reset();
    request.state = RequestState::kUnassigned;
    request.claimed_at_ms = 0;
    return StatusOr<bool>(true);
}

StatusOr<bool> InMemoryDispatchRepository::MarkAccepted(const std::string& request_id,
                                                        const std::string& driver_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return Status::NotFound("Request not found: " + request_id);
    }
    auto& request = it->second;
    if (!request.driver_id || *request.driver_id != driver_id || request.state != RequestState::kClaimed) {
        return StatusOr<bool>(false);
    }
    request.state = RequestState::kAccepted;
    return StatusOr<bool>(true);
}

StatusOr<std::vector<DeliveryRequest>> InMemoryDispatchRepository::FetchPendingRequests(std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeliveryRequest> pending;
    for (const auto& entry : requests_) {
        if (entry.second.state == RequestState::kUnassigned && !entry.second.driver_id) {
            pending.push_back(entry.second);
        }
    }
    std::sort(pending.begin(), pending.end(), [](const DeliveryRequest& a, const DeliveryRequest& b) {
        if (a.created_at_ms != b.created_at_ms) {
            return a.created_at_ms > b.created_at_ms;
        }
        return a.request_id < b.request_id;
    });
    if (pending.size() > limit) {
        pending.resize(limit);
    }
    return StatusOr<std::vector<DeliveryRequest>>(std::move(pending));
}

void InMemoryDispatchRepository::UpsertDriver(const DriverCandidate& driver) {
    std::lock_guard<std::mutex> lock(mutex_);
    drivers_[driver.driver_id] = driver;
}

}
}
