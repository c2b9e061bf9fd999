#pragma once

#include "geo/geo_math.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace dispatch {
namespace core {

// 每次派单从存储中重新读取的司机快照, 核心不持久化
struct DriverCandidate {
    std::string driver_id;
    std::optional<dispatch::geo::GeoPoint> location;
    std::optional<double> rating;                    // 0.0 - 5.0
    int completed_jobs = 0;
    std::optional<double> average_completion_minutes;
    bool online = false;
    bool available = false;
    bool verified = false;
};

enum class RequestState {
    kUnassigned = 0,
    kClaimed = 1,
    kAccepted = 2,
    kFulfilled = 3,
    kCancelled = 4,
};

std::string RequestStateToString(RequestState state);
RequestState RequestStateFromString(const std::string& value);

struct DeliveryRequest {
    std::string request_id;
    std::string requester_id;
    dispatch::geo::GeoPoint pickup;
    std::optional<dispatch::geo::GeoPoint> dropoff;
    std::int64_t created_at_ms = 0;
    RequestState state = RequestState::kUnassigned;
    std::optional<std::string> driver_id;
    std::int64_t claimed_at_ms = 0;
};

// 司机最近一次上报的位置
struct DriverLocation {
    dispatch::geo::GeoPoint point;
    std::optional<double> heading;
    std::optional<double> speed_kmh;
    std::int64_t updated_at_ms = 0;
};

}
}
