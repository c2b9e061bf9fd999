#include "storage/mysql/dispatch_repository.hpp"

#include "common/scheduler.hpp"

#include <fmt/format.h>

#include <cstdlib>

namespace dispatch {
namespace storage {

using dispatch::common::Status;
using dispatch::common::StatusOr;
using dispatch::core::DeliveryRequest;
using dispatch::core::DriverCandidate;

namespace {

constexpr const char* kDriverColumns =
    "driver_id, latitude, longitude, rating, completed_jobs, avg_completion_minutes, "
    "is_online, is_available, is_verified";

constexpr const char* kRequestColumns =
    "request_id, requester_id, pickup_lat, pickup_lon, dropoff_lat, dropoff_lon, "
    "state, driver_id, created_at_ms, claimed_at_ms";

std::optional<double> OptionalDouble(const char* value) {
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::strtod(value, nullptr);
}

bool Flag(const char* value) {
    return value != nullptr && std::strtol(value, nullptr, 10) != 0;
}

// 坐标越界的行视为没有位置, 不参与派单
std::optional<dispatch::geo::GeoPoint> OptionalPoint(const char* lat, const char* lon) {
    if (lat == nullptr || lon == nullptr) {
        return std::nullopt;
    }
    auto point = dispatch::geo::GeoPoint::Create(std::strtod(lat, nullptr), std::strtod(lon, nullptr));
    if (!point.IsOk()) {
        return std::nullopt;
    }
    return point.Value();
}

DriverCandidate DriverFromRow(MYSQL_ROW row) {
    DriverCandidate driver;
    driver.driver_id = row[0] ? row[0] : "";
    driver.location = OptionalPoint(row[1], row[2]);
    driver.rating = OptionalDouble(row[3]);
    driver.completed_jobs = row[4] ? static_cast<int>(std::strtol(row[4], nullptr, 10)) : 0;
    driver.average_completion_minutes = OptionalDouble(row[5]);
    driver.online = Flag(row[6]);
    driver.available = Flag(row[7]);
    driver.verified = Flag(row[8]);
    return driver;
}

DeliveryRequest RequestFromRow(MYSQL_ROW row) {
    DeliveryRequest request;
    request.request_id = row[0] ? row[0] : "";
    request.requester_id = row[1] ? row[1] : "";
    auto pickup = OptionalPoint(row[2], row[3]);
    if (pickup) {
        request.pickup = *pickup;
    }
    request.dropoff = OptionalPoint(row[4], row[5]);
    request.state = dispatch::core::RequestStateFromString(row[6] ? row[6] : "");
    if (row[7]) {
        request.driver_id = std::string(row[7]);
    }
    request.created_at_ms = row[8] ? std::strtoll(row[8], nullptr, 10) : 0;
    request.claimed_at_ms = row[9] ? std::strtoll(row[9], nullptr, 10) : 0;
    return request;
}

std::string SqlDouble(const std::optional<double>& value) {
    return value ? fmt::format("{}", *value) : std::string("NULL");
}

} // namespace

MySqlDispatchRepository::MySqlDispatchRepository(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

StatusOr<std::uint64_t> MySqlDispatchRepository::ExecuteWrite(ConnectionPool::Lease& lease, const std::string& sql) {
    auto result = lease->Execute(sql);
    if (!result.IsOk() && result.GetStatus().Code() == dispatch::common::StatusCode::kUnavailable) {
        lease.Invalidate();
    }
    return result;
}

StatusOr<bool> MySqlDispatchRepository::RequestExists(ConnectionPool::Lease& lease, const std::string& request_id) {
    auto query = lease->Query(fmt::format(
        "SELECT 1 FROM delivery_requests WHERE request_id = '{}' LIMIT 1", lease->Escape(request_id)));
    if (!query.IsOk()) {
        return query.GetStatus();
    }
    auto res = std::move(query).Value();
    return StatusOr<bool>(mysql_fetch_row(res.get()) != nullptr);
}

StatusOr<std::vector<DriverCandidate>> MySqlDispatchRepository::FetchEligibleDrivers() {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto query = lease->Query(fmt::format(
        "SELECT {} FROM drivers WHERE is_online = 1 AND is_available = 1 AND is_verified = 1 "
        "ORDER BY driver_id", kDriverColumns));
    if (!query.IsOk()) {
        if (query.GetStatus().Code() == dispatch::common::StatusCode::kUnavailable) {
            lease.Invalidate();
        }
        return query.GetStatus();
    }
    auto res = std::move(query).Value();
    std::vector<DriverCandidate> drivers;
    while (MYSQL_ROW row = mysql_fetch_row(res.get())) {
        drivers.push_back(DriverFromRow(row));
    }
    return StatusOr<std::vector<DriverCandidate>>(std::move(drivers));
}

StatusOr<DriverCandidate> MySqlDispatchRepository::GetDriver(const std::string& driver_id) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto query = lease->Query(fmt::format(
        "SELECT {} FROM drivers WHERE driver_id = '{}' LIMIT 1", kDriverColumns, lease->Escape(driver_id)));
    if (!query.IsOk()) {
        return query.GetStatus();
    }
    auto res = std::move(query).Value();
    MYSQL_ROW row = mysql_fetch_row(res.get());
    if (!row) {
        return Status::NotFound("Driver not found: " + driver_id);
    }
    return StatusOr<DriverCandidate>(DriverFromRow(row));
}

Status MySqlDispatchRepository::SetDriverAvailability(const std::string& driver_id, bool available) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto result = ExecuteWrite(lease, fmt::format(
        "UPDATE drivers SET is_available = {} WHERE driver_id = '{}'",
        available ? 1 : 0, lease->Escape(driver_id)));
    if (!result.IsOk()) {
        return result.GetStatus();
    }
    return Status::OK();
}

// INSERT IGNORE: 已存在的请求保持原样
Status MySqlDispatchRepository::RegisterRequest(const DeliveryRequest& request) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    std::optional<double> dropoff_lat;
    std::optional<double> dropoff_lon;
    if (request.dropoff) {
        dropoff_lat = request.dropoff->Latitude();
        dropoff_lon = request.dropoff->Longitude();
    }
    auto result = ExecuteWrite(lease, fmt::format(
        "INSERT IGNORE INTO delivery_requests "
        "(request_id, requester_id, pickup_lat, pickup_lon, dropoff_lat, dropoff_lon, state, created_at_ms) "
        "VALUES ('{}', '{}', {}, {}, {}, {}, 'unassigned', {})",
        lease->Escape(request.request_id),
        lease->Escape(request.requester_id),
        request.pickup.Latitude(),
        request.pickup.Longitude(),
        SqlDouble(dropoff_lat),
        SqlDouble(dropoff_lon),
        request.created_at_ms));
    if (!result.IsOk()) {
        return result.GetStatus();
    }
    return Status::OK();
}

StatusOr<DeliveryRequest> MySqlDispatchRepository::GetRequest(const std::string& request_id) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto query = lease->Query(fmt::format(
        "SELECT {} FROM delivery_requests WHERE request_id = '{}' LIMIT 1",
        kRequestColumns, lease->Escape(request_id)));
    if (!query.IsOk()) {
        return query.GetStatus();
    }
    auto res = std::move(query).Value();
    MYSQL_ROW row = mysql_fetch_row(res.get());
    if (!row) {
        return Status::NotFound("Request not found: " + request_id);
    }
    return StatusOr<DeliveryRequest>(RequestFromRow(row));
}

StatusOr<bool> MySqlDispatchRepository::ConditionalClaim(const std::string& request_id,
                                                         const std::string& driver_id) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    // 请求尚无司机且司机空闲时才写入, 同一语句内把司机置为忙碌
    auto result = ExecuteWrite(lease, fmt::format(
        "UPDATE delivery_requests r JOIN drivers d ON d.driver_id = '{1}' "
        "SET r.driver_id = d.driver_id, r.state = 'claimed', r.claimed_at_ms = {2}, d.is_available = 0 "
        "WHERE r.request_id = '{0}' AND r.driver_id IS NULL AND r.state = 'unassigned' AND d.is_available = 1",
        lease->Escape(request_id),
        lease->Escape(driver_id),
        dispatch::common::UnixMillis()));
    if (!result.IsOk()) {
        return result.GetStatus();
    }
    if (result.Value() > 0) {
        return StatusOr<bool>(true);
    }
    auto exists = RequestExists(lease, request_id);
    if (!exists.IsOk()) {
        return exists.GetStatus();
    }
    if (!exists.Value()) {
        return Status::NotFound("Request not found: " + request_id);
    }
    return StatusOr<bool>(false);
}

StatusOr<bool> MySqlDispatchRepository::ReleaseClaim(const std::string& request_id,
                                                     const std::string& driver_id) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto result = ExecuteWrite(lease, fmt::format(
        "UPDATE delivery_requests SET driver_id = NULL, state = 'unassigned', claimed_at_ms = 0 "
        "WHERE request_id = '{}' AND driver_id = '{}' AND state = 'claimed'",
        lease->Escape(request_id), lease->Escape(driver_id)));
    if (!result.IsOk()) {
        return result.GetStatus();
    }
    if (result.Value() > 0) {
        return StatusOr<bool>(true);
    }
    auto exists = RequestExists(lease, request_id);
    if (!exists.IsOk()) {
        return exists.GetStatus();
    }
    if (!exists.Value()) {
        return Status::NotFound("Request not found: " + request_id);
    }
    return StatusOr<bool>(false);
}

StatusOr<bool> MySqlDispatchRepository::MarkAccepted(const std::string& request_id,
                                                     const std::string& driver_id) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto result = ExecuteWrite(lease, fmt::format(
        "UPDATE delivery_requests SET state = 'accepted' "
        "WHERE request_id = '{}' AND driver_id = '{}' AND state = 'claimed'",
        lease->Escape(request_id), lease->Escape(driver_id)));
    if (!result.IsOk()) {
        return result.GetStatus();
    }
    return StatusOr<bool>(result.Value() > 0);
}

StatusOr<std::vector<DeliveryRequest>> MySqlDispatchRepository::FetchPendingRequests(std::size_t limit) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto query = lease->Query(fmt::format(
        "SELECT {} FROM delivery_requests WHERE state = 'unassigned' AND driver_id IS NULL "
        "ORDER BY created_at_ms DESC LIMIT {}", kRequestColumns, limit));
    if (!query.IsOk()) {
        if (query.GetStatus().Code() == dispatch::common::StatusCode::kUnavailable) {
            lease.Invalidate();
        }
        return query.GetStatus();
    }
    auto res = std::move(query).Value();
    std::vector<DeliveryRequest> requests;
    while (MYSQL_ROW row = mysql_fetch_row(res.get())) {
        requests.push_back(RequestFromRow(row));
    }
    return StatusOr<std::vector<DeliveryRequest>>(std::move(requests));
}

} // namespace storage
} // namespace dispatch
