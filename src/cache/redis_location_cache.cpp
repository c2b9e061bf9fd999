#include "cache/redis_location_cache.hpp"

#include <fmt/format.h>

#include <cstdlib>

namespace dispatch {
namespace cache {

using dispatch::common::Status;
using dispatch::common::StatusOr;

RedisLocationCache::RedisLocationCache(std::shared_ptr<RedisClient> redis, int ttl_seconds)
    : redis_(std::move(redis)), ttl_seconds_(ttl_seconds) {}

std::string RedisLocationCache::KeyForDriver(const std::string& driver_id) {
    return "dispatch:location:driver:" + driver_id;
}

Status RedisLocationCache::Put(const std::string& driver_id, const dispatch::core::DriverLocation& location) {
    const auto key = KeyForDriver(driver_id);
    // 可选字段缺省时删除旧值, 避免读到上一次的朝向或速度
    auto put_optional = [&](const char* field, const std::optional<double>& value) {
        if (value) {
            return redis_->HSet(key, field, fmt::format("{}", *value));
        }
        return redis_->HDel(key, field);
    };

    auto status = redis_->HSet(key, "lat", fmt::format("{}", location.point.Latitude()));
    if (status.IsOk()) {
        status = redis_->HSet(key, "lon", fmt::format("{}", location.point.Longitude()));
    }
    if (status.IsOk()) {
        status = put_optional("heading", location.heading);
    }
    if (status.IsOk()) {
        status = put_optional("speed", location.speed_kmh);
    }
    if (status.IsOk()) {
        status = redis_->HSet(key, "updated_at", std::to_string(location.updated_at_ms));
    }
    if (!status.IsOk()) {
        return status;
    }
    return redis_->Expire(key, ttl_seconds_);
}

StatusOr<dispatch::core::DriverLocation> RedisLocationCache::Get(const std::string& driver_id) {
    auto fields = redis_->HGetAll(KeyForDriver(driver_id));
    if (!fields.IsOk()) {
        return fields.GetStatus();
    }
    const auto& values = fields.Value();
    auto lat = values.find("lat");
    auto lon = values.find("lon");
    if (lat == values.end() || lon == values.end()) {
        return Status::NotFound("No cached location for driver " + driver_id);
    }
    auto point = dispatch::geo::GeoPoint::Create(std::strtod(lat->second.c_str(), nullptr),
                                                 std::strtod(lon->second.c_str(), nullptr));
    if (!point.IsOk()) {
        return Status::NotFound("Cached location is invalid for driver " + driver_id);
    }

    dispatch::core::DriverLocation location;
    location.point = point.Value();
    if (auto it = values.find("heading"); it != values.end()) {
        location.heading = std::strtod(it->second.c_str(), nullptr);
    }
    if (auto it = values.find("speed"); it != values.end()) {
        location.speed_kmh = std::strtod(it->second.c_str(), nullptr);
    }
    if (auto it = values.find("updated_at"); it != values.end()) {
        location.updated_at_ms = std::strtoll(it->second.c_str(), nullptr, 10);
    }
    return StatusOr<dispatch::core::DriverLocation>(location);
}

} // namespace cache
} // namespace dispatch
