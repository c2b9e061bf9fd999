#include "core/assignment/location_cache.hpp"

#include "common/scheduler.hpp"

namespace dispatch {
namespace core {

using dispatch::common::Status;
using dispatch::common::StatusOr;

InMemoryLocationCache::InMemoryLocationCache(int ttl_seconds) : ttl_seconds_(ttl_seconds) {}

Status InMemoryLocationCache::Put(const std::string& driver_id, const DriverLocation& location) {
    if (driver_id.empty()) {
        return Status::InvalidArgument("Driver id is required");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    locations_[driver_id] = location;
    return Status::OK();
}

StatusOr<DriverLocation> InMemoryLocationCache::Get(const std::string& driver_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locations_.find(driver_id);
    if (it == locations_.end()) {
        return Status::NotFound("No cached location for driver " + driver_id);
    }
    const auto now_ms = dispatch::common::UnixMillis();
    if (now_ms - it->second.updated_at_ms > static_cast<std::int64_t>(ttl_seconds_) * 1000) {
        locations_.erase(it);
        return Status::NotFound("Cached location expired for driver " + driver_id);
    }
    return StatusOr<DriverLocation>(it->second);
}

}
}
