#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/assignment/assignment_types.hpp"

#include <mutex>
#include <string>
#include <unordered_map>

namespace dispatch {
namespace core {

// 司机实时位置缓存, 条目在 TTL 后失效
class LocationCache {
public:
    virtual ~LocationCache() = default;
    virtual dispatch::common::Status Put(const std::string& driver_id, const DriverLocation& location) = 0;
    virtual dispatch::common::StatusOr<DriverLocation> Get(const std::string& driver_id) = 0;
};

class InMemoryLocationCache : public LocationCache {
public:
    explicit InMemoryLocationCache(int ttl_seconds);

    dispatch::common::Status Put(const std::string& driver_id, const DriverLocation& location) override;
    dispatch::common::StatusOr<DriverLocation> Get(const std::string& driver_id) override;
private:
    int ttl_seconds_;
    std::mutex mutex_;
    std::unordered_map<std::string, DriverLocation> locations_;
};

}
}
