#pragma once

#include "cache/redis_client.hpp"
#include "core/assignment/location_cache.hpp"

#include <memory>
#include <string>

namespace dispatch {
namespace cache {

// 哈希键 dispatch:location:driver:<id>, 字段 lat/lon/heading/speed/updated_at
class RedisLocationCache : public dispatch::core::LocationCache {
public:
    RedisLocationCache(std::shared_ptr<RedisClient> redis, int ttl_seconds);

    dispatch::common::Status Put(const std::string& driver_id,
                                 const dispatch::core::DriverLocation& location) override;
    dispatch::common::StatusOr<dispatch::core::DriverLocation> Get(const std::string& driver_id) override;

private:
    static std::string KeyForDriver(const std::string& driver_id);

    std::shared_ptr<RedisClient> redis_;
    int ttl_seconds_;
};

} // namespace cache
} // namespace dispatch
