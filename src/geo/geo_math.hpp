#pragma once

#include "common/status_or.hpp"

namespace dispatch {
namespace geo {

constexpr double kEarthRadiusKm = 6371.0;
constexpr double kMinAssumedSpeedKmh = 5.0;

// WGS84 坐标值类型, 只能通过 Create 在边界处校验后构造
class GeoPoint {
public:
    GeoPoint() = default;

    static dispatch::common::StatusOr<GeoPoint> Create(double latitude, double longitude);
    static bool IsValid(double latitude, double longitude);

    double Latitude() const { return latitude_; }
    double Longitude() const { return longitude_; }

    bool operator==(const GeoPoint& other) const {
        return latitude_ == other.latitude_ && longitude_ == other.longitude_;
    }
private:
    GeoPoint(double latitude, double longitude) : latitude_(latitude), longitude_(longitude) {}

    double latitude_ = 0.0;
    double longitude_ = 0.0;
};

// haversine 大圆距离, 单位公里
double DistanceKm(double lat1, double lon1, double lat2, double lon2);
double DistanceKm(const GeoPoint& a, const GeoPoint& b);

// 线性估算到达时间, 速度低于 kMinAssumedSpeedKmh 时按下限计算
double EtaMinutes(double distance_km, double assumed_speed_kmh);

// 派单成功后给下单方的预计到达时间: 匀速行驶时间加上 min(2*距离, 15) 分钟缓冲
double DeliveryEtaMinutes(double distance_km, double assumed_speed_kmh);

} // namespace geo
} // namespace dispatch
