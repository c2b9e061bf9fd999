#include "geo/geo_math.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace dispatch {
namespace geo {

namespace {

constexpr double kPi = 3.14159265358979323846;

double ToRadians(double degrees) {
    return degrees * (kPi / 180.0);
}

} // namespace

bool GeoPoint::IsValid(double latitude, double longitude) {
    if (!std::isfinite(latitude) || !std::isfinite(longitude)) {
        return false;
    }
    return std::fabs(latitude) <= 90.0 && std::fabs(longitude) <= 180.0;
}

dispatch::common::StatusOr<GeoPoint> GeoPoint::Create(double latitude, double longitude) {
    if (!IsValid(latitude, longitude)) {
        return dispatch::common::Status::InvalidArgument(
            "invalid coordinates: " + std::to_string(latitude) + "," + std::to_string(longitude));
    }
    return dispatch::common::StatusOr<GeoPoint>(GeoPoint(latitude, longitude));
}

double DistanceKm(double lat1, double lon1, double lat2, double lon2) {
    const double d_lat = ToRadians(lat2 - lat1);
    const double d_lon = ToRadians(lon2 - lon1);

    const double a = std::sin(d_lat / 2) * std::sin(d_lat / 2) +
                     std::cos(ToRadians(lat1)) * std::cos(ToRadians(lat2)) *
                     std::sin(d_lon / 2) * std::sin(d_lon / 2);
    // 浮点误差可能让 a 略超出 [0, 1]
    const double clamped = std::min(1.0, std::max(0.0, a));
    const double c = 2 * std::atan2(std::sqrt(clamped), std::sqrt(1 - clamped));
    return kEarthRadiusKm * c;
}

double DistanceKm(const GeoPoint& a, const GeoPoint& b) {
    return DistanceKm(a.Latitude(), a.Longitude(), b.Latitude(), b.Longitude());
}

double EtaMinutes(double distance_km, double assumed_speed_kmh) {
    const double speed = std::max(assumed_speed_kmh, kMinAssumedSpeedKmh);
    return std::max(0.0, distance_km) / speed * 60.0;
}

double DeliveryEtaMinutes(double distance_km, double assumed_speed_kmh) {
    const double buffer = std::min(distance_km * 2.0, 15.0);
    return EtaMinutes(distance_km, assumed_speed_kmh) + buffer;
}

} // namespace geo
} // namespace dispatch
