#include "observer.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace rw {
    Observer::Observer(double lat_deg, double lon_deg, double elevation_m)
        : location_{lat_deg, lon_deg, elevation_m / 1000.0} {
        if (!std::isfinite(lat_deg) || lat_deg < -90.0 || lat_deg > 90.0)
            throw std::invalid_argument("Observer latitude out of range: " + std::to_string(lat_deg));
        if (!std::isfinite(lon_deg) || lon_deg < -180.0 || lon_deg > 180.0)
            throw std::invalid_argument("Observer longitude out of range: " + std::to_string(lon_deg));
    }

    Vector3 Observer::getPositionECI(const TimePoint& t) const {
        double lat_rad = location_.lat_deg * DEG2RAD;
        double lon_rad = location_.lon_deg * DEG2RAD;
        double a = EARTH_RADIUS_KM; double f = EARTH_FLATTENING; double e2 = 2*f - f*f;
        double N = a / std::sqrt(1 - e2 * std::sin(lat_rad) * std::sin(lat_rad));
        double x_ecf = (N + location_.alt_km) * std::cos(lat_rad) * std::cos(lon_rad);
        double y_ecf = (N + location_.alt_km) * std::cos(lat_rad) * std::sin(lon_rad);
        double z_ecf = (N * (1 - e2) + location_.alt_km) * std::sin(lat_rad);
        double theta = getGMST(t);
        return { x_ecf * std::cos(theta) - y_ecf * std::sin(theta),
                 x_ecf * std::sin(theta) + y_ecf * std::cos(theta), z_ecf };
    }

    double Observer::slantRangeKm(const Vector3& sat_eci, const TimePoint& t) const {
        return (sat_eci - getPositionECI(t)).magnitude();
    }
}
