#pragma once
#include "types.hpp"

namespace rw {
    // Elevation used for every ground point in this system
    constexpr double DEFAULT_OBSERVER_ELEVATION_M = 38.0;

    // Fixed ground location. Throws std::invalid_argument when lat/lon are out of range.
    class Observer {
    public:
        Observer(double lat_deg, double lon_deg, double elevation_m = DEFAULT_OBSERVER_ELEVATION_M);
        Geodetic getLocation() const { return location_; }
        Vector3 getPositionECI(const TimePoint& t) const;
        double slantRangeKm(const Vector3& sat_eci, const TimePoint& t) const;

    private:
        Geodetic location_;
    };
}
