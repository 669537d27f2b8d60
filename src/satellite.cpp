#include "satellite.hpp"
#include "logger.hpp"
#include <cmath>
#include <ctime>
#include <chrono>
#include <CoordGeodetic.h>
#include <DateTime.h>
#include <DecayedException.h>
#include <SatelliteException.h>
#include <TleException.h>

namespace rw {
    static libsgp4::DateTime toDateTime(const TimePoint& t) {
        std::time_t tt = Clock::to_time_t(t);
        std::tm gmt{};
        gmtime_r(&tt, &gmt);
        libsgp4::DateTime dt(gmt.tm_year + 1900, gmt.tm_mon + 1, gmt.tm_mday, gmt.tm_hour, gmt.tm_min, gmt.tm_sec);
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(t - Clock::from_time_t(tt)).count();
        return (us > 0) ? dt.AddMicroseconds(static_cast<double>(us)) : dt;
    }

    Satellite::Satellite(const OrbitalElementSet& elements) : name_(elements.getName()) {
        try {
            tle_object_ = std::make_unique<libsgp4::Tle>(name_, elements.getLine1(), elements.getLine2());
            sgp4_object_ = std::make_unique<libsgp4::SGP4>(*tle_object_);
            norad_id_ = static_cast<int>(tle_object_->NoradNumber());
        } catch (const libsgp4::TleException& e) {
            throw ElementSetError("Element set [" + name_ + "] rejected: " + e.what());
        } catch (const libsgp4::SatelliteException& e) {
            throw ElementSetError("Element set [" + name_ + "] cannot be propagated: " + e.what());
        }
    }

    TimePoint Satellite::getEpoch() const {
        libsgp4::DateTime ep = tle_object_->Epoch();
        std::tm t = {};
        t.tm_year = ep.Year() - 1900; t.tm_mon = ep.Month() - 1; t.tm_mday = ep.Day();
        t.tm_hour = ep.Hour(); t.tm_min = ep.Minute(); t.tm_sec = ep.Second();
        return Clock::from_time_t(timegm(&t)) + std::chrono::microseconds(ep.Microsecond());
    }

    std::optional<libsgp4::Eci> Satellite::findPosition(const TimePoint& t) const {
        try {
            return sgp4_object_->FindPosition(toDateTime(t));
        } catch (const libsgp4::DecayedException& e) {
            Logger::debug(name_ + " decayed at sample: " + e.what());
        } catch (const libsgp4::SatelliteException& e) {
            Logger::debug(name_ + " propagation failed at sample: " + e.what());
        }
        return std::nullopt;
    }

    std::optional<std::pair<Vector3, Vector3>> Satellite::propagate(const TimePoint& t) const {
        auto eci = findPosition(t);
        if (!eci) return std::nullopt;
        libsgp4::Vector pos = eci->Position(); libsgp4::Vector vel = eci->Velocity();
        return std::make_pair(Vector3{pos.x, pos.y, pos.z}, Vector3{vel.x, vel.y, vel.z});
    }

    GeoSample Satellite::evaluate(const Observer& observer, const TimePoint& t) const {
        GeoSample sample;
        auto eci = findPosition(t);
        if (!eci) return sample;

        libsgp4::Vector pos = eci->Position(); libsgp4::Vector vel = eci->Velocity();
        libsgp4::CoordGeodetic geo = eci->ToGeodetic();
        sample.lat_deg = round3(geo.latitude * RAD2DEG);
        sample.lon_deg = round3(geo.longitude * RAD2DEG);
        sample.alt_km = round3(geo.altitude);
        sample.horiz_vel_kms = round3(Vector3{vel.x, vel.y, vel.z}.horizontalMagnitude());

        double range = observer.slantRangeKm({pos.x, pos.y, pos.z}, t);
        if (std::isfinite(range)) sample.range_km = range;
        return sample;
    }
}
