#pragma once
#include "types.hpp"
#include "element_set.hpp"
#include "observer.hpp"
#include <string>
#include <memory>
#include <optional>
#include <utility>
#include <Tle.h>
#include <SGP4.h>
#include <Eci.h>

namespace rw {
    // libsgp4 propagation context for one element set, built once and reused
    // for every sample of a run.
    class Satellite {
    public:
        // Throws ElementSetError if libsgp4 rejects the element lines
        explicit Satellite(const OrbitalElementSet& elements);
        Satellite(Satellite&& other) noexcept = default;
        Satellite(const Satellite&) = delete;
        Satellite& operator=(const Satellite&) = delete;

        // ECI position (km) and velocity (km/s); empty when propagation fails at t
        std::optional<std::pair<Vector3, Vector3>> propagate(const TimePoint& t) const;
        GeoSample evaluate(const Observer& observer, const TimePoint& t) const;

        const std::string& getName() const { return name_; }
        int getNoradId() const { return norad_id_; }
        TimePoint getEpoch() const;

    private:
        std::string name_;
        int norad_id_ = 0;
        std::unique_ptr<libsgp4::Tle> tle_object_;
        std::unique_ptr<libsgp4::SGP4> sgp4_object_;

        std::optional<libsgp4::Eci> findPosition(const TimePoint& t) const;
    };
}
