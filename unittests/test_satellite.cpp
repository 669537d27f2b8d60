#undef NDEBUG
#include <iostream>
#include <cassert>
#include <cmath>
#include <stdexcept>
#include "../include/satellite.hpp"
#include "../include/observer.hpp"
#include "../include/local_clock.hpp"
#include "../include/pass_table.hpp"

using namespace rw;

static const OrbitalElementSet ISS("ISS (ZARYA)",
    "1 25544U 98067A   08264.51782528 -.00002182  00000-0 -11606-4 0  2927",
    "2 25544  51.6416 247.4627 0006703 130.5360 325.0288 15.72125391563537");

static bool isRounded3(double v) {
    double scaled = v * 1000.0;
    return std::abs(scaled - std::round(scaled)) < 1e-6;
}

void test_construction() {
    Satellite sat(ISS);
    assert(sat.getName() == "ISS (ZARYA)");
    assert(sat.getNoradId() == 25544);
    // Epoch 08264.51782528 = 2008-09-20 12:25:40.104 UTC
    TimePoint expected = LocalClock::parseUtc("2008-09-20 12:25:40");
    double diff = std::chrono::duration<double>(sat.getEpoch() - expected).count();
    std::cout << "Test 1 (Epoch offset): " << diff << "s (Expected ~0.1)" << std::endl;
    assert(diff >= 0.0 && diff < 1.0);
}

void test_rejected_lines() {
    bool thrown = false;
    try {
        // Element lines truncated: libsgp4 refuses them
        Satellite bad(OrbitalElementSet("SHORT", "1 25544U 98067A   08264.51782528", "2 25544  51.6416 247.4627"));
    } catch (const ElementSetError& e) {
        thrown = true;
        std::cout << "Test 2 (Rejected lines): " << e.what() << std::endl;
    }
    assert(thrown);
}

void test_propagate() {
    Satellite sat(ISS);
    auto state = sat.propagate(sat.getEpoch());
    assert(state.has_value());
    double r = state->first.magnitude();
    double v = state->second.magnitude();
    std::cout << "Test 3 (Propagate): r=" << r << " km v=" << v << " km/s" << std::endl;
    assert(r > 6650.0 && r < 6800.0);
    assert(v > 7.5 && v < 7.9);
}

void test_evaluate() {
    Satellite sat(ISS);
    Observer seoul(37.5665, 126.9780);
    TimePoint t = sat.getEpoch() + std::chrono::minutes(30);
    GeoSample s = sat.evaluate(seoul, t);
    assert(s.lat_deg && s.lon_deg && s.alt_km && s.horiz_vel_kms && s.range_km);
    std::cout << "Test 4 (Evaluate): lat=" << *s.lat_deg << " lon=" << *s.lon_deg << " alt=" << *s.alt_km
              << " hvel=" << *s.horiz_vel_kms << " range=" << *s.range_km << std::endl;
    assert(std::abs(*s.lat_deg) <= 51.7);
    assert(*s.lon_deg >= -180.0 && *s.lon_deg <= 180.0);
    assert(*s.alt_km > 300.0 && *s.alt_km < 420.0);
    // Horizontal speed never exceeds full inertial speed
    auto state = sat.propagate(t);
    assert(*s.horiz_vel_kms > 0.0 && *s.horiz_vel_kms <= state->second.magnitude() + 0.001);
    assert(isRounded3(*s.lat_deg) && isRounded3(*s.lon_deg) && isRounded3(*s.alt_km) && isRounded3(*s.horiz_vel_kms));
    // Slant range is bounded by the geometry: at least the altitude, at most orbit radius + Earth radius
    assert(*s.range_km >= *s.alt_km - 1.0);
    assert(*s.range_km < 6800.0 + EARTH_RADIUS_KM);
}

void test_decayed_orbit() {
    // ~160 km perigee with heavy drag: SGP4 gives up long before a year has passed
    Satellite sat(OrbitalElementSet("DECAYING SAT",
        "1 99902U 98067C   08264.51782528  .00100000  00000-0  10000-1 0  2926",
        "2 99902  51.6416 247.4627 0006703 130.5360 325.0288 16.40000000563531"));
    Observer seoul(37.5665, 126.9780);

    GeoSample fresh = sat.evaluate(seoul, sat.getEpoch());
    assert(fresh.lat_deg && fresh.range_km);

    TimePoint late = sat.getEpoch() + std::chrono::hours(24 * 365);
    assert(!sat.propagate(late).has_value());
    GeoSample s = sat.evaluate(seoul, late);
    assert(!s.lat_deg && !s.lon_deg && !s.alt_km && !s.horiz_vel_kms && !s.range_km);
    assert(formatValue(s.lat_deg) == "");
    assert(formatValue(s.lon_deg) == "");
    assert(formatValue(s.alt_km) == "");
    assert(formatValue(s.horiz_vel_kms) == "");
    assert(formatValue(s.range_km) == "");
    std::cout << "Test 5 (Decayed orbit): all fields empty" << std::endl;
}

void test_observer() {
    bool thrown = false;
    try { Observer bad(91.0, 0.0); } catch (const std::invalid_argument&) { thrown = true; }
    assert(thrown);
    thrown = false;
    try { Observer bad(0.0, 181.0); } catch (const std::invalid_argument&) { thrown = true; }
    assert(thrown);

    Observer equator(0.0, 0.0, 0.0);
    TimePoint t = LocalClock::parseUtc("2025-01-01 00:00:00");
    Vector3 pos = equator.getPositionECI(t);
    assert(std::abs(pos.magnitude() - EARTH_RADIUS_KM) < 1e-6);
    assert(std::abs(pos.z) < 1e-9);
    assert(equator.slantRangeKm(pos, t) < 1e-9);

    // Default elevation is 38 m
    Observer pole(90.0, 0.0);
    assert(std::abs(pole.getLocation().alt_km - 0.038) < 1e-12);
    double polar_radius = EARTH_RADIUS_KM * (1.0 - EARTH_FLATTENING);
    assert(std::abs(pole.getPositionECI(t).z - (polar_radius + 0.038)) < 1e-6);
    std::cout << "Test 6 (Observer): OK" << std::endl;
}

int main() {
    test_construction();
    test_rejected_lines();
    test_propagate();
    test_evaluate();
    test_decayed_orbit();
    test_observer();
    std::cout << "ALL TESTS PASSED" << std::endl;
    return 0;
}
