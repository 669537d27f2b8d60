#undef NDEBUG
#include <iostream>
#include <cassert>
#include <fstream>
#include <cstdio>
#include <stdexcept>
#include "../include/config_manager.hpp"

using namespace rw;

static const char* CONFIG_PATH = "test_config.yaml";

template <typename F>
static bool rejects(F&& f) {
    try { f(); } catch (const std::invalid_argument&) { return true; }
    return false;
}

void test_defaults_without_file() {
    std::remove(CONFIG_PATH);
    ConfigManager mgr(CONFIG_PATH);
    assert(!mgr.hasConfig());
    AppConfig cfg = mgr.load();
    assert(cfg.lat == 37.5665);
    assert(cfg.lon == 126.9780);
    assert(cfg.radius_km == 1000.0);
    assert(cfg.hours == 48);
    assert(cfg.time_zone == "Asia/Seoul");
    assert(cfg.threads == 4);
    std::cout << "Test 1 (Defaults): OK" << std::endl;
}

void test_load_file() {
    {
        std::ofstream f(CONFIG_PATH);
        f << "# observer\n"
          << "lat: 35.1796\n"
          << "lon: \"129.0756\"\n"
          << "radius_km: 1500\n"
          << "hours: 72\n"
          << "time_zone: 'UTC'\n"
          << "tle_file: stations.tle\n"
          << "sat_selection: ISS, NOAA\n"
          << "threads: 2\n";
    }
    AppConfig cfg = ConfigManager(CONFIG_PATH).load();
    assert(cfg.lat == 35.1796);
    assert(cfg.lon == 129.0756);
    assert(cfg.radius_km == 1500.0);
    assert(cfg.hours == 72);
    assert(cfg.time_zone == "UTC");
    assert(cfg.tle_file == "stations.tle");
    assert(cfg.sat_selection == "ISS, NOAA");
    assert(cfg.output_csv == "rangewindow_passes.csv");
    assert(cfg.threads == 2);
    cfg.validate();
    std::cout << "Test 2 (Load file): OK" << std::endl;
}

void test_round_trip() {
    AppConfig cfg;
    cfg.lat = -33.8688;
    cfg.lon = 151.2093;
    cfg.radius_km = 2000;
    cfg.hours = 168;
    cfg.time_zone = "UTC";
    cfg.output_csv = "out.csv";
    ConfigManager mgr(CONFIG_PATH);
    mgr.save(cfg);
    AppConfig back = mgr.load();
    assert(back.lat == cfg.lat);
    assert(back.lon == cfg.lon);
    assert(back.radius_km == cfg.radius_km);
    assert(back.hours == 168);
    assert(back.time_zone == "UTC");
    assert(back.output_csv == "out.csv");
    std::cout << "Test 3 (Round trip): OK" << std::endl;
}

void test_bad_number() {
    {
        std::ofstream f(CONFIG_PATH);
        f << "radius_km: wide\n";
    }
    assert(rejects([] { ConfigManager(CONFIG_PATH).load(); }));
    std::cout << "Test 4 (Bad number): OK" << std::endl;
}

void test_validate() {
    AppConfig ok;
    ok.time_zone = "UTC";
    ok.validate();

    AppConfig c = ok; c.lat = 90.5;
    assert(rejects([&] { c.validate(); }));
    c = ok; c.lon = -180.01;
    assert(rejects([&] { c.validate(); }));
    c = ok; c.radius_km = 0;
    assert(rejects([&] { c.validate(); }));
    c = ok; c.radius_km = -10;
    assert(rejects([&] { c.validate(); }));
    c = ok; c.hours = 36;
    assert(rejects([&] { c.validate(); }));
    c = ok; c.time_zone = "Nowhere/Town";
    assert(rejects([&] { c.validate(); }));
    c = ok; c.threads = 0;
    assert(rejects([&] { c.validate(); }));
    std::cout << "Test 5 (Validation): OK" << std::endl;
}

void test_integer_fields() {
    assert(parseInteger("48") == 48);
    assert(parseInteger("-3") == -3);
    assert(rejects([] { parseInteger("48.7"); }));
    assert(rejects([] { parseInteger("nan"); }));
    assert(rejects([] { parseInteger(""); }));
    bool out_of_range = false;
    try { parseInteger("100000000000000000000"); } catch (const std::out_of_range&) { out_of_range = true; }
    assert(out_of_range);

    {
        std::ofstream f(CONFIG_PATH);
        f << "hours: 48.7\n";
    }
    assert(rejects([] { ConfigManager(CONFIG_PATH).load(); }));
    {
        std::ofstream f(CONFIG_PATH);
        f << "threads: 1e20\n";
    }
    assert(rejects([] { ConfigManager(CONFIG_PATH).load(); }));
    std::cout << "Test 6 (Integer fields): OK" << std::endl;
}

int main() {
    test_defaults_without_file();
    test_load_file();
    test_round_trip();
    test_bad_number();
    test_validate();
    test_integer_fields();
    std::remove(CONFIG_PATH);
    std::cout << "ALL TESTS PASSED" << std::endl;
    return 0;
}
