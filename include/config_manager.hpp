#pragma once
#include <string>
#include <map>
#include "local_clock.hpp"

namespace rw {
    // Whole-string integer parse; throws std::invalid_argument or std::out_of_range
    int parseInteger(const std::string& text);

    struct AppConfig {
        // Default observer: Seoul
        double lat = 37.5665;
        double lon = 126.9780;
        double radius_km = 1000.0;
        int hours = 48;
        std::string time_zone = DEFAULT_TIME_ZONE;
        std::string tle_file = "";
        std::string sat_selection = ""; // Specific Satellite Names
        std::string output_csv = "rangewindow_passes.csv";
        int threads = 4;

        // Throws std::invalid_argument describing the first bad setting
        void validate() const;
    };

    class ConfigManager {
    public:
        ConfigManager(const std::string& filename);
        // Throws std::invalid_argument when a numeric key does not parse
        AppConfig load();
        void save(const AppConfig& config);
        bool hasConfig() const;
    private:
        std::string filename_;
        std::map<std::string, std::string> parse();
    };
}
