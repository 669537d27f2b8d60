#include "config_manager.hpp"
#include "time_grid.hpp"
#include "logger.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <filesystem>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace rw {
    static std::string clean(const std::string& str) {
        std::string s = str;
        s.erase(std::remove(s.begin(), s.end(), '\r'), s.end());
        s.erase(std::remove(s.begin(), s.end(), '\n'), s.end());

        size_t first = s.find_first_not_of(" \t");
        if (std::string::npos == first) return "";
        size_t last = s.find_last_not_of(" \t");
        s = s.substr(first, (last - first + 1));

        // Trim Quotes if they wrap the string
        if (s.size() >= 2) {
            if ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\'')) {
                s = s.substr(1, s.size() - 2);
            }
        }
        return s;
    }

    void AppConfig::validate() const {
        if (!std::isfinite(lat) || lat < -90.0 || lat > 90.0)
            throw std::invalid_argument("lat must be within -90..90");
        if (!std::isfinite(lon) || lon < -180.0 || lon > 180.0)
            throw std::invalid_argument("lon must be within -180..180");
        if (!std::isfinite(radius_km) || radius_km <= 0.0)
            throw std::invalid_argument("radius_km must be positive");
        if (!isValidHorizon(hours)) {
            std::string menu;
            for (int h : horizonMenu()) menu += (menu.empty() ? "" : ", ") + std::to_string(h);
            throw std::invalid_argument("hours must be one of: " + menu);
        }
        if (!LocalClock::isKnownZone(time_zone))
            throw std::invalid_argument("Unknown time_zone: " + time_zone);
        if (threads < 1) throw std::invalid_argument("threads must be at least 1");
    }

    ConfigManager::ConfigManager(const std::string& filename) : filename_(filename) {}
    bool ConfigManager::hasConfig() const { return std::filesystem::exists(filename_); }

    std::map<std::string, std::string> ConfigManager::parse() {
        std::map<std::string, std::string> data;
        std::ifstream file(filename_);
        std::string line;
        while(std::getline(file, line)) {
            std::string stripped = clean(line);
            if (stripped.empty() || stripped.front() == '#') continue;
            size_t delim = line.find(':');
            if (delim != std::string::npos) {
                std::string key = clean(line.substr(0, delim));
                std::string val = clean(line.substr(delim + 1));
                data[key] = val;
            }
        }
        return data;
    }

    int parseInteger(const std::string& text) {
        size_t pos = 0;
        int value = std::stoi(text, &pos);
        if (pos != text.size()) throw std::invalid_argument("Not an integer: " + text);
        return value;
    }

    AppConfig ConfigManager::load() {
        AppConfig cfg;
        if (!hasConfig()) return cfg;
        auto data = parse();
        std::string current_key;
        try {
            auto num = [&](const char* key, double& out) { if (data.count(key)) { current_key = key; out = std::stod(data[key]); } };
            auto integer = [&](const char* key, int& out) { if (data.count(key)) { current_key = key; out = parseInteger(data[key]); } };
            num("lat", cfg.lat);
            num("lon", cfg.lon);
            num("radius_km", cfg.radius_km);
            integer("hours", cfg.hours);
            integer("threads", cfg.threads);
        } catch (const std::logic_error&) {
            throw std::invalid_argument("Error parsing " + filename_ + ": bad value for '" + current_key + "'");
        }

        if (data.count("time_zone")) cfg.time_zone = data["time_zone"];
        if (data.count("tle_file")) cfg.tle_file = data["tle_file"];
        if (data.count("sat_selection")) cfg.sat_selection = data["sat_selection"];
        if (data.count("output_csv")) cfg.output_csv = data["output_csv"];

        std::cout << "[CONFIG] Loaded " << filename_ << std::endl;
        Logger::log("Config loaded from " + filename_);
        return cfg;
    }

    void ConfigManager::save(const AppConfig& config) {
        std::ofstream file(filename_);
        file << std::setprecision(10);
        file << "lat: " << config.lat << "\n";
        file << "lon: " << config.lon << "\n";
        file << "radius_km: " << config.radius_km << "\n";
        file << "hours: " << config.hours << "\n";
        file << "time_zone: " << config.time_zone << "\n";
        file << "tle_file: " << config.tle_file << "\n";
        file << "sat_selection: " << config.sat_selection << "\n";
        file << "output_csv: " << config.output_csv << "\n";
        file << "threads: " << config.threads << "\n";
        file.close();
        Logger::log("Config saved to " + filename_);
    }
}
