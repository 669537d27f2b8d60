#include <iostream>
#include <vector>
#include <string>
#include <stdexcept>
#include "config_manager.hpp"
#include "local_clock.hpp"
#include "logger.hpp"
#include "observer.hpp"
#include "pass_aggregator.hpp"
#include "tle_reader.hpp"

using namespace rw;

void print_help() {
    std::cout << "Usage: ./RangeWindow --tle <file> [OPTIONS]\n\n"
              << "Lists every interval in which a satellite stays within a slant-range\n"
              << "radius of a ground location.\n\n"
              << "Options:\n"
              << "  --help, -h        Show help\n"
              << "  --tle <file>      TLE file (name line + 2 element lines per satellite, '-' = stdin)\n"
              << "  --satsel <list>   Comma-separated satellite names to keep (substring match)\n"
              << "  --lat <deg>       Observer latitude  (default 37.5665, Seoul)\n"
              << "  --lon <deg>       Observer longitude (default 126.9780, Seoul)\n"
              << "  --radius <km>     Slant-range radius (default 1000)\n"
              << "  --hours <N>       Horizon in hours: 12, 24, 48, 72 or 168 (default 48)\n"
              << "  --tz <zone>       Local time zone for timestamps (default Asia/Seoul)\n"
              << "  --out <file>      CSV output path ('-' = stdout)\n"
              << "  --threads <N>     Worker threads (1 = sequential)\n"
              << "  --time <str>      Start time in UTC instead of now (e.g. \"2025-01-01 12:00:00\")\n"
              << "  --save            Write the effective settings back to config.yaml\n"
              << "\nConfiguration is loaded from config.yaml by default.\n";
}

int main(int argc, char* argv[]) {
    for(int i=1; i<argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_help();
            return 0;
        }
    }

    Logger::log("Application Starting...");

    try {
        ConfigManager config_mgr("config.yaml");
        AppConfig config = config_mgr.load();

        bool save_config = false;
        bool sim_time = false;
        TimePoint now = Clock::now();

        for(int i=1; i<argc; ++i) {
            std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i+1 >= argc) throw std::invalid_argument("Missing value for " + arg);
                return argv[++i];
            };
            auto number = [&]() -> double {
                std::string v = value();
                try { return std::stod(v); }
                catch (const std::logic_error&) { throw std::invalid_argument("Bad number for " + arg + ": " + v); }
            };
            auto integer = [&]() -> int {
                std::string v = value();
                try { return parseInteger(v); }
                catch (const std::logic_error&) { throw std::invalid_argument("Bad integer for " + arg + ": " + v); }
            };

            if (arg == "--tle") config.tle_file = value();
            else if (arg == "--satsel") config.sat_selection = value();
            else if (arg == "--lat") config.lat = number();
            else if (arg == "--lon") config.lon = number();
            else if (arg == "--radius") config.radius_km = number();
            else if (arg == "--hours") config.hours = integer();
            else if (arg == "--tz") config.time_zone = value();
            else if (arg == "--out") config.output_csv = value();
            else if (arg == "--threads") config.threads = integer();
            else if (arg == "--save") save_config = true;
            else if (arg == "--time") {
                std::string t_str = value();
                // Handle unquoted date and time as two arguments
                if (t_str.find(' ') == std::string::npos && i+1 < argc && std::string(argv[i+1]).rfind("--", 0) != 0) t_str += std::string(" ") + argv[++i];
                now = LocalClock::parseUtc(t_str);
                sim_time = true;
                Logger::log("Simulating Time: " + t_str + " UTC");
            }
            else {
                std::cerr << "[WARN] Ignoring unknown option: " << arg << std::endl;
            }
        }

        // Preconditions: nothing is scanned until the run settings hold
        config.validate();
        if (config.tle_file.empty()) throw std::invalid_argument("No TLE input. Use --tle <file> or set tle_file in config.yaml");

        LocalClock::setZone(config.time_zone);
        Observer observer(config.lat, config.lon);

        if (save_config) config_mgr.save(config);

        // Keep stdout clean when the CSV goes there
        std::ostream& status = (config.output_csv == "-") ? std::cerr : std::cout;
        status << "[TLE] Reading: " << config.tle_file << std::endl;
        std::vector<RawElementSet> batch = (config.tle_file == "-") ? TleReader::parse(std::cin)
                                                                   : TleReader::parseFile(config.tle_file);
        if (!config.sat_selection.empty()) {
            batch = TleReader::selectByName(batch, config.sat_selection);
            status << "[TLE] Selected " << batch.size() << " entries matching: " << config.sat_selection << std::endl;
        }
        if (batch.empty()) {
            std::cerr << "ERROR: No satellites loaded! Check the TLE input." << std::endl;
            Logger::log("ERROR: No satellites loaded");
            return 1;
        }

        status << "[RUN] Observer " << config.lat << ", " << config.lon
               << " | radius " << config.radius_km << " km | " << config.hours << " h from "
               << LocalClock::format(now) << " " << config.time_zone << (sim_time ? " (simulated)" : "") << std::endl;

        PassAggregator aggregator(observer, config.radius_km, config.hours, static_cast<size_t>(config.threads));
        AggregateResult result = aggregator.run(batch, now);

        for (const auto& w : result.warnings) std::cerr << "[WARN] " << w << std::endl;
        status << "[RUN] " << result.satellites_scanned << " satellites scanned, "
               << result.table.size() << " passes found" << std::endl;

        if (config.output_csv == "-") {
            result.table.writeCsv(std::cout);
        } else {
            result.table.writeCsvFile(config.output_csv);
            std::cout << "[CSV] Written: " << config.output_csv << std::endl;
        }
        Logger::log("Run Complete");

    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        Logger::log(std::string("ERROR: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "FATAL ERROR: " << e.what() << std::endl;
        Logger::log(std::string("FATAL ERROR: ") + e.what());
        return 1;
    }
    return 0;
}
