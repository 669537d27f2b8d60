#include "local_clock.hpp"
#include "logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <stdexcept>

namespace rw {
    std::string LocalClock::zone_;

    bool LocalClock::isKnownZone(const std::string& zone_name) {
        if (zone_name.empty() || zone_name.front() == '/' || zone_name.find("..") != std::string::npos) return false;
        if (zone_name == "UTC") return true;
        const char* tzdir = std::getenv("TZDIR");
        std::filesystem::path base = (tzdir && *tzdir) ? tzdir : "/usr/share/zoneinfo";
        std::error_code ec;
        return std::filesystem::is_regular_file(base / zone_name, ec);
    }

    void LocalClock::setZone(const std::string& zone_name) {
        if (!isKnownZone(zone_name)) throw std::invalid_argument("Unknown time zone: " + zone_name);
        setenv("TZ", zone_name.c_str(), 1);
        tzset();
        zone_ = zone_name;
        Logger::log("Local time zone set to " + zone_name);
    }

    const std::string& LocalClock::zone() { return zone_; }

    std::string LocalClock::format(const TimePoint& t) {
        std::time_t tt = Clock::to_time_t(t);
        std::tm local_tm{};
        localtime_r(&tt, &local_tm);
        char t_buf[32];
        std::strftime(t_buf, sizeof(t_buf), "%Y-%m-%d %H:%M:%S", &local_tm);
        return std::string(t_buf);
    }

    std::string LocalClock::formatUtc(const TimePoint& t) {
        std::time_t tt = Clock::to_time_t(t);
        std::tm gmt{};
        gmtime_r(&tt, &gmt);
        char t_buf[32];
        std::strftime(t_buf, sizeof(t_buf), "%Y-%m-%d %H:%M:%S", &gmt);
        return std::string(t_buf);
    }

    TimePoint LocalClock::parseUtc(const std::string& text) {
        int Y, M, D, h, m, s;
        char tail;
        if (std::sscanf(text.c_str(), "%d-%d-%d %d:%d:%d%c", &Y, &M, &D, &h, &m, &s, &tail) != 6)
            throw std::invalid_argument("Invalid time format. Use \"YYYY-MM-DD HH:MM:SS\": " + text);
        if (M < 1 || M > 12 || D < 1 || D > 31 || h < 0 || h > 23 || m < 0 || m > 59 || s < 0 || s > 60)
            throw std::invalid_argument("Time field out of range: " + text);

        std::tm t = {};
        t.tm_year = Y - 1900;
        t.tm_mon = M - 1;
        t.tm_mday = D;
        t.tm_hour = h;
        t.tm_min = m;
        t.tm_sec = s;
        t.tm_isdst = 0;
        return Clock::from_time_t(timegm(&t));
    }
}
