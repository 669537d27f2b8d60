#pragma once
#include <string>
#include "types.hpp"

namespace rw {
    constexpr const char* DEFAULT_TIME_ZONE = "Asia/Seoul";

    // Process-wide fixed local zone. setZone() must run before worker threads
    // start formatting; format() itself is safe to call concurrently.
    class LocalClock {
    public:
        static void setZone(const std::string& zone_name);
        // Empty until setZone(); format() then follows the inherited process zone
        static const std::string& zone();
        static bool isKnownZone(const std::string& zone_name);

        // "YYYY-MM-DD HH:MM:SS", no offset suffix
        static std::string format(const TimePoint& t);
        static std::string formatUtc(const TimePoint& t);

        // Parses "YYYY-MM-DD HH:MM:SS" as UTC. Throws std::invalid_argument on bad input.
        static TimePoint parseUtc(const std::string& text);

    private:
        static std::string zone_;
    };
}
