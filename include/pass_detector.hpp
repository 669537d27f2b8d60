#pragma once
#include <string>
#include <vector>
#include <functional>
#include "types.hpp"

namespace rw {
    struct PassEvent {
        enum class Kind { ENTRY, EXIT };
        Kind kind;
        std::string name;
        std::string local_time;
        GeoSample sample;
        TimePoint time;
    };

    struct PassRecord {
        PassEvent entry;
        PassEvent exit;
        long duration_sec;
    };

    // Nth entry with Nth exit, up to the shorter of the two lists
    std::vector<PassRecord> pairEvents(const std::vector<PassEvent>& entries, const std::vector<PassEvent>& exits);

    class PassDetector {
    public:
        using Evaluator = std::function<GeoSample(const TimePoint&)>;

        PassDetector(std::string name, double radius_km);

        // Instants must arrive in strictly increasing order
        void feed(const TimePoint& t, const GeoSample& sample);
        void run(const std::vector<TimePoint>& grid, const Evaluator& evaluate);

        std::vector<PassRecord> finish() const;

        bool isInside() const { return inside_; }
        const std::vector<PassEvent>& getEntries() const { return entries_; }
        const std::vector<PassEvent>& getExits() const { return exits_; }
        int getSkippedSamples() const { return skipped_samples_; }

    private:
        std::string name_;
        double radius_km_;
        bool inside_ = false;
        int skipped_samples_ = 0;
        std::vector<PassEvent> entries_;
        std::vector<PassEvent> exits_;

        PassEvent makeEvent(PassEvent::Kind kind, const TimePoint& t, const GeoSample& sample) const;
    };
}
