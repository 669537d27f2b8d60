#pragma once
#include <string>
#include <vector>
#include "element_set.hpp"
#include "observer.hpp"
#include "satellite.hpp"
#include "pass_detector.hpp"
#include "pass_table.hpp"

namespace rw {
    struct AggregateResult {
        PassTable table;
        std::vector<std::string> warnings; // one per skipped catalog entry
        int satellites_scanned = 0;
    };

    class PassAggregator {
    public:
        // Throws std::invalid_argument for radius <= 0 or horizon <= 0
        PassAggregator(const Observer& obs, double radius_km, int horizon_hours, size_t threads = 1);

        // Every satellite is scanned over the same grid starting at `now`.
        // Rows keep batch order whatever the thread count.
        AggregateResult run(const std::vector<RawElementSet>& batch, const TimePoint& now) const;

        std::vector<PassRecord> detect(const Satellite& sat, const std::vector<TimePoint>& grid) const;

    private:
        Observer observer_;
        double radius_km_;
        int horizon_hours_;
        size_t threads_;
    };
}
