#pragma once
#include <vector>
#include <chrono>
#include "types.hpp"

namespace rw {
    constexpr std::chrono::minutes SAMPLE_STEP{1};

    // horizon_hours * 60 instants, first == start, SAMPLE_STEP apart
    std::vector<TimePoint> buildTimeGrid(const TimePoint& start, int horizon_hours);

    // Allowed horizon values (hours)
    const std::vector<int>& horizonMenu();
    bool isValidHorizon(int horizon_hours);
}
