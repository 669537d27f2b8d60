#include "time_grid.hpp"
#include <algorithm>

namespace rw {
    std::vector<TimePoint> buildTimeGrid(const TimePoint& start, int horizon_hours) {
        std::vector<TimePoint> grid;
        if (horizon_hours <= 0) return grid;
        const int samples = horizon_hours * 60;
        grid.reserve(samples);
        TimePoint t = start;
        for (int i = 0; i < samples; ++i) {
            grid.push_back(t);
            t += SAMPLE_STEP;
        }
        return grid;
    }

    const std::vector<int>& horizonMenu() {
        static const std::vector<int> menu = {12, 24, 48, 72, 168};
        return menu;
    }

    bool isValidHorizon(int horizon_hours) {
        const auto& menu = horizonMenu();
        return std::find(menu.begin(), menu.end(), horizon_hours) != menu.end();
    }
}
