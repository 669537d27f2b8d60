#include "pass_detector.hpp"
#include "local_clock.hpp"
#include "logger.hpp"
#include <algorithm>
#include <utility>

namespace rw {
    std::vector<PassRecord> pairEvents(const std::vector<PassEvent>& entries, const std::vector<PassEvent>& exits) {
        std::vector<PassRecord> results;
        size_t count = std::min(entries.size(), exits.size());
        results.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            long duration = static_cast<long>(
                std::chrono::duration_cast<std::chrono::seconds>(exits[i].time - entries[i].time).count());
            results.push_back({entries[i], exits[i], duration});
        }
        return results;
    }

    PassDetector::PassDetector(std::string name, double radius_km)
        : name_(std::move(name)), radius_km_(radius_km) {}

    PassEvent PassDetector::makeEvent(PassEvent::Kind kind, const TimePoint& t, const GeoSample& sample) const {
        return {kind, name_, LocalClock::format(t), sample, t};
    }

    void PassDetector::feed(const TimePoint& t, const GeoSample& sample) {
        // No range: leave the state untouched for this instant
        if (!sample.range_km) { skipped_samples_++; return; }

        double range = *sample.range_km;
        if (!inside_ && range <= radius_km_) {
            inside_ = true;
            entries_.push_back(makeEvent(PassEvent::Kind::ENTRY, t, sample));
        } else if (inside_ && range > radius_km_) {
            inside_ = false;
            exits_.push_back(makeEvent(PassEvent::Kind::EXIT, t, sample));
        }
    }

    void PassDetector::run(const std::vector<TimePoint>& grid, const Evaluator& evaluate) {
        for (const auto& t : grid) feed(t, evaluate(t));
    }

    std::vector<PassRecord> PassDetector::finish() const {
        if (skipped_samples_ > 0)
            Logger::debug(name_ + ": " + std::to_string(skipped_samples_) + " samples without slant range");
        if (entries_.size() > exits_.size())
            Logger::debug(name_ + ": " + std::to_string(entries_.size() - exits_.size()) + " pass still open at horizon end, dropped");
        return pairEvents(entries_, exits_);
    }
}
