#include "pass_aggregator.hpp"
#include "time_grid.hpp"
#include "thread_pool.hpp"
#include "logger.hpp"
#include <algorithm>
#include <future>
#include <stdexcept>

namespace rw {
    PassAggregator::PassAggregator(const Observer& obs, double radius_km, int horizon_hours, size_t threads)
        : observer_(obs), radius_km_(radius_km), horizon_hours_(horizon_hours), threads_(threads) {
        if (!(radius_km > 0.0)) throw std::invalid_argument("Radius must be positive: " + std::to_string(radius_km));
        if (horizon_hours <= 0) throw std::invalid_argument("Horizon must be positive: " + std::to_string(horizon_hours));
    }

    std::vector<PassRecord> PassAggregator::detect(const Satellite& sat, const std::vector<TimePoint>& grid) const {
        PassDetector detector(sat.getName(), radius_km_);
        detector.run(grid, [&](const TimePoint& t) { return sat.evaluate(observer_, t); });
        return detector.finish();
    }

    AggregateResult PassAggregator::run(const std::vector<RawElementSet>& batch, const TimePoint& now) const {
        AggregateResult result;
        std::vector<Satellite> sats;
        sats.reserve(batch.size());

        for (size_t i = 0; i < batch.size(); ++i) {
            try {
                sats.emplace_back(OrbitalElementSet::fromLines(batch[i]));
            } catch (const ElementSetError& e) {
                std::string msg = "Entry " + std::to_string(i + 1) + " skipped: " + e.what();
                Logger::warn(msg);
                result.warnings.push_back(msg);
            }
        }

        const std::vector<TimePoint> grid = buildTimeGrid(now, horizon_hours_);
        Logger::log("Scanning " + std::to_string(sats.size()) + " satellites over " + std::to_string(grid.size()) +
                    " samples, radius " + std::to_string(radius_km_) + " km");

        if (threads_ <= 1 || sats.size() <= 1) {
            for (const auto& sat : sats) result.table.append(detect(sat, grid));
        } else {
            ThreadPool pool(std::min(threads_, sats.size()));
            std::vector<std::future<std::vector<PassRecord>>> pending;
            pending.reserve(sats.size());
            for (const auto& sat : sats) {
                pending.push_back(pool.enqueue([this, &sat, &grid]() { return detect(sat, grid); }));
            }
            for (auto& f : pending) result.table.append(f.get());
        }

        result.satellites_scanned = static_cast<int>(sats.size());
        Logger::log("Found " + std::to_string(result.table.size()) + " passes");
        return result;
    }
}
