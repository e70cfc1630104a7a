#include "lc/ransac/LocalRansac.hpp"

#include "lc/core/util/Geometry.hpp"
#include "lc/core/util/Logging.hpp"
#include "lc/ransac/LineFit.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>

namespace lc::ransac {

namespace {

// Pool size from which the neighborhood scan runs in parallel
constexpr int64_t kParallelScanMin = 4096;

template <typename T>
[[noreturn]] void fail(const char* name, const T& value, const char* requirement)
{
    std::ostringstream msg;
    msg << "Invalid configuration: " << name << " = " << value << " (" << requirement << ")";
    throw InvalidConfiguration(msg.str());
}

// Swap-remove one pool slot; order of the pool is not significant.
void removeSlot(std::vector<std::size_t>& pool, std::size_t slot)
{
    pool[slot] = pool.back();
    pool.pop_back();
}

}  // namespace

const char* toString(TerminationReason reason)
{
    switch (reason) {
        case TerminationReason::PoolExhausted:  return "pool exhausted";
        case TerminationReason::IterationLimit: return "iteration limit";
        case TerminationReason::TimeBudget:     return "time budget";
    }
    return "unknown";
}

void validate(const PointList& points, const ExtractParams& params)
{
    if (points.empty()) {
        throw InvalidConfiguration("Invalid configuration: point set is empty");
    }
    for (std::size_t i = 0; i < points.size(); ++i) {
        if (!isFinite(points[i])) {
            fail("point index", i, "coordinates must be finite");
        }
    }
    if (!std::isfinite(params.neighborhood_radius) || params.neighborhood_radius <= 0.0) {
        fail("neighborhood_radius", params.neighborhood_radius, "must be a positive finite number");
    }
    if (!std::isfinite(params.inlier_threshold) || params.inlier_threshold <= 0.0) {
        fail("inlier_threshold", params.inlier_threshold, "must be a positive finite number");
    }
    if (params.min_samples < 2) {
        fail("min_samples", params.min_samples, "must be at least 2");
    }
    if (params.max_iterations < 1) {
        fail("max_iterations", params.max_iterations, "must be at least 1");
    }
    if (!std::isfinite(params.time_budget_ms) || params.time_budget_ms < 0.0) {
        fail("time_budget_ms", params.time_budget_ms, "must be 0 (disabled) or positive");
    }
}

ExtractResult extract(const PointList& points, const ExtractParams& params, Random& rng)
{
    validate(points, params);

    using Clock = std::chrono::steady_clock;
    const auto start = Clock::now();
    const auto budget = std::chrono::duration<double, std::milli>(params.time_budget_ms);

    const std::size_t minSamples = static_cast<std::size_t>(params.min_samples);
    const double radius = params.neighborhood_radius;
    const double threshold = params.inlier_threshold;

    ExtractResult result;

    // The pool holds indices into `points`; the coordinates never move.
    std::vector<std::size_t> pool(points.size());
    for (std::size_t i = 0; i < pool.size(); ++i) {
        pool[i] = i;
    }

    std::vector<uint8_t> near;
    std::vector<uint8_t> consumed(points.size(), 0);
    std::vector<std::size_t> local;
    std::vector<std::size_t> inliers;
    local.reserve(64);
    inliers.reserve(64);

    for (;;) {
        if (pool.size() <= minSamples) {
            result.reason = TerminationReason::PoolExhausted;
            break;
        }
        if (result.iterations >= params.max_iterations) {
            result.reason = TerminationReason::IterationLimit;
            break;
        }
        if (params.time_budget_ms > 0.0 && Clock::now() - start >= budget) {
            result.reason = TerminationReason::TimeBudget;
            break;
        }

        ++result.iterations;

        const std::size_t seedSlot = rng.randInt(pool.size());
        const std::size_t seedIdx = pool[seedSlot];
        const Point3 seed = points[seedIdx];

        const int64_t n = static_cast<int64_t>(pool.size());
        near.assign(pool.size(), 0);
#pragma omp parallel for if(n >= kParallelScanMin)
        for (int64_t i = 0; i < n; ++i) {
            near[i] = lc::distance(points[pool[i]], seed) < radius ? 1 : 0;
        }

        local.clear();
        for (int64_t i = 0; i < n; ++i) {
            if (near[i]) local.push_back(pool[i]);
        }

        if (local.size() < minSamples) {
            removeSlot(pool, seedSlot);
            result.discarded.push_back(seedIdx);
            ++result.noise_rejections;
            continue;
        }

        const LineModel line = fitLine(points, local);

        inliers.clear();
        if (isFinite(line.direction)) {
            for (std::size_t idx : local) {
                if (orthogonalDistance(points[idx], line) < threshold) {
                    inliers.push_back(idx);
                }
            }
        }

        if (inliers.size() < minSamples) {
            removeSlot(pool, seedSlot);
            result.discarded.push_back(seedIdx);
            ++result.failed_fits;
            continue;
        }

        double tMin = std::numeric_limits<double>::max();
        double tMax = std::numeric_limits<double>::lowest();
        for (std::size_t idx : inliers) {
            const double t = projectParameter(points[idx], line);
            tMin = std::min(tMin, t);
            tMax = std::max(tMax, t);
            consumed[idx] = 1;
        }

        Segment seg;
        seg.start = pointAt(line, tMin);
        seg.end = pointAt(line, tMax);
        seg.inlier_count = inliers.size();
        result.segments.push_back(seg);
        result.segment_inliers.push_back(inliers);

        std::erase_if(pool, [&consumed](std::size_t idx) { return consumed[idx] != 0; });

        Logger()->debug("segment {}: {} inliers of {} local, length {}, pool {}",
                        result.segments.size() - 1, inliers.size(), local.size(),
                        seg.length(), pool.size());
    }

    result.remaining = pool;

    Logger()->info("local ransac: {} segments from {} points in {} iterations "
                   "({} noise seeds, {} failed fits, {} unclustered), stopped on {}",
                   result.segments.size(), points.size(), result.iterations,
                   result.noise_rejections, result.failed_fits, result.remaining.size(),
                   toString(result.reason));

    return result;
}

PointList remainingPoints(const PointList& points, const ExtractResult& result)
{
    PointList out;
    out.reserve(result.remaining.size());
    for (std::size_t idx : result.remaining) {
        out.push_back(points.at(idx));
    }
    return out;
}

}  // namespace lc::ransac
