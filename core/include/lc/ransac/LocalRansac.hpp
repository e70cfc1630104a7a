#pragma once

#include "lc/core/types/Segment.hpp"
#include "lc/core/util/Random.hpp"
#include "lc/ransac/ExtractParams.hpp"

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace lc::ransac {

// Thrown before the first iteration when the input or the parameters
// cannot produce a well-defined run.
class InvalidConfiguration : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class TerminationReason {
    PoolExhausted,   // pool shrank to min_samples points or fewer
    IterationLimit,  // max_iterations seeds drawn
    TimeBudget       // time_budget_ms elapsed
};

const char* toString(TerminationReason reason);

struct ExtractResult {
    SegmentList segments;
    // Input indices of each segment's inliers, parallel to `segments`
    std::vector<std::vector<std::size_t>> segment_inliers;
    // Seeds dropped by the noise or failed-fit branch, in removal order
    std::vector<std::size_t> discarded;
    // Input indices still in the pool at termination
    std::vector<std::size_t> remaining;

    int iterations = 0;
    int noise_rejections = 0;
    int failed_fits = 0;
    TerminationReason reason = TerminationReason::PoolExhausted;
};

// Throws InvalidConfiguration describing the first problem found.
void validate(const PointList& points, const ExtractParams& params);

/**
 * Decompose a point cloud into short line segments by local RANSAC.
 *
 * Each iteration draws one seed uniformly from the pool, gathers the pool
 * points strictly closer than neighborhood_radius, fits a line to them and
 * keeps the points strictly closer than inlier_threshold to it. With at least
 * min_samples inliers a segment spanning their projections is emitted and the
 * inliers leave the pool; otherwise only the seed leaves the pool. The loop
 * runs while the pool holds more than min_samples points and fewer than
 * max_iterations seeds have been drawn.
 *
 * Output is fully determined by the input, the parameters and the state of
 * `rng`, unless a time budget ends the run.
 *
 * @throws InvalidConfiguration on empty input, non-finite coordinates or
 *         out-of-range parameters
 */
ExtractResult extract(const PointList& points, const ExtractParams& params, Random& rng);

// Coordinates of result.remaining
PointList remainingPoints(const PointList& points, const ExtractResult& result);

}  // namespace lc::ransac
