#pragma once

namespace lc::ransac {

// Parameters of one local RANSAC run. The caller supplies every value;
// extract() rejects the zero defaults.
struct ExtractParams {
    // Max distance from the seed for a point to join the local neighborhood
    double neighborhood_radius = 0.0;
    // Min neighborhood size to attempt a fit, and min inliers to accept one
    int min_samples = 0;
    // Max perpendicular distance to the fitted line for an inlier
    double inlier_threshold = 0.0;
    // Hard cap on seed draws
    int max_iterations = 0;
    // Wall-clock budget checked between iterations, 0 = disabled
    double time_budget_ms = 0.0;
};

}  // namespace lc::ransac
