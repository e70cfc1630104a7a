#pragma once

#include "lc/ransac/ExtractParams.hpp"

#include <nlohmann/json_fwd.hpp>

#include <optional>

namespace lc::ransac {

// Per-field values set explicitly on the command line.
struct ExtractParamOverrides {
    std::optional<double> neighborhood_radius;
    std::optional<int> min_samples;
    std::optional<double> inlier_threshold;
    std::optional<int> max_iterations;
    std::optional<double> time_budget_ms;
};

// Keys: neighborhood_radius, min_samples, inlier_threshold, max_iterations,
// time_budget_ms. Missing keys keep the value from `base`; unknown keys and
// wrong-typed values (including integers outside int range) throw
// std::runtime_error.
ExtractParams parseFromJson(const nlohmann::json& j, const ExtractParams& base);
nlohmann::json toJson(const ExtractParams& p);
void applyJsonOverlay(ExtractParams& base, const nlohmann::json& overlay);

// radius 2.0, min_samples 8, threshold 0.05, 5000 iterations, no budget
ExtractParams defaultExtractParams();
void applyOverrides(ExtractParams& base, const ExtractParamOverrides& o);

// Defaults, then the JSON overlay (null for none), then explicit overrides.
ExtractParams resolveExtractParams(const nlohmann::json& overlay, const ExtractParamOverrides& flags);

}  // namespace lc::ransac
