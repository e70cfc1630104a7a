#include "lc/ransac/ExtractParamsIO.hpp"
#include "lc/ransac/ExtractParams.hpp"
#include "lc/core/util/LoadJson.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace lc::ransac {

namespace {

double numberField(const nlohmann::json& j, const char* key, double def)
{
    auto it = j.find(key);
    if (it == j.end())
        return def;
    if (!it->is_number())
        throw std::runtime_error(std::string("extraction params: '") + key + "' must be a number");
    return it->get<double>();
}

int integerField(const nlohmann::json& j, const char* key, int def)
{
    auto it = j.find(key);
    if (it == j.end())
        return def;
    const auto bad = [key]() {
        return std::runtime_error(std::string("extraction params: '") + key + "' must be an integer");
    };
    if (!it->is_number_integer())
        throw bad();
    if (it->is_number_unsigned()) {
        const auto u = it->get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
            throw bad();
        return static_cast<int>(u);
    }
    const auto v = it->get<std::int64_t>();
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        throw bad();
    return static_cast<int>(v);
}

}  // namespace

ExtractParams parseFromJson(const nlohmann::json& j, const ExtractParams& base)
{
    json::require_known_fields(j,
        {"neighborhood_radius", "min_samples", "inlier_threshold", "max_iterations", "time_budget_ms"},
        "extraction params");

    ExtractParams p = base;
    p.neighborhood_radius = numberField(j, "neighborhood_radius", p.neighborhood_radius);
    p.min_samples = integerField(j, "min_samples", p.min_samples);
    p.inlier_threshold = numberField(j, "inlier_threshold", p.inlier_threshold);
    p.max_iterations = integerField(j, "max_iterations", p.max_iterations);
    p.time_budget_ms = numberField(j, "time_budget_ms", p.time_budget_ms);
    return p;
}

nlohmann::json toJson(const ExtractParams& p)
{
    nlohmann::json j;
    j["neighborhood_radius"] = p.neighborhood_radius;
    j["min_samples"] = p.min_samples;
    j["inlier_threshold"] = p.inlier_threshold;
    j["max_iterations"] = p.max_iterations;
    j["time_budget_ms"] = p.time_budget_ms;
    return j;
}

void applyJsonOverlay(ExtractParams& base, const nlohmann::json& overlay)
{
    if (overlay.is_null())
        return;
    base = parseFromJson(overlay, base);
}

ExtractParams defaultExtractParams()
{
    ExtractParams p;
    p.neighborhood_radius = 2.0;
    p.min_samples = 8;
    p.inlier_threshold = 0.05;
    p.max_iterations = 5000;
    p.time_budget_ms = 0.0;
    return p;
}

void applyOverrides(ExtractParams& base, const ExtractParamOverrides& o)
{
    if (o.neighborhood_radius) base.neighborhood_radius = *o.neighborhood_radius;
    if (o.min_samples) base.min_samples = *o.min_samples;
    if (o.inlier_threshold) base.inlier_threshold = *o.inlier_threshold;
    if (o.max_iterations) base.max_iterations = *o.max_iterations;
    if (o.time_budget_ms) base.time_budget_ms = *o.time_budget_ms;
}

ExtractParams resolveExtractParams(const nlohmann::json& overlay, const ExtractParamOverrides& flags)
{
    ExtractParams p = defaultExtractParams();
    applyJsonOverlay(p, overlay);
    applyOverrides(p, flags);
    return p;
}

}  // namespace lc::ransac
