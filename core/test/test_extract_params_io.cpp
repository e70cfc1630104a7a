#include "test.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "lc/core/util/LoadJson.hpp"
#include "lc/ransac/ExtractParams.hpp"
#include "lc/ransac/ExtractParamsIO.hpp"

namespace fs = std::filesystem;
using lc::ransac::ExtractParams;

namespace {

ExtractParams base()
{
    ExtractParams p;
    p.neighborhood_radius = 2.0;
    p.min_samples = 8;
    p.inlier_threshold = 0.05;
    p.max_iterations = 5000;
    return p;
}

fs::path tempFile(const char* name, const std::string& content)
{
    fs::path p = fs::temp_directory_path() / name;
    std::ofstream(p) << content;
    return p;
}

}  // namespace

TEST(ParamsJson, MissingKeysKeepBase)
{
    auto p = lc::ransac::parseFromJson(nlohmann::json::object(), base());
    EXPECT_FLOAT_EQ(p.neighborhood_radius, 2.0);
    EXPECT_EQ(p.min_samples, 8);
    EXPECT_FLOAT_EQ(p.inlier_threshold, 0.05);
    EXPECT_EQ(p.max_iterations, 5000);
    EXPECT_FLOAT_EQ(p.time_budget_ms, 0.0);
}

TEST(ParamsJson, OverridesPresentKeys)
{
    auto j = nlohmann::json::parse(R"({"neighborhood_radius": 0.75, "min_samples": 4,
                                       "max_iterations": 100, "time_budget_ms": 250})");
    auto p = lc::ransac::parseFromJson(j, base());
    EXPECT_FLOAT_EQ(p.neighborhood_radius, 0.75);
    EXPECT_EQ(p.min_samples, 4);
    EXPECT_FLOAT_EQ(p.inlier_threshold, 0.05);
    EXPECT_EQ(p.max_iterations, 100);
    EXPECT_FLOAT_EQ(p.time_budget_ms, 250.0);
}

TEST(ParamsJson, IntegerAcceptedForRealField)
{
    auto p = lc::ransac::parseFromJson(nlohmann::json{{"neighborhood_radius", 3}}, base());
    EXPECT_FLOAT_EQ(p.neighborhood_radius, 3.0);
}

TEST(ParamsJson, WrongTypesRejected)
{
    EXPECT_THROW(lc::ransac::parseFromJson(nlohmann::json{{"min_samples", 2.5}}, base()),
                 std::runtime_error);
    EXPECT_THROW(lc::ransac::parseFromJson(nlohmann::json{{"inlier_threshold", "small"}}, base()),
                 std::runtime_error);
    EXPECT_THROW(lc::ransac::parseFromJson(nlohmann::json::array(), base()),
                 std::runtime_error);
}

TEST(ParamsJson, IntegerOutOfRangeRejected)
{
    EXPECT_THROW(lc::ransac::parseFromJson(nlohmann::json::parse(R"({"max_iterations": 4294967297})"), base()),
                 std::runtime_error);
    EXPECT_THROW(lc::ransac::parseFromJson(nlohmann::json::parse(R"({"min_samples": -3000000000})"), base()),
                 std::runtime_error);
    auto p = lc::ransac::parseFromJson(nlohmann::json::parse(R"({"max_iterations": 2147483647, "min_samples": -2})"), base());
    EXPECT_EQ(p.max_iterations, 2147483647);
    EXPECT_EQ(p.min_samples, -2);
}

TEST(ParamsJson, UnknownKeyRejected)
{
    EXPECT_THROW(lc::ransac::parseFromJson(nlohmann::json{{"radius", 1.0}}, base()),
                 std::runtime_error);
}

TEST(ParamsJson, ToJsonRoundTrips)
{
    ExtractParams p = base();
    p.time_budget_ms = 12.5;
    auto j = lc::ransac::toJson(p);
    EXPECT_EQ(j.size(), size_t(5));
    EXPECT_EQ(j["min_samples"].get<int>(), 8);

    auto q = lc::ransac::parseFromJson(j, ExtractParams{});
    EXPECT_FLOAT_EQ(q.neighborhood_radius, p.neighborhood_radius);
    EXPECT_EQ(q.min_samples, p.min_samples);
    EXPECT_FLOAT_EQ(q.inlier_threshold, p.inlier_threshold);
    EXPECT_EQ(q.max_iterations, p.max_iterations);
    EXPECT_FLOAT_EQ(q.time_budget_ms, p.time_budget_ms);
}

TEST(ParamsJson, OverlayIgnoresNull)
{
    ExtractParams p = base();
    lc::ransac::applyJsonOverlay(p, nlohmann::json());
    EXPECT_EQ(p.min_samples, 8);
    lc::ransac::applyJsonOverlay(p, nlohmann::json{{"min_samples", 12}});
    EXPECT_EQ(p.min_samples, 12);
}

TEST(ParamsResolve, DefaultsThenJsonThenFlags)
{
    auto d = lc::ransac::resolveExtractParams(nlohmann::json(), {});
    EXPECT_FLOAT_EQ(d.neighborhood_radius, 2.0);
    EXPECT_EQ(d.min_samples, 8);
    EXPECT_FLOAT_EQ(d.inlier_threshold, 0.05);
    EXPECT_EQ(d.max_iterations, 5000);
    EXPECT_FLOAT_EQ(d.time_budget_ms, 0.0);

    lc::ransac::ExtractParamOverrides flags;
    flags.min_samples = 3;
    flags.time_budget_ms = 50.0;
    auto p = lc::ransac::resolveExtractParams(
        nlohmann::json{{"min_samples", 6}, {"inlier_threshold", 0.2}}, flags);
    EXPECT_EQ(p.min_samples, 3);
    EXPECT_FLOAT_EQ(p.inlier_threshold, 0.2);
    EXPECT_FLOAT_EQ(p.time_budget_ms, 50.0);
    EXPECT_FLOAT_EQ(p.neighborhood_radius, 2.0);
    EXPECT_EQ(p.max_iterations, 5000);
}

TEST(ParamsResolve, BadOverlayStillThrows)
{
    EXPECT_THROW(lc::ransac::resolveExtractParams(nlohmann::json{{"radius", 1.0}}, {}),
                 std::runtime_error);
}

TEST(LoadJson, ReadsFile)
{
    auto path = tempFile("lc_params_ok.json", R"({"inlier_threshold": 0.2})");
    auto j = lc::json::load_json_file(path);
    EXPECT_FLOAT_EQ(j["inlier_threshold"].get<double>(), 0.2);
    fs::remove(path);
}

TEST(LoadJson, MissingAndMalformedFilesThrow)
{
    EXPECT_THROW(lc::json::load_json_file("/nonexistent/lc_params.json"), std::runtime_error);
    auto path = tempFile("lc_params_bad.json", "{ not json");
    EXPECT_THROW(lc::json::load_json_file(path), std::runtime_error);
    fs::remove(path);
}
