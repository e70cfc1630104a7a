#include "lc/ransac/LineFit.hpp"

#include <opencv2/core.hpp>

#include <cmath>
#include <stdexcept>

namespace lc::ransac {

namespace {

template <typename Range, typename Get>
LineModel fitImpl(const Range& range, std::size_t count, Get get)
{
    if (count == 0) {
        throw std::invalid_argument("fitLine requires at least one point");
    }

    cv::Vec3d centroid(0.0, 0.0, 0.0);
    for (const auto& item : range) {
        centroid += get(item);
    }
    centroid /= static_cast<double>(count);

    cv::Matx33d scatter = cv::Matx33d::zeros();
    for (const auto& item : range) {
        const cv::Vec3d diff = get(item) - centroid;
        for (int r = 0; r < 3; ++r) {
            for (int c = 0; c < 3; ++c) {
                scatter(r, c) += diff[r] * diff[c];
            }
        }
    }

    LineModel line;
    line.anchor = centroid;

    // Rows of eigenVectors are sorted by descending eigenvalue.
    cv::Mat eigenValues, eigenVectors;
    cv::eigen(scatter, eigenValues, eigenVectors);
    if (eigenVectors.rows != 3 || eigenVectors.cols != 3) {
        line.direction = cv::Vec3d(NAN, NAN, NAN);
        return line;
    }

    cv::Vec3d dir(eigenVectors.at<double>(0, 0),
                  eigenVectors.at<double>(0, 1),
                  eigenVectors.at<double>(0, 2));
    const double len = cv::norm(dir);
    if (!std::isfinite(len) || len <= 1e-12) {
        line.direction = cv::Vec3d(NAN, NAN, NAN);
        return line;
    }
    line.direction = dir / len;
    return line;
}

}  // namespace

LineModel fitLine(const PointList& points)
{
    return fitImpl(points, points.size(), [](const Point3& p) { return p; });
}

LineModel fitLine(const PointList& points, const std::vector<std::size_t>& indices)
{
    return fitImpl(indices, indices.size(),
                   [&points](std::size_t i) { return points[i]; });
}

}  // namespace lc::ransac
