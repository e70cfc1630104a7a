#pragma once

#include <opencv2/core.hpp>

#include <cstddef>
#include <vector>

namespace lc {

using Point3 = cv::Vec3d;

// Infinite line through `anchor` along unit `direction`. Sign of the
// direction is arbitrary.
struct LineModel {
    Point3 anchor{0, 0, 0};
    Point3 direction{1, 0, 0};
};

// Bounded piece of a fitted line spanning the extremal projections of its
// inliers. start is the minimum projection, end the maximum.
struct Segment {
    Point3 start{0, 0, 0};
    Point3 end{0, 0, 0};
    std::size_t inlier_count = 0;

    double length() const { return cv::norm(end - start); }
};

using PointList = std::vector<Point3>;
using SegmentList = std::vector<Segment>;

}  // namespace lc
