#include "lc/core/util/Geometry.hpp"

#include <cmath>

namespace lc {

double distance(const Point3& a, const Point3& b)
{
    return cv::norm(a - b);
}

double orthogonalDistance(const Point3& p, const LineModel& line)
{
    const Point3 offset = p - line.anchor;
    return cv::norm(offset.cross(line.direction));
}

double projectParameter(const Point3& p, const LineModel& line)
{
    return (p - line.anchor).dot(line.direction);
}

Point3 pointAt(const LineModel& line, double t)
{
    return line.anchor + line.direction * t;
}

bool isFinite(const Point3& p)
{
    return std::isfinite(p[0]) && std::isfinite(p[1]) && std::isfinite(p[2]);
}

}  // namespace lc
