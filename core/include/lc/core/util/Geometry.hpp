#pragma once

#include "lc/core/types/Segment.hpp"

// Geometry utility functions

namespace lc {

// Euclidean distance between two points
double distance(const Point3& a, const Point3& b);

// Perpendicular distance from p to the line. Requires a unit direction.
double orthogonalDistance(const Point3& p, const LineModel& line);

// Signed position of p's projection along the line, measured from the anchor
double projectParameter(const Point3& p, const LineModel& line);

// anchor + t * direction
Point3 pointAt(const LineModel& line, double t);

bool isFinite(const Point3& p);

}  // namespace lc
