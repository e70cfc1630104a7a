#pragma once

#include "lc/core/types/Segment.hpp"

#include <cstddef>
#include <vector>

namespace lc::ransac {

/**
 * Least-squares (orthogonal distance) line through a set of points.
 *
 * The anchor is the centroid; the direction is the eigenvector of the
 * scatter matrix with the largest eigenvalue, i.e. the dominant right
 * singular vector of the centered coordinates. The direction is unit length
 * with arbitrary sign. For fewer than two distinct points it is still a unit
 * vector but carries no information. A NaN direction means the decomposition
 * failed.
 *
 * @throws std::invalid_argument if `points` is empty
 */
LineModel fitLine(const PointList& points);

// Same fit over a subset of `points` selected by `indices`.
LineModel fitLine(const PointList& points, const std::vector<std::size_t>& indices);

}  // namespace lc::ransac
