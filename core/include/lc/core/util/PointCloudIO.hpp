#pragma once

#include "lc/core/types/Segment.hpp"

#include <opencv2/core.hpp>

#include <filesystem>

namespace lc {

/**
 * Read a point cloud from a CSV table.
 *
 * The first non-blank row is a header that must name `x`, `y` and `z`
 * columns (case-insensitive, any order, other columns ignored). Every
 * following non-blank row must hold finite numbers in those columns.
 *
 * @throws std::runtime_error on a missing file, a missing column or a
 *         malformed row (the message carries path and line number)
 */
PointList readPointsCsv(const std::filesystem::path& path);

void writePointsCsv(const std::filesystem::path& path, const PointList& points);

// Columns x0,y0,z0,x1,y1,z1,inliers
void writeSegmentsCsv(const std::filesystem::path& path, const SegmentList& segments);

// ASCII PLY with one edge (and two vertices) per segment
void writeSegmentsPly(const std::filesystem::path& path,
                      const SegmentList& segments,
                      const cv::Vec3b& color_bgr = cv::Vec3b(0, 0, 255));

// Picks PLY or CSV from the extension (case-insensitive).
// @throws std::runtime_error for any other extension
void writeSegments(const std::filesystem::path& path, const SegmentList& segments);

}  // namespace lc
