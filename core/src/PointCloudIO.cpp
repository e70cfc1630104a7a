#include "lc/core/util/PointCloudIO.hpp"

#include "lc/core/util/Geometry.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace lc {

namespace {

std::string trim(const std::string& s)
{
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    std::string out = s.substr(b, e - b);
    if (out.size() >= 2 && out.front() == '"' && out.back() == '"') {
        out = out.substr(1, out.size() - 2);
    }
    return out;
}

std::vector<std::string> splitRow(const std::string& line)
{
    std::vector<std::string> cells;
    size_t pos = 0;
    for (;;) {
        size_t comma = line.find(',', pos);
        cells.push_back(trim(line.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos)));
        if (comma == std::string::npos) break;
        pos = comma + 1;
    }
    return cells;
}

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isBlank(const std::string& line)
{
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

std::string where(const fs::path& path, size_t lineNo)
{
    return path.string() + ":" + std::to_string(lineNo);
}

double parseNumber(const std::string& cell, const fs::path& path, size_t lineNo)
{
    if (cell.empty()) {
        throw std::runtime_error("Empty coordinate at " + where(path, lineNo));
    }
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(cell.c_str(), &end);
    // Underflow rounds toward zero and is kept; overflow is rejected.
    if (end != cell.c_str() + cell.size() || (errno == ERANGE && std::isinf(v))) {
        throw std::runtime_error("Malformed coordinate '" + cell + "' at " + where(path, lineNo));
    }
    return v;
}

std::ofstream openForWrite(const fs::path& path)
{
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to open output file for writing: " + path.string());
    }
    out.precision(std::numeric_limits<double>::max_digits10);
    return out;
}

}  // namespace

PointList readPointsCsv(const fs::path& path)
{
    if (!fs::exists(path)) {
        throw std::runtime_error("Point cloud file not found: " + path.string());
    }
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open point cloud file: " + path.string());
    }

    std::string line;
    size_t lineNo = 0;
    std::array<size_t, 3> col{};
    bool haveHeader = false;
    size_t minCells = 0;
    PointList points;

    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (isBlank(line)) continue;

        const auto cells = splitRow(line);

        if (!haveHeader) {
            const std::array<const char*, 3> names = {"x", "y", "z"};
            for (size_t a = 0; a < 3; ++a) {
                auto it = std::find_if(cells.begin(), cells.end(),
                    [&](const std::string& c) { return lower(c) == names[a]; });
                if (it == cells.end()) {
                    throw std::runtime_error("Missing column '" + std::string(names[a]) +
                                             "' in header of " + path.string());
                }
                col[a] = static_cast<size_t>(it - cells.begin());
            }
            minCells = *std::max_element(col.begin(), col.end()) + 1;
            haveHeader = true;
            continue;
        }

        if (cells.size() < minCells) {
            throw std::runtime_error("Too few columns at " + where(path, lineNo));
        }
        Point3 p(parseNumber(cells[col[0]], path, lineNo),
                 parseNumber(cells[col[1]], path, lineNo),
                 parseNumber(cells[col[2]], path, lineNo));
        if (!isFinite(p)) {
            throw std::runtime_error("Non-finite coordinate at " + where(path, lineNo));
        }
        points.push_back(p);
    }

    if (!haveHeader) {
        throw std::runtime_error("Point cloud file has no header: " + path.string());
    }
    return points;
}

void writePointsCsv(const fs::path& path, const PointList& points)
{
    auto out = openForWrite(path);
    out << "x,y,z\n";
    for (const auto& p : points) {
        out << p[0] << "," << p[1] << "," << p[2] << "\n";
    }
}

void writeSegmentsCsv(const fs::path& path, const SegmentList& segments)
{
    auto out = openForWrite(path);
    out << "x0,y0,z0,x1,y1,z1,inliers\n";
    for (const auto& s : segments) {
        out << s.start[0] << "," << s.start[1] << "," << s.start[2] << ","
            << s.end[0] << "," << s.end[1] << "," << s.end[2] << ","
            << s.inlier_count << "\n";
    }
}

void writeSegmentsPly(const fs::path& path, const SegmentList& segments, const cv::Vec3b& color_bgr)
{
    auto out = openForWrite(path);

    out << "ply\n";
    out << "format ascii 1.0\n";
    out << "comment lc_extract_segments line segments\n";
    out << "element vertex " << segments.size() * 2 << "\n";
    out << "property float x\n";
    out << "property float y\n";
    out << "property float z\n";
    out << "property uchar red\n";
    out << "property uchar green\n";
    out << "property uchar blue\n";
    out << "element edge " << segments.size() << "\n";
    out << "property int vertex1\n";
    out << "property int vertex2\n";
    out << "end_header\n";

    const int r = static_cast<int>(color_bgr[2]);
    const int g = static_cast<int>(color_bgr[1]);
    const int b = static_cast<int>(color_bgr[0]);

    for (const auto& s : segments) {
        out << s.start[0] << " " << s.start[1] << " " << s.start[2] << " " << r << " " << g << " " << b << "\n";
        out << s.end[0] << " " << s.end[1] << " " << s.end[2] << " " << r << " " << g << " " << b << "\n";
    }
    for (size_t i = 0; i < segments.size(); ++i) {
        out << (2 * i) << " " << (2 * i + 1) << "\n";
    }
}

void writeSegments(const fs::path& path, const SegmentList& segments)
{
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".ply") {
        writeSegmentsPly(path, segments);
    } else if (ext == ".csv") {
        writeSegmentsCsv(path, segments);
    } else {
        throw std::runtime_error("Segment output must end in .ply or .csv: " + path.string());
    }
}

}  // namespace lc
