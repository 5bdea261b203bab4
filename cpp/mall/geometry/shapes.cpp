#include "mall/geometry/shapes.h"

#include <algorithm>
#include <cmath>

namespace mall {

Polygon rectangleToPolygon(double x, double y, double width, double height) {
    Polygon out;
    out.vertices = {
        {x, y},
        {x + width, y},
        {x + width, y + height},
        {x, y + height},
    };
    return out;
}

Polygon regularPolygon(const Point2D& center, double radius, std::uint32_t sides) {
    constexpr double kPi = 3.14159265358979323846;
    const std::uint32_t n = std::max<std::uint32_t>(3u, sides);
    const double step = 2.0 * kPi / static_cast<double>(n);

    Polygon out;
    out.vertices.reserve(n);
    for (std::uint32_t i = 0; i < n; ++i) {
        const double angle = static_cast<double>(i) * step - kPi / 2.0;
        out.vertices.push_back({center.x + radius * std::cos(angle), center.y + radius * std::sin(angle)});
    }
    return out;
}

Polygon translatePolygon(const Polygon& polygon, double dx, double dy) {
    Polygon out = polygon;
    for (Point2D& p : out.vertices) {
        p.x += dx;
        p.y += dy;
    }
    return out;
}

} // namespace mall
