#include "mall/geometry/polygon_metrics.h"

#include <cmath>

namespace mall {

double signedArea(const Polygon& polygon) {
    const auto& v = polygon.vertices;
    const std::size_t n = v.size();
    if (n < 3) return 0.0;

    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const std::size_t j = (i + 1) % n;
        sum += v[i].x * v[j].y;
        sum -= v[j].x * v[i].y;
    }
    return sum * 0.5;
}

double polygonArea(const Polygon& polygon) {
    return std::abs(signedArea(polygon));
}

double distance(const Point2D& a, const Point2D& b) {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    return std::sqrt(dx * dx + dy * dy);
}

double polygonPerimeter(const Polygon& polygon) {
    const auto& v = polygon.vertices;
    const std::size_t n = v.size();
    if (n < 2) return 0.0;

    const std::size_t limit = polygon.isClosed ? n : n - 1;
    double total = 0.0;
    for (std::size_t i = 0; i < limit; ++i) {
        total += distance(v[i], v[(i + 1) % n]);
    }
    return total;
}

BoundingBox boundingBox(const Polygon& polygon) {
    const auto& v = polygon.vertices;
    if (v.empty()) return BoundingBox{0.0, 0.0, 0.0, 0.0};

    BoundingBox box{v[0].x, v[0].y, v[0].x, v[0].y};
    for (std::size_t i = 1; i < v.size(); ++i) {
        if (v[i].x < box.minX) box.minX = v[i].x;
        if (v[i].y < box.minY) box.minY = v[i].y;
        if (v[i].x > box.maxX) box.maxX = v[i].x;
        if (v[i].y > box.maxY) box.maxY = v[i].y;
    }
    return box;
}

Point2D centroid(const Polygon& polygon) {
    const auto& v = polygon.vertices;
    if (v.empty()) return Point2D{};

    double cx = 0.0;
    double cy = 0.0;
    for (const Point2D& p : v) {
        cx += p.x;
        cy += p.y;
    }
    const double n = static_cast<double>(v.size());
    return Point2D{cx / n, cy / n};
}

bool boundingBoxesOverlap(const BoundingBox& a, const BoundingBox& b) {
    return !(a.maxX < b.minX || a.minX > b.maxX || a.maxY < b.minY || a.minY > b.maxY);
}

bool boundingBoxesShareArea(const BoundingBox& a, const BoundingBox& b) {
    return a.maxX > b.minX && a.minX < b.maxX && a.maxY > b.minY && a.minY < b.maxY;
}

} // namespace mall
