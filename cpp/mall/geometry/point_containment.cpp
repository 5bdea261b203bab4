#include "mall/geometry/point_containment.h"
#include "mall/geometry/segment.h"
#include "mall/geometry/polygon_metrics.h"

namespace mall {

namespace {
    // Region tests treat every polygon as closed, whatever its drafting flag.
    bool onClosedBoundary(const Point2D& point, const Polygon& polygon) {
        const auto& v = polygon.vertices;
        const std::size_t n = v.size();
        for (std::size_t i = 0; i < n; ++i) {
            if (isPointOnSegment(point, v[i], v[(i + 1) % n])) return true;
        }
        return false;
    }
} // namespace

bool isPointInside(const Point2D& point, const Polygon& polygon) {
    const auto& v = polygon.vertices;
    const std::size_t n = v.size();
    if (n < kMinPolygonVertices) return false;

    bool inside = false;
    for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
        const Point2D& vi = v[i];
        const Point2D& vj = v[j];
        if ((vi.y > point.y) != (vj.y > point.y)) {
            const double intersectX = (vj.x - vi.x) * (point.y - vi.y) / (vj.y - vi.y) + vi.x;
            if (point.x < intersectX) {
                inside = !inside;
            }
        }
    }
    return inside;
}

bool isPointOnEdge(const Point2D& point, const Polygon& polygon, double tolerance) {
    const auto& v = polygon.vertices;
    const std::size_t n = v.size();
    if (n < 2) return false;

    const std::size_t limit = polygon.isClosed ? n : n - 1;
    for (std::size_t i = 0; i < limit; ++i) {
        if (isPointOnSegment(point, v[i], v[(i + 1) % n], tolerance)) {
            return true;
        }
    }
    return false;
}

bool isVertexOf(const Point2D& point, const Polygon& polygon, double tolerance) {
    for (const Point2D& v : polygon.vertices) {
        if (distance(v, point) <= tolerance) return true;
    }
    return false;
}

PointLocation classifyPoint(const Point2D& point, const Polygon& polygon) {
    if (polygon.vertices.size() < kMinPolygonVertices) return PointLocation::Outside;
    if (isVertexOf(point, polygon)) return PointLocation::OnVertex;
    if (onClosedBoundary(point, polygon)) return PointLocation::OnEdge;
    return isPointInside(point, polygon) ? PointLocation::Inside : PointLocation::Outside;
}

bool isPointStrictlyInside(const Point2D& point, const Polygon& polygon) {
    return classifyPoint(point, polygon) == PointLocation::Inside;
}

bool isPointInsideOrOnEdge(const Point2D& point, const Polygon& polygon) {
    return classifyPoint(point, polygon) != PointLocation::Outside;
}

} // namespace mall
