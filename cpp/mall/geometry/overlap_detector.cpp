#include "mall/geometry/overlap_detector.h"
#include "mall/geometry/edge_pieces.h"
#include "mall/geometry/point_containment.h"
#include "mall/geometry/polygon_metrics.h"
#include "mall/geometry/segment.h"

#include <cmath>

namespace mall {

namespace {
    bool anyProperCrossing(const Polygon& a, const Polygon& b) {
        const auto& av = a.vertices;
        const auto& bv = b.vertices;
        const std::size_t n = av.size();
        const std::size_t m = bv.size();
        for (std::size_t i = 0; i < n; ++i) {
            for (std::size_t j = 0; j < m; ++j) {
                if (segmentsCrossProperly(av[i], av[(i + 1) % n], bv[j], bv[(j + 1) % m])) return true;
            }
        }
        return false;
    }

    bool anyVertexStrictlyInside(const Polygon& a, const Polygon& b) {
        for (const Point2D& v : a.vertices) {
            if (isPointStrictlyInside(v, b)) return true;
        }
        return false;
    }

    bool anyBoundaryPieceStrictlyInside(const Polygon& a, const Polygon& b) {
        const auto& av = a.vertices;
        const std::size_t n = av.size();
        bool found = false;
        for (std::size_t i = 0; i < n && !found; ++i) {
            forEachEdgePieceMidpoint(av[i], av[(i + 1) % n], b, [&](const Point2D& mid) {
                if (!found && isPointStrictlyInside(mid, b)) found = true;
            });
        }
        return found;
    }

    bool interiorPointStrictlyInside(const Polygon& a, const Polygon& b) {
        Point2D p{};
        if (!interiorPoint(a, p)) return false;
        return isPointStrictlyInside(p, b);
    }

    inline bool strictlyInTriangle(const Point2D& p, const Point2D& a, const Point2D& b, const Point2D& c, int turn) {
        return orientation(a, b, p) == turn && orientation(b, c, p) == turn && orientation(c, a, p) == turn;
    }
} // namespace

bool interiorPoint(const Polygon& polygon, Point2D& out) {
    const auto& v = polygon.vertices;
    const std::size_t n = v.size();
    if (n < kMinPolygonVertices) return false;

    // The lowest (then leftmost) vertex is always convex.
    std::size_t k = 0;
    for (std::size_t i = 1; i < n; ++i) {
        if (v[i].y < v[k].y || (v[i].y == v[k].y && v[i].x < v[k].x)) k = i;
    }
    const Point2D& prev = v[(k + n - 1) % n];
    const Point2D& curr = v[k];
    const Point2D& next = v[(k + 1) % n];
    const int turn = orientation(prev, curr, next);
    if (turn == 0) return false;

    // Another vertex inside the ear means the ear diagonal leaves the polygon;
    // the one nearest to `curr` (farthest from prev-next) gives a safe chord.
    const double ex = next.x - prev.x;
    const double ey = next.y - prev.y;
    const double elen = std::sqrt(ex * ex + ey * ey);
    double bestDepth = -1.0;
    std::size_t best = n;
    for (std::size_t i = 0; i < n; ++i) {
        if (i == k || i == (k + n - 1) % n || i == (k + 1) % n) continue;
        if (!strictlyInTriangle(v[i], prev, curr, next, turn)) continue;
        const double depth = std::abs((v[i].x - prev.x) * ey - (v[i].y - prev.y) * ex) / elen;
        if (depth > bestDepth) {
            bestDepth = depth;
            best = i;
        }
    }

    if (best == n) {
        out = Point2D{(prev.x + curr.x + next.x) / 3.0, (prev.y + curr.y + next.y) / 3.0};
    } else {
        out = Point2D{(curr.x + v[best].x) * 0.5, (curr.y + v[best].y) * 0.5};
    }
    return true;
}

bool doOverlap(const Polygon& a, const Polygon& b) {
    if (a.vertices.size() < kMinPolygonVertices || b.vertices.size() < kMinPolygonVertices) return false;

    if (!boundingBoxesShareArea(boundingBox(a), boundingBox(b))) return false;

    if (anyProperCrossing(a, b)) return true;

    if (anyVertexStrictlyInside(a, b) || anyVertexStrictlyInside(b, a)) return true;

    if (anyBoundaryPieceStrictlyInside(a, b) || anyBoundaryPieceStrictlyInside(b, a)) return true;

    return interiorPointStrictlyInside(a, b) || interiorPointStrictlyInside(b, a);
}

} // namespace mall
