#include "mall/geometry/polygon_containment.h"
#include "mall/geometry/edge_pieces.h"
#include "mall/geometry/point_containment.h"
#include "mall/geometry/segment.h"

namespace mall {

bool isContainedIn(const Polygon& inner, const Polygon& outer) {
    const auto& iv = inner.vertices;
    const auto& ov = outer.vertices;
    if (iv.size() < kMinPolygonVertices || ov.size() < kMinPolygonVertices) return false;

    for (const Point2D& vertex : iv) {
        if (!isPointInsideOrOnEdge(vertex, outer)) return false;
    }

    const std::size_t n = iv.size();
    const std::size_t m = ov.size();
    for (std::size_t i = 0; i < n; ++i) {
        const Point2D& a0 = iv[i];
        const Point2D& a1 = iv[(i + 1) % n];
        for (std::size_t j = 0; j < m; ++j) {
            if (segmentsCrossProperly(a0, a1, ov[j], ov[(j + 1) % m])) return false;
        }
    }

    for (std::size_t i = 0; i < n; ++i) {
        bool escapes = false;
        forEachEdgePieceMidpoint(iv[i], iv[(i + 1) % n], outer, [&](const Point2D& mid) {
            if (!isPointInsideOrOnEdge(mid, outer)) escapes = true;
        });
        if (escapes) return false;
    }
    return true;
}

} // namespace mall
