#include "mall/geometry/grid_snapper.h"

#include <cmath>
#include <stdexcept>

namespace mall {

namespace {
    inline void requireGridSize(double gridSize) {
        if (!(gridSize > 0.0) || !std::isfinite(gridSize)) {
            throw std::invalid_argument("Grid size must be a finite value greater than zero");
        }
    }

    inline double snapScalar(double v, double gridSize) {
        return std::round(v / gridSize) * gridSize;
    }
} // namespace

Point2D snapToGrid(const Point2D& point, double gridSize) {
    requireGridSize(gridSize);
    return Point2D{snapScalar(point.x, gridSize), snapScalar(point.y, gridSize)};
}

Polygon snapPolygonToGrid(const Polygon& polygon, double gridSize) {
    requireGridSize(gridSize);
    Polygon out;
    out.isClosed = polygon.isClosed;
    out.vertices.reserve(polygon.vertices.size());
    for (const Point2D& p : polygon.vertices) {
        out.vertices.push_back(Point2D{snapScalar(p.x, gridSize), snapScalar(p.y, gridSize)});
    }
    return out;
}

} // namespace mall
