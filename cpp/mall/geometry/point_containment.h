#pragma once

#include "mall/core/types.h"
#include "mall/core/constants.h"

namespace mall {

enum class PointLocation : std::uint8_t {
    Outside = 0,
    Inside = 1,
    OnEdge = 2,
    OnVertex = 3,
};

// Ray casting with a horizontal ray towards +x. Points exactly on the boundary
// get whatever the crossing count yields, which is deterministic for a given
// point and polygon. Fewer than 3 vertices is always outside.
bool isPointInside(const Point2D& point, const Polygon& polygon);

bool isPointOnEdge(const Point2D& point, const Polygon& polygon, double tolerance = kOnEdgeTolerance);

bool isVertexOf(const Point2D& point, const Polygon& polygon, double tolerance = kOnEdgeTolerance);

// Boundary-aware classification: vertex and edge hits win over the ray count.
PointLocation classifyPoint(const Point2D& point, const Polygon& polygon);

// Interior only; boundary points are excluded.
bool isPointStrictlyInside(const Point2D& point, const Polygon& polygon);

// Interior or boundary.
bool isPointInsideOrOnEdge(const Point2D& point, const Polygon& polygon);

} // namespace mall
