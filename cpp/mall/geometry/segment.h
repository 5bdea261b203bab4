#pragma once

#include "mall/core/types.h"
#include "mall/core/constants.h"

namespace mall {

enum class IntersectionKind : std::uint8_t {
    None = 0,
    Proper = 1,    // single crossing strictly inside both segments
    Touching = 2,  // an endpoint of one segment lies on the other
    Collinear = 3, // collinear segments sharing more than one point
};

struct SegmentIntersection {
    IntersectionKind kind{IntersectionKind::None};
    Point2D point{}; // valid for Proper and Touching
};

// Sign of the turn a -> b -> c: +1 left, -1 right, 0 collinear within epsilon.
int orientation(const Point2D& a, const Point2D& b, const Point2D& c);

double pointToSegmentDistanceSq(const Point2D& p, const Point2D& a, const Point2D& b);

bool isPointOnSegment(const Point2D& p, const Point2D& a, const Point2D& b, double tolerance = kOnEdgeTolerance);

SegmentIntersection segmentsIntersect(const LineSegment& s1, const LineSegment& s2);

// Convenience: true only for IntersectionKind::Proper.
bool segmentsCrossProperly(const Point2D& a0, const Point2D& a1, const Point2D& b0, const Point2D& b1);

} // namespace mall
