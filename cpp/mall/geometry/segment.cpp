#include "mall/geometry/segment.h"

#include <algorithm>
#include <cmath>

namespace mall {

namespace {
    inline double cross(const Point2D& a, const Point2D& b, const Point2D& c) {
        return (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
    }

    inline bool withinBox(const Point2D& a, const Point2D& b, const Point2D& p) {
        return std::min(a.x, b.x) - kOnEdgeTolerance <= p.x && p.x <= std::max(a.x, b.x) + kOnEdgeTolerance &&
               std::min(a.y, b.y) - kOnEdgeTolerance <= p.y && p.y <= std::max(a.y, b.y) + kOnEdgeTolerance;
    }
} // namespace

int orientation(const Point2D& a, const Point2D& b, const Point2D& c) {
    const double v = cross(a, b, c);
    if (v > kOrientationEpsilon) return 1;
    if (v < -kOrientationEpsilon) return -1;
    return 0;
}

double pointToSegmentDistanceSq(const Point2D& p, const Point2D& a, const Point2D& b) {
    const double l2 = (b.x - a.x) * (b.x - a.x) + (b.y - a.y) * (b.y - a.y);
    if (l2 == 0.0) return (p.x - a.x) * (p.x - a.x) + (p.y - a.y) * (p.y - a.y);
    double t = ((p.x - a.x) * (b.x - a.x) + (p.y - a.y) * (b.y - a.y)) / l2;
    t = std::max(0.0, std::min(1.0, t));
    const double ex = a.x + t * (b.x - a.x);
    const double ey = a.y + t * (b.y - a.y);
    return (p.x - ex) * (p.x - ex) + (p.y - ey) * (p.y - ey);
}

bool isPointOnSegment(const Point2D& p, const Point2D& a, const Point2D& b, double tolerance) {
    return pointToSegmentDistanceSq(p, a, b) <= tolerance * tolerance;
}

SegmentIntersection segmentsIntersect(const LineSegment& s1, const LineSegment& s2) {
    const Point2D& p1 = s1.start;
    const Point2D& p2 = s1.end;
    const Point2D& p3 = s2.start;
    const Point2D& p4 = s2.end;

    const int d1 = orientation(p3, p4, p1);
    const int d2 = orientation(p3, p4, p2);
    const int d3 = orientation(p1, p2, p3);
    const int d4 = orientation(p1, p2, p4);

    SegmentIntersection out{};

    if (d1 * d2 < 0 && d3 * d4 < 0) {
        const double denom = (p1.x - p2.x) * (p3.y - p4.y) - (p1.y - p2.y) * (p3.x - p4.x);
        const double t = ((p1.x - p3.x) * (p3.y - p4.y) - (p1.y - p3.y) * (p3.x - p4.x)) / denom;
        out.kind = IntersectionKind::Proper;
        out.point = Point2D{p1.x + t * (p2.x - p1.x), p1.y + t * (p2.y - p1.y)};
        return out;
    }

    if (d1 == 0 && d2 == 0 && d3 == 0 && d4 == 0) {
        // Collinear: count shared points along the common line.
        int shared = 0;
        Point2D sharedPoint{};
        const Point2D* candidates[4] = {&p1, &p2, &p3, &p4};
        const LineSegment* owners[4] = {&s2, &s2, &s1, &s1};
        for (int i = 0; i < 4; ++i) {
            if (withinBox(owners[i]->start, owners[i]->end, *candidates[i])) {
                if (shared == 0 || sharedPoint != *candidates[i]) {
                    ++shared;
                    sharedPoint = *candidates[i];
                }
            }
        }
        if (shared == 0) return out;
        if (shared == 1) {
            out.kind = IntersectionKind::Touching;
            out.point = sharedPoint;
            return out;
        }
        out.kind = IntersectionKind::Collinear;
        return out;
    }

    if (d1 == 0 && withinBox(p3, p4, p1)) { out.kind = IntersectionKind::Touching; out.point = p1; return out; }
    if (d2 == 0 && withinBox(p3, p4, p2)) { out.kind = IntersectionKind::Touching; out.point = p2; return out; }
    if (d3 == 0 && withinBox(p1, p2, p3)) { out.kind = IntersectionKind::Touching; out.point = p3; return out; }
    if (d4 == 0 && withinBox(p1, p2, p4)) { out.kind = IntersectionKind::Touching; out.point = p4; return out; }

    return out;
}

bool segmentsCrossProperly(const Point2D& a0, const Point2D& a1, const Point2D& b0, const Point2D& b1) {
    return segmentsIntersect(LineSegment{a0, a1}, LineSegment{b0, b1}).kind == IntersectionKind::Proper;
}

} // namespace mall
