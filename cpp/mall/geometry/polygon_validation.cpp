#include "mall/geometry/polygon_validation.h"
#include "mall/geometry/polygon_metrics.h"
#include "mall/geometry/segment.h"
#include "mall/core/constants.h"

#include <cmath>

namespace mall {

const char* polygonIssueName(PolygonIssue issue) noexcept {
    switch (issue) {
        case PolygonIssue::None: return "None";
        case PolygonIssue::TooFewVertices: return "TooFewVertices";
        case PolygonIssue::NonFiniteCoordinate: return "NonFiniteCoordinate";
        case PolygonIssue::NotClosed: return "NotClosed";
        case PolygonIssue::RepeatedVertex: return "RepeatedVertex";
        case PolygonIssue::SelfIntersecting: return "SelfIntersecting";
        case PolygonIssue::ZeroArea: return "ZeroArea";
    }
    return "Unknown";
}

bool hasFiniteVertices(const Polygon& polygon) {
    for (const Point2D& p : polygon.vertices) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) return false;
    }
    return true;
}

bool isSelfIntersecting(const Polygon& polygon) {
    const auto& v = polygon.vertices;
    const std::size_t n = v.size();
    if (n < kMinPolygonVertices) return false;

    for (std::size_t i = 0; i < n; ++i) {
        const LineSegment ei{v[i], v[(i + 1) % n]};
        for (std::size_t j = i + 1; j < n; ++j) {
            const LineSegment ej{v[j], v[(j + 1) % n]};
            const bool adjacent = (j == i + 1) || (i == 0 && j == n - 1);
            const SegmentIntersection hit = segmentsIntersect(ei, ej);
            if (adjacent) {
                if (hit.kind == IntersectionKind::Collinear) return true;
            } else if (hit.kind != IntersectionKind::None) {
                return true;
            }
        }
    }
    return false;
}

PolygonValidation validatePolygon(const Polygon& polygon) {
    PolygonValidation out{};
    const auto& v = polygon.vertices;
    const std::size_t n = v.size();

    if (n < kMinPolygonVertices) {
        out.error = MallError::InvalidPolygon;
        out.issue = PolygonIssue::TooFewVertices;
        return out;
    }

    for (std::size_t i = 0; i < n; ++i) {
        if (!std::isfinite(v[i].x) || !std::isfinite(v[i].y)) {
            out.error = MallError::InvalidPolygon;
            out.issue = PolygonIssue::NonFiniteCoordinate;
            out.vertexIndex = i;
            return out;
        }
    }

    if (!polygon.isClosed) {
        out.error = MallError::InvalidPolygon;
        out.issue = PolygonIssue::NotClosed;
        return out;
    }

    for (std::size_t i = 0; i < n; ++i) {
        if (distance(v[i], v[(i + 1) % n]) <= kOnEdgeTolerance) {
            out.error = MallError::InvalidPolygon;
            out.issue = PolygonIssue::RepeatedVertex;
            out.vertexIndex = (i + 1) % n;
            return out;
        }
    }

    if (isSelfIntersecting(polygon)) {
        out.error = MallError::SelfIntersecting;
        out.issue = PolygonIssue::SelfIntersecting;
        return out;
    }

    const double a = polygonArea(polygon);
    if (a <= kOrientationEpsilon) {
        out.error = MallError::InvalidPolygon;
        out.issue = PolygonIssue::ZeroArea;
        return out;
    }
    out.smallArea = a < kMinPolygonArea;
    return out;
}

} // namespace mall
