#ifndef MALLCAD_MALL_TYPES_H
#define MALLCAD_MALL_TYPES_H

#include <cstdint>
#include <cstddef>
#include <vector>

// Plain value types shared by the geometry engine and the spatial model.

namespace mall {

struct Point2D {
    double x{0.0};
    double y{0.0};
};

inline bool operator==(const Point2D& a, const Point2D& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point2D& a, const Point2D& b) { return !(a == b); }

// Boundary in insertion order. A closed polygon implicitly joins the last
// vertex back to the first.
struct Polygon {
    std::vector<Point2D> vertices;
    bool isClosed{true};
};

inline bool operator==(const Polygon& a, const Polygon& b) {
    return a.isClosed == b.isClosed && a.vertices == b.vertices;
}
inline bool operator!=(const Polygon& a, const Polygon& b) { return !(a == b); }

// Derived, never stored.
struct BoundingBox {
    double minX, minY, maxX, maxY;
};

struct LineSegment {
    Point2D start;
    Point2D end;
};

enum class MallError : std::uint32_t {
    Ok = 0,
    InvalidPolygon = 1,
    SelfIntersecting = 2,
    NotContained = 3,
    Overlap = 4,
    VertexCountViolation = 5,
    ConnectionRuleViolation = 6,
    NotFound = 7,
    DuplicateId = 8,
    DuplicateLevel = 9,
    LastFloor = 10,
    InvalidArgument = 11,
    InvalidDocument = 12,
    UnsupportedVersion = 13,
    InvalidState = 14,
};

const char* errorName(MallError error) noexcept;

} // namespace mall

#endif // MALLCAD_MALL_TYPES_H
