#pragma once

#include "mall/core/types.h"

namespace mall {

// Shoelace area, orientation independent. Zero for fewer than 3 vertices.
double polygonArea(const Polygon& polygon);

// Positive for counter-clockwise boundaries, negative for clockwise.
double signedArea(const Polygon& polygon);

// Sum of edge lengths; the closing edge is included only for closed polygons.
double polygonPerimeter(const Polygon& polygon);

// Callers must guard empty polygons; an empty vertex list yields a zero box.
BoundingBox boundingBox(const Polygon& polygon);

double distance(const Point2D& a, const Point2D& b);

// Vertex average. Not guaranteed to lie inside a concave polygon.
Point2D centroid(const Polygon& polygon);

// Closed-box test: boxes that only touch still count as overlapping.
bool boundingBoxesOverlap(const BoundingBox& a, const BoundingBox& b);

// Boxes that share positive area.
bool boundingBoxesShareArea(const BoundingBox& a, const BoundingBox& b);

} // namespace mall
