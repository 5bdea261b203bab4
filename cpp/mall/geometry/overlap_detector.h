#pragma once

#include "mall/core/types.h"

namespace mall {

// Two simple polygons overlap iff they share interior area. Polygons that only
// touch along an edge or at a vertex do not overlap. Symmetric in its
// arguments. Fewer than 3 vertices on either side never overlaps.
//
// Order of tests:
//   1. bounding boxes must share area
//   2. any proper edge crossing
//   3. any vertex of one strictly inside the other
//   4. any boundary piece of one strictly inside the other (boundaries that
//      meet only at vertices, e.g. a diagonal spanning a rectangle)
//   5. a guaranteed interior point of one strictly inside the other
//      (coincident or fully nested boundaries)
bool doOverlap(const Polygon& a, const Polygon& b);

// A point strictly inside a simple polygon with non-zero area. Returns false
// for degenerate input.
bool interiorPoint(const Polygon& polygon, Point2D& out);

} // namespace mall
