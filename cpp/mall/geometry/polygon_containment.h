#pragma once

#include "mall/core/types.h"

namespace mall {

// True when every vertex of inner lies inside or on the boundary of outer and
// no piece of an inner edge leaves outer. Edge pieces are the sub-segments
// between the points where outer vertices touch the edge, which rejects the
// "dumbbell" case where all vertices are inside a concave outer but an edge
// bridges a notch. Both polygons need at least 3 vertices.
bool isContainedIn(const Polygon& inner, const Polygon& outer);

} // namespace mall
