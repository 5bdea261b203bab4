#pragma once

#include "mall/core/types.h"

namespace mall {

// Rounds each coordinate to the nearest multiple of gridSize.
// Throws std::invalid_argument when gridSize is not a finite value > 0.
Point2D snapToGrid(const Point2D& point, double gridSize);

Polygon snapPolygonToGrid(const Polygon& polygon, double gridSize);

} // namespace mall
