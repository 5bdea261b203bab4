#pragma once

#include "mall/core/types.h"

#include <cstdint>

namespace mall {

// Axis-aligned rectangle with corner (x, y), counter-clockwise.
Polygon rectangleToPolygon(double x, double y, double width, double height);

// Regular polygon starting at the top (-90 degrees) and walking
// counter-clockwise in a y-down view.
Polygon regularPolygon(const Point2D& center, double radius, std::uint32_t sides);

Polygon translatePolygon(const Polygon& polygon, double dx, double dy);

} // namespace mall
