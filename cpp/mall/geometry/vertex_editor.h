#pragma once

#include "mall/core/types.h"

namespace mall {

struct VertexEditResult {
    MallError error{MallError::Ok};
    Polygon polygon; // edited copy on success, the untouched input on failure

    bool ok() const noexcept { return error == MallError::Ok; }
};

// Inserts point before position `index` (index == size appends). The input is
// not modified. Throws std::out_of_range when index > vertex count.
Polygon addVertex(const Polygon& polygon, std::size_t index, const Point2D& point);

// Fails with VertexCountViolation when the polygon has 3 or fewer vertices and
// with InvalidArgument when index is out of range.
VertexEditResult removeVertex(const Polygon& polygon, std::size_t index);

// Fails with InvalidArgument when index is out of range.
VertexEditResult moveVertex(const Polygon& polygon, std::size_t index, const Point2D& point);

} // namespace mall
