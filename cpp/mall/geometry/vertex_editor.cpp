#include "mall/geometry/vertex_editor.h"
#include "mall/core/constants.h"

#include <stdexcept>

namespace mall {

Polygon addVertex(const Polygon& polygon, std::size_t index, const Point2D& point) {
    if (index > polygon.vertices.size()) {
        throw std::out_of_range("Vertex insertion index past the end of the polygon");
    }
    Polygon out = polygon;
    out.vertices.insert(out.vertices.begin() + static_cast<std::ptrdiff_t>(index), point);
    return out;
}

VertexEditResult removeVertex(const Polygon& polygon, std::size_t index) {
    VertexEditResult out{};
    out.polygon = polygon;
    if (polygon.vertices.size() <= kMinPolygonVertices) {
        out.error = MallError::VertexCountViolation;
        return out;
    }
    if (index >= polygon.vertices.size()) {
        out.error = MallError::InvalidArgument;
        return out;
    }
    out.polygon.vertices.erase(out.polygon.vertices.begin() + static_cast<std::ptrdiff_t>(index));
    return out;
}

VertexEditResult moveVertex(const Polygon& polygon, std::size_t index, const Point2D& point) {
    VertexEditResult out{};
    out.polygon = polygon;
    if (index >= polygon.vertices.size()) {
        out.error = MallError::InvalidArgument;
        return out;
    }
    out.polygon.vertices[index] = point;
    return out;
}

} // namespace mall
