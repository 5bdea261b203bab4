#pragma once

#include "mall/core/types.h"

namespace mall {

enum class PolygonIssue : std::uint8_t {
    None = 0,
    TooFewVertices = 1,
    NonFiniteCoordinate = 2,
    NotClosed = 3,
    RepeatedVertex = 4,
    SelfIntersecting = 5,
    ZeroArea = 6,
};

struct PolygonValidation {
    MallError error{MallError::Ok};
    PolygonIssue issue{PolygonIssue::None};
    std::size_t vertexIndex{0}; // first offending vertex, when applicable
    bool smallArea{false};      // warning only

    bool ok() const noexcept { return error == MallError::Ok; }
};

const char* polygonIssueName(PolygonIssue issue) noexcept;

bool hasFiniteVertices(const Polygon& polygon);

// Any two non-adjacent edges touching, or adjacent edges folding back onto
// each other.
bool isSelfIntersecting(const Polygon& polygon);

// Structural check run before a polygon is committed to the model or accepted
// as a template outline. Simplicity is a precondition of the containment and
// overlap predicates.
PolygonValidation validatePolygon(const Polygon& polygon);

} // namespace mall
