#pragma once

#include "mall/core/types.h"
#include "mall/geometry/segment.h"

#include <algorithm>
#include <vector>

namespace mall {

// Splits segment a -> b at every vertex of `splitter` lying on it and calls
// fn(midpoint) for each resulting piece. Without proper crossings each piece
// lies entirely inside, outside or on the boundary of `splitter`, so its
// midpoint classifies the whole piece.
template <typename Fn>
void forEachEdgePieceMidpoint(const Point2D& a, const Point2D& b, const Polygon& splitter, Fn&& fn) {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const double len2 = dx * dx + dy * dy;
    if (len2 == 0.0) return;

    std::vector<double> cuts;
    cuts.reserve(splitter.vertices.size() + 2);
    cuts.push_back(0.0);
    cuts.push_back(1.0);
    for (const Point2D& v : splitter.vertices) {
        if (!isPointOnSegment(v, a, b)) continue;
        const double t = ((v.x - a.x) * dx + (v.y - a.y) * dy) / len2;
        if (t > 0.0 && t < 1.0) cuts.push_back(t);
    }
    std::sort(cuts.begin(), cuts.end());

    for (std::size_t k = 0; k + 1 < cuts.size(); ++k) {
        const double t0 = cuts[k];
        const double t1 = cuts[k + 1];
        if (t1 - t0 <= 1e-12) continue;
        const double tm = (t0 + t1) * 0.5;
        fn(Point2D{a.x + tm * dx, a.y + tm * dy});
    }
}

} // namespace mall
