#include <gtest/gtest.h>
#include "mall/geometry/overlap_detector.h"
#include "mall/geometry/point_containment.h"
#include "tests/model_test_common.h"

#include <utility>
#include <vector>

using namespace mall;
using mall_test::poly;
using mall_test::rect;

TEST(OverlapDetectorTest, SharedEdgeDoesNotOverlap) {
    const Polygon a = poly({{0, 0}, {5, 0}, {5, 5}, {0, 5}});
    const Polygon b = poly({{5, 0}, {10, 0}, {10, 5}, {5, 5}});
    EXPECT_FALSE(doOverlap(a, b));
    EXPECT_FALSE(doOverlap(b, a));
}

TEST(OverlapDetectorTest, PartialInteriorOverlap) {
    const Polygon a = poly({{0, 0}, {5, 0}, {5, 5}, {0, 5}});
    const Polygon b = poly({{3, 3}, {8, 3}, {8, 8}, {3, 8}});
    EXPECT_TRUE(doOverlap(a, b));
    EXPECT_TRUE(doOverlap(b, a));
}

TEST(OverlapDetectorTest, SharedVertexOnlyDoesNotOverlap) {
    EXPECT_FALSE(doOverlap(rect(0, 0, 5, 5), rect(5, 5, 5, 5)));
}

TEST(OverlapDetectorTest, FullyNested) {
    EXPECT_TRUE(doOverlap(rect(0, 0, 10, 10), rect(2, 2, 3, 3)));
    EXPECT_TRUE(doOverlap(rect(2, 2, 3, 3), rect(0, 0, 10, 10)));
}

TEST(OverlapDetectorTest, IdenticalPolygonsOverlap) {
    EXPECT_TRUE(doOverlap(rect(0, 0, 4, 4), rect(0, 0, 4, 4)));
}

TEST(OverlapDetectorTest, NestedSharingOuterEdge) {
    // Inner touches the outer boundary with a full edge and has no vertex
    // strictly inside.
    EXPECT_TRUE(doOverlap(rect(0, 0, 10, 10), rect(0, 0, 10, 5)));
}

TEST(OverlapDetectorTest, DiagonalSpanningThroughCorners) {
    // Triangle whose hypotenuse runs corner to corner through the square.
    const Polygon square = rect(0, 0, 10, 10);
    const Polygon tri = poly({{0, 0}, {10, 10}, {0, 10}});
    EXPECT_TRUE(doOverlap(square, tri));
    EXPECT_TRUE(doOverlap(tri, square));
}

TEST(OverlapDetectorTest, CrossShapeWithoutContainedVertices) {
    EXPECT_TRUE(doOverlap(rect(0, 4, 10, 2), rect(4, 0, 2, 10)));
}

TEST(OverlapDetectorTest, DisjointAndConcavePocket) {
    EXPECT_FALSE(doOverlap(rect(0, 0, 2, 2), rect(5, 5, 2, 2)));

    // Square sitting in the pocket of a U, touching its walls.
    const Polygon u = poly({{0, 0}, {30, 0}, {30, 30}, {20, 30}, {20, 10}, {10, 10}, {10, 30}, {0, 30}});
    EXPECT_FALSE(doOverlap(u, rect(10, 10, 10, 10)));
    EXPECT_TRUE(doOverlap(u, rect(10, 5, 10, 10)));
}

TEST(OverlapDetectorTest, DegenerateNeverOverlaps) {
    EXPECT_FALSE(doOverlap(poly({{0, 0}, {10, 10}}), rect(0, 0, 10, 10)));
}

TEST(OverlapDetectorTest, SymmetricOverSampleSet) {
    const Polygon l = poly({{0, 0}, {10, 0}, {10, 5}, {5, 5}, {5, 10}, {0, 10}});
    const std::vector<Polygon> shapes = {
        rect(0, 0, 5, 5),
        rect(5, 0, 5, 5),
        rect(3, 3, 5, 5),
        rect(6, 6, 4, 4),
        rect(5, 5, 5, 5),
        rect(-2, -2, 20, 20),
        l,
        poly({{0, 0}, {10, 10}, {0, 10}}),
    };
    for (std::size_t i = 0; i < shapes.size(); ++i) {
        for (std::size_t j = 0; j < shapes.size(); ++j) {
            EXPECT_EQ(doOverlap(shapes[i], shapes[j]), doOverlap(shapes[j], shapes[i]))
                << "pair " << i << "," << j;
        }
    }
    // The L's notch holds rect(5, 5, 5, 5) exactly.
    EXPECT_FALSE(doOverlap(l, rect(5, 5, 5, 5)));
    EXPECT_FALSE(doOverlap(l, rect(6, 6, 4, 4)));
}

TEST(OverlapDetectorTest, InteriorPointLiesInside) {
    const std::vector<Polygon> shapes = {
        rect(0, 0, 10, 10),
        poly({{0, 0}, {10, 0}, {10, 5}, {5, 5}, {5, 10}, {0, 10}}),
        // Reflex vertex poking into the ear of the lowest vertex.
        poly({{0, 0}, {10, 10}, {1, 2}, {-10, 10}}),
        poly({{0, 0}, {30, 0}, {30, 30}, {20, 30}, {20, 10}, {10, 10}, {10, 30}, {0, 30}}),
    };
    for (const auto& shape : shapes) {
        Point2D p{};
        ASSERT_TRUE(interiorPoint(shape, p));
        EXPECT_TRUE(isPointStrictlyInside(p, shape)) << p.x << "," << p.y;
    }
    Point2D unused{};
    EXPECT_FALSE(interiorPoint(poly({{0, 0}, {1, 1}}), unused));
}
