#include <gtest/gtest.h>
#include "mall/geometry/polygon_containment.h"
#include "mall/model/spatial_model.h"
#include "tests/model_test_common.h"

#include <algorithm>

using namespace mall;
using mall_test::makeShop;
using mall_test::poly;
using mall_test::rect;
using mall_test::SpatialModelTest;

TEST(SpatialModelBasicsTest, StartsWithDefaultProject) {
    SpatialModel model;
    const MallProject& p = model.project();
    EXPECT_TRUE(p.floors.empty());
    EXPECT_EQ(p.outline.vertices.size(), 4u);
    EXPECT_DOUBLE_EQ(p.settings.gridSize, 1.0);
    EXPECT_EQ(p.settings.unit, LengthUnit::Meters);
    EXPECT_FALSE(model.canUndo());
}

TEST(SpatialModelBasicsTest, FactoriesUseDefaults) {
    const MallProject p = createEmptyProject("p1", "Harbour Mall");
    EXPECT_EQ(p.id, "p1");
    EXPECT_EQ(p.revision, 1u);
    EXPECT_EQ(p.outline, rect(-50, -50, 100, 100));

    const FloorDefinition f = createDefaultFloor("f2", 2);
    EXPECT_EQ(f.name, "2F");
    EXPECT_DOUBLE_EQ(f.height, 4.0);
    EXPECT_FALSE(f.shape.has_value());
}

TEST_F(SpatialModelTest, AddAreaComputesProperties) {
    const AreaResult r = model.addArea(floorId(1), makeShop("shop-1", rect(0, 0, 10, 10)));
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.contained);
    EXPECT_DOUBLE_EQ(r.area.properties.area, 100.0);
    EXPECT_DOUBLE_EQ(r.area.properties.perimeter, 40.0);
    EXPECT_FALSE(r.area.color.empty());

    const AreaDefinition* stored = model.findArea("shop-1");
    ASSERT_NE(stored, nullptr);
    EXPECT_EQ(*stored, r.area);
    EXPECT_EQ(model.floorOfArea("shop-1")->id, floorId(1));
}

TEST_F(SpatialModelTest, OverlapBlocksAndReportsPair) {
    ASSERT_TRUE(model.addArea(floorId(1), makeShop("a", poly({{0, 0}, {5, 0}, {5, 5}, {0, 5}}))).ok());
    const MallProject before = model.project();

    const AreaResult r = model.addArea(floorId(1), makeShop("b", poly({{3, 3}, {8, 3}, {8, 8}, {3, 8}})));
    EXPECT_EQ(r.error, MallError::Overlap);
    EXPECT_EQ(r.overlap.areaId, "b");
    EXPECT_EQ(r.overlap.otherAreaId, "a");
    EXPECT_EQ(model.project(), before);
}

TEST_F(SpatialModelTest, SharedEdgeAreasAccepted) {
    ASSERT_TRUE(model.addArea(floorId(1), makeShop("a", poly({{0, 0}, {5, 0}, {5, 5}, {0, 5}}))).ok());
    EXPECT_TRUE(model.addArea(floorId(1), makeShop("b", poly({{5, 0}, {10, 0}, {10, 5}, {5, 5}}))).ok());
}

TEST_F(SpatialModelTest, OverlapIsPerFloor) {
    ASSERT_TRUE(model.addArea(floorId(1), makeShop("a", rect(0, 0, 10, 10))).ok());
    EXPECT_TRUE(model.addArea(floorId(2), makeShop("b", rect(0, 0, 10, 10))).ok());
}

TEST_F(SpatialModelTest, AreaOutsideFloorIsFlaggedButAdded) {
    const AreaResult r = model.addArea(floorId(1), makeShop("edge", rect(95, 10, 10, 10)));
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(r.contained);
    ASSERT_NE(model.findArea("edge"), nullptr);

    const auto violations = model.collectContainmentViolations();
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].kind, ContainmentViolation::Kind::AreaOutsideFloor);
    EXPECT_EQ(violations[0].entityId, "edge");
}

TEST_F(SpatialModelTest, StructuralErrorsAbortWithoutWrites) {
    const MallProject before = model.project();

    AreaResult r = model.addArea(floorId(1), makeShop("bow", poly({{0, 0}, {10, 10}, {10, 0}, {0, 10}})));
    EXPECT_EQ(r.error, MallError::SelfIntersecting);

    r = model.addArea(floorId(1), makeShop("line", poly({{0, 0}, {10, 10}})));
    EXPECT_EQ(r.error, MallError::InvalidPolygon);
    EXPECT_EQ(r.polygonIssue, PolygonIssue::TooFewVertices);

    r = model.addArea("floor-9", makeShop("x", rect(0, 0, 1, 1)));
    EXPECT_EQ(r.error, MallError::NotFound);

    EXPECT_EQ(model.project(), before);
}

TEST_F(SpatialModelTest, AreaIdsAreUniqueAcrossFloors) {
    ASSERT_TRUE(model.addArea(floorId(1), makeShop("shop", rect(0, 0, 5, 5))).ok());
    EXPECT_EQ(model.addArea(floorId(2), makeShop("shop", rect(0, 0, 5, 5))).error, MallError::DuplicateId);
    EXPECT_EQ(model.addArea(floorId(2), makeShop("", rect(0, 0, 5, 5))).error, MallError::InvalidArgument);
}

TEST_F(SpatialModelTest, UpdateAreaShapeRechecks) {
    ASSERT_TRUE(model.addArea(floorId(1), makeShop("a", rect(0, 0, 5, 5))).ok());
    ASSERT_TRUE(model.addArea(floorId(1), makeShop("b", rect(10, 0, 5, 5))).ok());

    // Growing over itself is fine; growing into b is not.
    AreaResult r = model.updateAreaShape("a", rect(0, 0, 8, 5));
    ASSERT_TRUE(r.ok());
    EXPECT_DOUBLE_EQ(r.area.properties.area, 40.0);
    EXPECT_DOUBLE_EQ(model.findArea("a")->properties.area, 40.0);

    r = model.updateAreaShape("a", rect(0, 0, 12, 5));
    EXPECT_EQ(r.error, MallError::Overlap);
    EXPECT_EQ(r.overlap.otherAreaId, "b");
    EXPECT_EQ(model.findArea("a")->shape, rect(0, 0, 8, 5));

    EXPECT_EQ(model.updateAreaShape("nope", rect(0, 0, 1, 1)).error, MallError::NotFound);
}

TEST_F(SpatialModelTest, FloorRules) {
    EXPECT_EQ(model.addFloor(createDefaultFloor(floorId(1), 7)).error, MallError::DuplicateId);
    EXPECT_EQ(model.addFloor(createDefaultFloor("other", 2)).error, MallError::DuplicateLevel);

    FloorDefinition flat = createDefaultFloor("flat", 9);
    flat.height = 0.0;
    EXPECT_EQ(model.addFloor(flat).error, MallError::InvalidArgument);

    EXPECT_EQ(model.removeFloor("missing").error, MallError::NotFound);
    ASSERT_TRUE(model.removeFloor(floorId(3)).ok());
    ASSERT_TRUE(model.removeFloor(floorId(2)).ok());
    EXPECT_EQ(model.removeFloor(floorId(1)).error, MallError::LastFloor);
    EXPECT_EQ(model.project().floors.size(), 1u);
}

TEST_F(SpatialModelTest, AddFloorWithAreas) {
    FloorDefinition basement = createDefaultFloor("b1", 0);
    basement.shape = rect(10, 10, 50, 50);
    basement.areas.push_back(makeShop("p1", rect(10, 10, 10, 10)));
    basement.areas.push_back(makeShop("p2", rect(55, 55, 10, 10)));

    const FloorResult r = model.addFloor(basement);
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.contained);
    ASSERT_EQ(r.violations.size(), 1u);
    EXPECT_EQ(r.violations[0].entityId, "p2");
    EXPECT_DOUBLE_EQ(model.findArea("p1")->properties.area, 100.0);

    FloorDefinition clash = createDefaultFloor("b2", -1);
    clash.areas.push_back(makeShop("q1", rect(0, 0, 10, 10)));
    clash.areas.push_back(makeShop("q2", rect(5, 5, 10, 10)));
    const FloorResult bad = model.addFloor(clash);
    EXPECT_EQ(bad.error, MallError::Overlap);
    EXPECT_EQ(bad.overlap.areaId, "q2");
    EXPECT_EQ(bad.overlap.otherAreaId, "q1");
    EXPECT_EQ(model.findFloor("b2"), nullptr);
}

TEST_F(SpatialModelTest, FloorShapeInheritsOutline) {
    const FloorDefinition* f = model.findFloor(floorId(1));
    ASSERT_NE(f, nullptr);
    EXPECT_EQ(model.effectiveShape(*f), model.project().outline);

    ASSERT_TRUE(model.addArea(floorId(1), makeShop("corner", rect(80, 80, 10, 10))).ok());
    FloorResult r = model.setFloorShape(floorId(1), rect(0, 0, 50, 50));
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.contained);
    ASSERT_EQ(r.violations.size(), 1u);
    EXPECT_EQ(r.violations[0].entityId, "corner");

    r = model.setFloorShape(floorId(1), rect(50, 50, 60, 60));
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(r.contained);

    ASSERT_TRUE(model.setFloorShape(floorId(1), std::nullopt).ok());
    EXPECT_FALSE(model.findFloor(floorId(1))->shape.has_value());
    EXPECT_TRUE(model.collectContainmentViolations().empty());
}

TEST_F(SpatialModelTest, SetOutlineReportsViolators) {
    ASSERT_TRUE(model.setFloorShape(floorId(2), rect(0, 0, 100, 100)).ok());
    ASSERT_TRUE(model.addArea(floorId(1), makeShop("far", rect(70, 70, 10, 10))).ok());
    ASSERT_TRUE(model.addArea(floorId(1), makeShop("near", rect(5, 5, 10, 10))).ok());

    const OutlineResult r = model.setOutline(rect(0, 0, 50, 50));
    ASSERT_TRUE(r.ok());
    const auto ids = r.violatingIds();
    EXPECT_NE(std::find(ids.begin(), ids.end(), floorId(2)), ids.end());
    EXPECT_NE(std::find(ids.begin(), ids.end(), "far"), ids.end());
    EXPECT_EQ(std::find(ids.begin(), ids.end(), "near"), ids.end());
    // Nothing is deleted.
    EXPECT_NE(model.findArea("far"), nullptr);

    EXPECT_EQ(model.setOutline(poly({{0, 0}, {1, 1}})).error, MallError::InvalidPolygon);
}

TEST_F(SpatialModelTest, AcceptedShapesHoldContainment) {
    ASSERT_TRUE(model.addArea(floorId(1), makeShop("a", rect(10, 10, 20, 20))).ok());
    ASSERT_TRUE(model.addArea(floorId(1), makeShop("b", rect(30, 10, 20, 20))).ok());
    for (const auto& floor : model.project().floors) {
        const Polygon& shape = model.effectiveShape(floor);
        EXPECT_TRUE(isContainedIn(shape, model.project().outline));
        for (const auto& area : floor.areas) {
            EXPECT_TRUE(isContainedIn(area.shape, shape));
        }
    }
}

TEST_F(SpatialModelTest, SettingsValidated) {
    ProjectSettings s = model.project().settings;
    s.gridSize = 0.5;
    s.unit = LengthUnit::Feet;
    ASSERT_EQ(model.setSettings(s), MallError::Ok);
    EXPECT_EQ(model.project().settings, s);

    s.gridSize = 0.0;
    EXPECT_EQ(model.setSettings(s), MallError::InvalidArgument);
    s.gridSize = 1.0;
    s.defaultFloorHeight = -2.0;
    EXPECT_EQ(model.setSettings(s), MallError::InvalidArgument);
}

TEST_F(SpatialModelTest, MutationsBumpRevision) {
    const std::uint32_t rev = model.project().revision;
    ASSERT_TRUE(model.addArea(floorId(1), makeShop("a", rect(0, 0, 5, 5))).ok());
    EXPECT_EQ(model.project().revision, rev + 1);
    EXPECT_GE(model.project().updatedAtMs, model.project().createdAtMs);

    EXPECT_EQ(model.removeArea("a"), MallError::Ok);
    EXPECT_EQ(model.project().revision, rev + 2);
    EXPECT_EQ(model.removeArea("a"), MallError::NotFound);
    EXPECT_EQ(model.project().revision, rev + 2);
}

TEST_F(SpatialModelTest, LoadProjectValidatesStructure) {
    MallProject p = createEmptyProject("loaded", "Loaded");
    p.floors.push_back(createDefaultFloor("g", 1));
    p.floors.push_back(createDefaultFloor("h", 1));
    ProjectCheck check = model.loadProject(p);
    EXPECT_EQ(check.error, MallError::DuplicateLevel);
    EXPECT_EQ(model.project().id, "mall");

    p.floors[1].level = 2;
    check = model.loadProject(p);
    ASSERT_TRUE(check.ok()) << check.message;
    EXPECT_EQ(model.project().id, "loaded");
    EXPECT_FALSE(model.canUndo());
}
