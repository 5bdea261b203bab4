#include <gtest/gtest.h>
#include "mall/model/vertical_connection.h"
#include "tests/model_test_common.h"

#include <climits>

using namespace mall;
using mall_test::rect;

TEST(VerticalConnectionTest, StairsNeedTwoAdjacentLevels) {
    EXPECT_TRUE(validateConnectionLevels(ConnectionType::Stairs, {1, 2}).ok());
    EXPECT_TRUE(validateConnectionLevels(ConnectionType::Stairs, {3, 2}).ok());
    EXPECT_TRUE(validateConnectionLevels(ConnectionType::Stairs, {-1, 0}).ok());

    ConnectionValidation v = validateConnectionLevels(ConnectionType::Stairs, {1, 3});
    EXPECT_EQ(v.error, MallError::ConnectionRuleViolation);
    EXPECT_EQ(v.rule, ConnectionRule::StairsNotAdjacent);

    EXPECT_EQ(validateConnectionLevels(ConnectionType::Stairs, {1}).rule, ConnectionRule::StairsFloorCount);
    EXPECT_EQ(validateConnectionLevels(ConnectionType::Stairs, {1, 2, 3}).rule, ConnectionRule::StairsFloorCount);
}

TEST(VerticalConnectionTest, StairsAdjacencyAtIntegerExtremes) {
    EXPECT_EQ(validateConnectionLevels(ConnectionType::Stairs, {INT_MIN, INT_MAX}).rule,
        ConnectionRule::StairsNotAdjacent);
    EXPECT_EQ(validateConnectionLevels(ConnectionType::Stairs, {INT_MAX, -1}).rule,
        ConnectionRule::StairsNotAdjacent);
    EXPECT_TRUE(validateConnectionLevels(ConnectionType::Stairs, {INT_MAX - 1, INT_MAX}).ok());
    EXPECT_TRUE(validateConnectionLevels(ConnectionType::Stairs, {INT_MIN + 1, INT_MIN}).ok());
}

TEST(VerticalConnectionTest, ElevatorAndEscalatorAcceptAnyLevels) {
    EXPECT_TRUE(validateConnectionLevels(ConnectionType::Elevator, {1}).ok());
    EXPECT_TRUE(validateConnectionLevels(ConnectionType::Elevator, {1, 2, 3, 7}).ok());
    EXPECT_TRUE(validateConnectionLevels(ConnectionType::Escalator, {1, 3}).ok());
}

TEST(VerticalConnectionTest, EmptyAndDuplicateRejectedForEveryType) {
    for (ConnectionType type : {ConnectionType::Elevator, ConnectionType::Escalator, ConnectionType::Stairs}) {
        EXPECT_EQ(validateConnectionLevels(type, {}).rule, ConnectionRule::EmptyFloorSet);
        EXPECT_EQ(validateConnectionLevels(type, {2, 2}).rule, ConnectionRule::DuplicateFloor);
    }
}

TEST(VerticalConnectionTest, RuleNamesAndMessages) {
    EXPECT_STREQ(connectionRuleName(ConnectionRule::StairsNotAdjacent), "StairsNotAdjacent");
    EXPECT_STREQ(connectionRuleMessage(ConnectionRule::StairsFloorCount), "stairs must connect exactly two floors");
}

class VerticalConnectionModelTest : public mall_test::SpatialModelTest {
protected:
    void SetUp() override {
        mall_test::SpatialModelTest::SetUp();
        ASSERT_TRUE(model.addArea(floorId(1), mall_test::makeArea("stairs-a", AreaType::Stairs, rect(10, 10, 4, 6))).ok());
        ASSERT_TRUE(model.addArea(floorId(1), mall_test::makeArea("lift-a", AreaType::Elevator, rect(20, 10, 3, 3))).ok());
        ASSERT_TRUE(model.addArea(floorId(1), mall_test::makeShop("shop-a", rect(40, 40, 10, 10))).ok());
    }
};

TEST_F(VerticalConnectionModelTest, StairsAdjacency) {
    ConnectionResult r = model.setVerticalConnection("stairs-a", {floorId(1), floorId(3)});
    EXPECT_EQ(r.error, MallError::ConnectionRuleViolation);
    EXPECT_EQ(r.rule, ConnectionRule::StairsNotAdjacent);
    EXPECT_EQ(model.connectionForArea("stairs-a"), nullptr);

    r = model.setVerticalConnection("stairs-a", {floorId(1), floorId(2)});
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.connection.type, ConnectionType::Stairs);
    const VerticalConnection* stored = model.connectionForArea("stairs-a");
    ASSERT_NE(stored, nullptr);
    EXPECT_EQ(stored->floorIds.size(), 2u);
}

TEST_F(VerticalConnectionModelTest, ReplacesExistingConnection) {
    ASSERT_TRUE(model.setVerticalConnection("lift-a", {floorId(1), floorId(2)}).ok());
    ASSERT_TRUE(model.setVerticalConnection("lift-a", {floorId(1), floorId(2), floorId(3)}).ok());
    EXPECT_EQ(model.project().connections.size(), 1u);
    EXPECT_EQ(model.connectionsForFloor(floorId(3)).size(), 1u);
}

TEST_F(VerticalConnectionModelTest, RejectsNonCirculationAndUnknowns) {
    ConnectionResult r = model.setVerticalConnection("shop-a", {floorId(1)});
    EXPECT_EQ(r.rule, ConnectionRule::NotCirculationArea);

    r = model.setVerticalConnection("lift-a", {floorId(1), "floor-9"});
    EXPECT_EQ(r.error, MallError::ConnectionRuleViolation);
    EXPECT_EQ(r.rule, ConnectionRule::UnknownFloor);

    r = model.setVerticalConnection("lift-a", {floorId(2), floorId(2)});
    EXPECT_EQ(r.rule, ConnectionRule::DuplicateFloor);

    EXPECT_EQ(model.setVerticalConnection("missing", {floorId(1)}).error, MallError::NotFound);
    EXPECT_TRUE(model.project().connections.empty());
}

TEST_F(VerticalConnectionModelTest, ValidatorSeesTypeMismatch) {
    VerticalConnection c{};
    c.areaId = "lift-a";
    c.type = ConnectionType::Stairs;
    c.floorIds = {floorId(1), floorId(2)};
    EXPECT_EQ(validateVerticalConnection(model.project(), c).rule, ConnectionRule::TypeMismatch);
}

TEST_F(VerticalConnectionModelTest, RemovingAreaDeletesConnection) {
    ASSERT_TRUE(model.setVerticalConnection("stairs-a", {floorId(1), floorId(2)}).ok());
    ASSERT_EQ(model.removeArea("stairs-a"), MallError::Ok);
    EXPECT_EQ(model.connectionForArea("stairs-a"), nullptr);
    EXPECT_EQ(model.removeVerticalConnection("stairs-a"), MallError::NotFound);
}

TEST_F(VerticalConnectionModelTest, RemovingFloorDropsBrokenConnections) {
    ASSERT_TRUE(model.setVerticalConnection("stairs-a", {floorId(1), floorId(2)}).ok());
    ASSERT_TRUE(model.setVerticalConnection("lift-a", {floorId(1), floorId(2), floorId(3)}).ok());

    const RemoveFloorResult r = model.removeFloor(floorId(2));
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.droppedConnections.size(), 1u);
    EXPECT_EQ(r.droppedConnections[0], "stairs-a");

    EXPECT_EQ(model.connectionForArea("stairs-a"), nullptr);
    const VerticalConnection* lift = model.connectionForArea("lift-a");
    ASSERT_NE(lift, nullptr);
    EXPECT_EQ(lift->floorIds, (std::vector<std::string>{floorId(1), floorId(3)}));
}

TEST_F(VerticalConnectionModelTest, StairsBetweenFarApartFloorsRejected) {
    ASSERT_TRUE(model.addFloor(createDefaultFloor("floor-top", INT_MAX)).ok());
    ASSERT_TRUE(model.addFloor(createDefaultFloor("floor-bottom", INT_MIN)).ok());

    const ConnectionResult r = model.setVerticalConnection("stairs-a", {"floor-bottom", "floor-top"});
    EXPECT_EQ(r.error, MallError::ConnectionRuleViolation);
    EXPECT_EQ(r.rule, ConnectionRule::StairsNotAdjacent);
    EXPECT_EQ(model.connectionForArea("stairs-a"), nullptr);
}

TEST_F(VerticalConnectionModelTest, RemovingFloorReportsConnectionsOfItsAreas) {
    ASSERT_TRUE(model.addArea(floorId(2), mall_test::makeArea("lift-b", AreaType::Elevator, rect(20, 10, 3, 3))).ok());
    ASSERT_TRUE(model.setVerticalConnection("lift-b", {floorId(2), floorId(3)}).ok());
    ASSERT_TRUE(model.setVerticalConnection("lift-a", {floorId(1), floorId(3)}).ok());

    const RemoveFloorResult r = model.removeFloor(floorId(2));
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.droppedConnections, (std::vector<std::string>{"lift-b"}));
    EXPECT_EQ(model.connectionForArea("lift-b"), nullptr);
    EXPECT_NE(model.connectionForArea("lift-a"), nullptr);
}
