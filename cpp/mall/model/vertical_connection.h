#ifndef MALLCAD_MALL_VERTICAL_CONNECTION_H
#define MALLCAD_MALL_VERTICAL_CONNECTION_H

#include "mall/model/mall_project.h"

#include <cstdint>
#include <string>
#include <vector>

namespace mall {

// The rule a rejected connection broke. None on success.
enum class ConnectionRule : std::uint8_t {
    None = 0,
    NotCirculationArea = 1, // owning area is not elevator/escalator/stairs
    TypeMismatch = 2,       // connection type differs from the area type
    EmptyFloorSet = 3,
    DuplicateFloor = 4,
    UnknownFloor = 5,
    StairsFloorCount = 6,   // stairs link exactly two floors
    StairsNotAdjacent = 7,  // stair levels differ by exactly one
};

struct ConnectionValidation {
    MallError error{MallError::Ok};
    ConnectionRule rule{ConnectionRule::None};

    bool ok() const noexcept { return error == MallError::Ok; }
};

const char* connectionRuleName(ConnectionRule rule) noexcept;
const char* connectionRuleMessage(ConnectionRule rule) noexcept;

// State-free rule check over the levels of the floors a connection serves.
//   stairs:              exactly two levels, |a - b| == 1
//   elevator, escalator: one or more levels, any spacing
// Repeated levels are rejected for every type.
ConnectionValidation validateConnectionLevels(ConnectionType type, const std::vector<int>& levels);

// Resolves the area and floor ids against the project, then applies
// validateConnectionLevels. An unknown area yields NotFound.
ConnectionValidation validateVerticalConnection(const MallProject& project, const VerticalConnection& connection);

const VerticalConnection* connectionForArea(const MallProject& project, const std::string& areaId);

// Connections whose floor set includes floorId.
std::vector<const VerticalConnection*> connectionsForFloor(const MallProject& project, const std::string& floorId);

} // namespace mall

#endif // MALLCAD_MALL_VERTICAL_CONNECTION_H
