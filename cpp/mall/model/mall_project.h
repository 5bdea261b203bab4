#ifndef MALLCAD_MALL_PROJECT_H
#define MALLCAD_MALL_PROJECT_H

#include "mall/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mall {

enum class AreaType : std::uint8_t {
    Retail = 0,
    Food = 1,
    Service = 2,
    Anchor = 3,
    Common = 4,
    Corridor = 5,
    Elevator = 6,
    Escalator = 7,
    Stairs = 8,
    Restroom = 9,
    Storage = 10,
    Office = 11,
    Parking = 12,
    Other = 13,
};

enum class AreaStatus : std::uint8_t {
    Available = 0,
    Locked = 1,
    Pending = 2,
    Authorized = 3,
    Occupied = 4,
};

enum class LengthUnit : std::uint8_t { Meters = 0, Feet = 1 };

enum class ConnectionType : std::uint8_t { Elevator = 0, Escalator = 1, Stairs = 2 };

// Derived values are refreshed by SpatialModel whenever the shape changes.
struct AreaProperties {
    double area{0.0};
    double perimeter{0.0};
    std::string notes;
};

struct AreaDefinition {
    std::string id;
    std::string name;
    AreaType type{AreaType::Retail};
    AreaStatus status{AreaStatus::Available};
    Polygon shape;
    std::string color;
    bool visible{true};
    bool locked{false};
    std::string merchantId; // empty when unassigned
    AreaProperties properties;
};

struct FloorDefinition {
    std::string id;
    std::string name;
    int level{1};
    double height{4.0};
    std::optional<Polygon> shape; // absent: inherits the mall outline
    std::string color;
    bool visible{true};
    bool locked{false};
    std::vector<AreaDefinition> areas;
};

struct ProjectSettings {
    double gridSize{1.0};
    bool snapToGrid{true};
    double defaultFloorHeight{4.0};
    LengthUnit unit{LengthUnit::Meters};
};

struct VerticalConnection {
    std::string areaId;
    ConnectionType type{ConnectionType::Elevator};
    std::vector<std::string> floorIds;
};

struct MallProject {
    std::string id;
    std::string name;
    std::string description;
    std::int64_t createdAtMs{0};
    std::int64_t updatedAtMs{0};
    std::uint32_t revision{1};
    Polygon outline;
    ProjectSettings settings;
    std::vector<FloorDefinition> floors;
    std::vector<VerticalConnection> connections;
};

bool operator==(const AreaProperties& a, const AreaProperties& b);
bool operator==(const AreaDefinition& a, const AreaDefinition& b);
bool operator==(const FloorDefinition& a, const FloorDefinition& b);
bool operator==(const ProjectSettings& a, const ProjectSettings& b);
bool operator==(const VerticalConnection& a, const VerticalConnection& b);
bool operator==(const MallProject& a, const MallProject& b);

inline bool operator!=(const MallProject& a, const MallProject& b) { return !(a == b); }

// =============================================================================
// Enum <-> string (persisted names)
// =============================================================================

const char* areaTypeName(AreaType type) noexcept;
bool parseAreaType(std::string_view name, AreaType& out) noexcept;

const char* areaStatusName(AreaStatus status) noexcept;
bool parseAreaStatus(std::string_view name, AreaStatus& out) noexcept;

const char* lengthUnitName(LengthUnit unit) noexcept;
bool parseLengthUnit(std::string_view name, LengthUnit& out) noexcept;

const char* connectionTypeName(ConnectionType type) noexcept;
bool parseConnectionType(std::string_view name, ConnectionType& out) noexcept;

// Elevator, escalator and stairs areas own a vertical connection.
bool isCirculationType(AreaType type) noexcept;
bool connectionTypeForArea(AreaType type, ConnectionType& out) noexcept;

// Default display colour (#rrggbb) for an area type.
const char* areaTypeColor(AreaType type) noexcept;

// =============================================================================
// Factories
// =============================================================================

// Square outline centred on the origin, default settings, no floors.
MallProject createEmptyProject(const std::string& id, const std::string& name);

// Named "<level>F", default height, inherits the outline.
FloorDefinition createDefaultFloor(const std::string& id, int level);

MallError validateSettings(const ProjectSettings& settings);

// The floor's own shape, or the project outline when it has none.
const Polygon& effectiveShape(const MallProject& project, const FloorDefinition& floor);

} // namespace mall

#endif // MALLCAD_MALL_PROJECT_H
