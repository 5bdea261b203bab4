#include "mall/model/mall_project.h"
#include "mall/core/constants.h"
#include "mall/core/util.h"
#include "mall/geometry/shapes.h"

#include <cmath>

namespace mall {

namespace {
    struct AreaTypeEntry {
        AreaType type;
        const char* name;
        const char* color;
    };

    constexpr AreaTypeEntry kAreaTypes[] = {
        {AreaType::Retail, "retail", "#3b82f6"},
        {AreaType::Food, "food", "#f97316"},
        {AreaType::Service, "service", "#8b5cf6"},
        {AreaType::Anchor, "anchor", "#ef4444"},
        {AreaType::Common, "common", "#6b7280"},
        {AreaType::Corridor, "corridor", "#9ca3af"},
        {AreaType::Elevator, "elevator", "#10b981"},
        {AreaType::Escalator, "escalator", "#14b8a6"},
        {AreaType::Stairs, "stairs", "#06b6d4"},
        {AreaType::Restroom, "restroom", "#ec4899"},
        {AreaType::Storage, "storage", "#78716c"},
        {AreaType::Office, "office", "#6366f1"},
        {AreaType::Parking, "parking", "#84cc16"},
        {AreaType::Other, "other", "#a3a3a3"},
    };

    constexpr const char* kAreaStatusNames[] = {"AVAILABLE", "LOCKED", "PENDING", "AUTHORIZED", "OCCUPIED"};
    constexpr const char* kConnectionTypeNames[] = {"elevator", "escalator", "stairs"};
} // namespace

bool operator==(const AreaProperties& a, const AreaProperties& b) {
    return a.area == b.area && a.perimeter == b.perimeter && a.notes == b.notes;
}

bool operator==(const AreaDefinition& a, const AreaDefinition& b) {
    return a.id == b.id && a.name == b.name && a.type == b.type && a.status == b.status &&
           a.shape == b.shape && a.color == b.color && a.visible == b.visible && a.locked == b.locked &&
           a.merchantId == b.merchantId && a.properties == b.properties;
}

bool operator==(const FloorDefinition& a, const FloorDefinition& b) {
    return a.id == b.id && a.name == b.name && a.level == b.level && a.height == b.height &&
           a.shape == b.shape && a.color == b.color && a.visible == b.visible && a.locked == b.locked &&
           a.areas == b.areas;
}

bool operator==(const ProjectSettings& a, const ProjectSettings& b) {
    return a.gridSize == b.gridSize && a.snapToGrid == b.snapToGrid &&
           a.defaultFloorHeight == b.defaultFloorHeight && a.unit == b.unit;
}

bool operator==(const VerticalConnection& a, const VerticalConnection& b) {
    return a.areaId == b.areaId && a.type == b.type && a.floorIds == b.floorIds;
}

bool operator==(const MallProject& a, const MallProject& b) {
    return a.id == b.id && a.name == b.name && a.description == b.description &&
           a.createdAtMs == b.createdAtMs && a.updatedAtMs == b.updatedAtMs && a.revision == b.revision &&
           a.outline == b.outline && a.settings == b.settings && a.floors == b.floors &&
           a.connections == b.connections;
}

const char* areaTypeName(AreaType type) noexcept {
    for (const auto& entry : kAreaTypes) {
        if (entry.type == type) return entry.name;
    }
    return "other";
}

bool parseAreaType(std::string_view name, AreaType& out) noexcept {
    for (const auto& entry : kAreaTypes) {
        if (name == entry.name) {
            out = entry.type;
            return true;
        }
    }
    return false;
}

const char* areaTypeColor(AreaType type) noexcept {
    for (const auto& entry : kAreaTypes) {
        if (entry.type == type) return entry.color;
    }
    return "#6b7280";
}

const char* areaStatusName(AreaStatus status) noexcept {
    const auto i = static_cast<std::size_t>(status);
    if (i >= sizeof(kAreaStatusNames) / sizeof(kAreaStatusNames[0])) return "AVAILABLE";
    return kAreaStatusNames[i];
}

bool parseAreaStatus(std::string_view name, AreaStatus& out) noexcept {
    for (std::size_t i = 0; i < sizeof(kAreaStatusNames) / sizeof(kAreaStatusNames[0]); ++i) {
        if (name == kAreaStatusNames[i]) {
            out = static_cast<AreaStatus>(i);
            return true;
        }
    }
    return false;
}

const char* lengthUnitName(LengthUnit unit) noexcept {
    return unit == LengthUnit::Feet ? "feet" : "meters";
}

bool parseLengthUnit(std::string_view name, LengthUnit& out) noexcept {
    if (name == "meters") { out = LengthUnit::Meters; return true; }
    if (name == "feet") { out = LengthUnit::Feet; return true; }
    return false;
}

const char* connectionTypeName(ConnectionType type) noexcept {
    const auto i = static_cast<std::size_t>(type);
    if (i >= 3) return "elevator";
    return kConnectionTypeNames[i];
}

bool parseConnectionType(std::string_view name, ConnectionType& out) noexcept {
    for (std::size_t i = 0; i < 3; ++i) {
        if (name == kConnectionTypeNames[i]) {
            out = static_cast<ConnectionType>(i);
            return true;
        }
    }
    return false;
}

bool isCirculationType(AreaType type) noexcept {
    return type == AreaType::Elevator || type == AreaType::Escalator || type == AreaType::Stairs;
}

bool connectionTypeForArea(AreaType type, ConnectionType& out) noexcept {
    switch (type) {
        case AreaType::Elevator: out = ConnectionType::Elevator; return true;
        case AreaType::Escalator: out = ConnectionType::Escalator; return true;
        case AreaType::Stairs: out = ConnectionType::Stairs; return true;
        default: return false;
    }
}

MallProject createEmptyProject(const std::string& id, const std::string& name) {
    MallProject project{};
    project.id = id;
    project.name = name;
    project.createdAtMs = nowEpochMs();
    project.updatedAtMs = project.createdAtMs;
    project.revision = 1;
    project.outline = rectangleToPolygon(
        -kDefaultOutlineHalfExtent,
        -kDefaultOutlineHalfExtent,
        2.0 * kDefaultOutlineHalfExtent,
        2.0 * kDefaultOutlineHalfExtent);
    project.settings.gridSize = kDefaultGridSize;
    project.settings.snapToGrid = true;
    project.settings.defaultFloorHeight = kDefaultFloorHeight;
    project.settings.unit = LengthUnit::Meters;
    return project;
}

FloorDefinition createDefaultFloor(const std::string& id, int level) {
    FloorDefinition floor{};
    floor.id = id;
    floor.name = std::to_string(level) + "F";
    floor.level = level;
    floor.height = kDefaultFloorHeight;
    return floor;
}

MallError validateSettings(const ProjectSettings& settings) {
    if (!(settings.gridSize > 0.0) || !std::isfinite(settings.gridSize)) return MallError::InvalidArgument;
    if (!(settings.defaultFloorHeight > 0.0) || !std::isfinite(settings.defaultFloorHeight)) {
        return MallError::InvalidArgument;
    }
    return MallError::Ok;
}

const Polygon& effectiveShape(const MallProject& project, const FloorDefinition& floor) {
    return floor.shape ? *floor.shape : project.outline;
}

} // namespace mall
