#include "mall/model/vertical_connection.h"

#include <algorithm>

namespace mall {

namespace {
    ConnectionValidation reject(ConnectionRule rule) {
        return ConnectionValidation{MallError::ConnectionRuleViolation, rule};
    }

    const AreaDefinition* findAreaIn(const MallProject& project, const std::string& areaId) {
        for (const auto& floor : project.floors) {
            for (const auto& area : floor.areas) {
                if (area.id == areaId) return &area;
            }
        }
        return nullptr;
    }

    const FloorDefinition* findFloorIn(const MallProject& project, const std::string& floorId) {
        for (const auto& floor : project.floors) {
            if (floor.id == floorId) return &floor;
        }
        return nullptr;
    }
} // namespace

const char* connectionRuleName(ConnectionRule rule) noexcept {
    switch (rule) {
        case ConnectionRule::None: return "None";
        case ConnectionRule::NotCirculationArea: return "NotCirculationArea";
        case ConnectionRule::TypeMismatch: return "TypeMismatch";
        case ConnectionRule::EmptyFloorSet: return "EmptyFloorSet";
        case ConnectionRule::DuplicateFloor: return "DuplicateFloor";
        case ConnectionRule::UnknownFloor: return "UnknownFloor";
        case ConnectionRule::StairsFloorCount: return "StairsFloorCount";
        case ConnectionRule::StairsNotAdjacent: return "StairsNotAdjacent";
    }
    return "Unknown";
}

const char* connectionRuleMessage(ConnectionRule rule) noexcept {
    switch (rule) {
        case ConnectionRule::None: return "ok";
        case ConnectionRule::NotCirculationArea: return "only elevator, escalator and stairs areas can be connected";
        case ConnectionRule::TypeMismatch: return "connection type does not match the area type";
        case ConnectionRule::EmptyFloorSet: return "a connection must serve at least one floor";
        case ConnectionRule::DuplicateFloor: return "a floor appears more than once";
        case ConnectionRule::UnknownFloor: return "a referenced floor does not exist";
        case ConnectionRule::StairsFloorCount: return "stairs must connect exactly two floors";
        case ConnectionRule::StairsNotAdjacent: return "stairs can only connect adjacent floors";
    }
    return "unknown rule";
}

ConnectionValidation validateConnectionLevels(ConnectionType type, const std::vector<int>& levels) {
    if (levels.empty()) return reject(ConnectionRule::EmptyFloorSet);

    std::vector<int> sorted(levels);
    std::sort(sorted.begin(), sorted.end());
    if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
        return reject(ConnectionRule::DuplicateFloor);
    }

    if (type == ConnectionType::Stairs) {
        if (sorted.size() != 2) return reject(ConnectionRule::StairsFloorCount);
        // sorted[0] < sorted[1], so the increment cannot overflow.
        if (sorted[1] != sorted[0] + 1) return reject(ConnectionRule::StairsNotAdjacent);
    }
    return {};
}

ConnectionValidation validateVerticalConnection(const MallProject& project, const VerticalConnection& connection) {
    const AreaDefinition* area = findAreaIn(project, connection.areaId);
    if (!area) return ConnectionValidation{MallError::NotFound, ConnectionRule::None};

    ConnectionType areaConnection{};
    if (!connectionTypeForArea(area->type, areaConnection)) {
        return reject(ConnectionRule::NotCirculationArea);
    }
    if (areaConnection != connection.type) return reject(ConnectionRule::TypeMismatch);

    std::vector<int> levels;
    levels.reserve(connection.floorIds.size());
    for (const auto& floorId : connection.floorIds) {
        const FloorDefinition* floor = findFloorIn(project, floorId);
        if (!floor) return reject(ConnectionRule::UnknownFloor);
        levels.push_back(floor->level);
    }
    // Floor levels are unique, so a repeated level means a repeated floor id.
    return validateConnectionLevels(connection.type, levels);
}

const VerticalConnection* connectionForArea(const MallProject& project, const std::string& areaId) {
    for (const auto& connection : project.connections) {
        if (connection.areaId == areaId) return &connection;
    }
    return nullptr;
}

std::vector<const VerticalConnection*> connectionsForFloor(const MallProject& project, const std::string& floorId) {
    std::vector<const VerticalConnection*> out;
    for (const auto& connection : project.connections) {
        if (std::find(connection.floorIds.begin(), connection.floorIds.end(), floorId) != connection.floorIds.end()) {
            out.push_back(&connection);
        }
    }
    return out;
}

} // namespace mall
