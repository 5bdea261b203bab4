#include "mall/model/project_check.h"
#include "mall/model/vertical_connection.h"
#include "mall/core/constants.h"
#include "mall/geometry/polygon_validation.h"

#include <cmath>
#include <utility>
#include <unordered_set>

namespace mall {

namespace {
    ProjectCheck fail(MallError error, std::string message) {
        return ProjectCheck{error, std::move(message)};
    }

    bool structurallyValid(const Polygon& polygon) {
        return polygon.vertices.size() >= kMinPolygonVertices && hasFiniteVertices(polygon);
    }
} // namespace

ProjectCheck checkProjectStructure(const MallProject& project) {
    if (validateSettings(project.settings) != MallError::Ok) {
        return fail(MallError::InvalidArgument, "settings out of range");
    }
    if (!structurallyValid(project.outline)) {
        return fail(MallError::InvalidPolygon, "mall outline needs at least 3 finite vertices");
    }

    std::unordered_set<std::string> floorIds;
    std::unordered_set<int> levels;
    std::unordered_set<std::string> areaIds;

    for (const auto& floor : project.floors) {
        if (floor.id.empty()) return fail(MallError::InvalidArgument, "floor with empty id");
        if (!floorIds.insert(floor.id).second) {
            return fail(MallError::DuplicateId, "duplicate floor id '" + floor.id + "'");
        }
        if (!levels.insert(floor.level).second) {
            return fail(MallError::DuplicateLevel, "duplicate floor level " + std::to_string(floor.level));
        }
        if (!(floor.height > 0.0) || !std::isfinite(floor.height)) {
            return fail(MallError::InvalidArgument, "floor '" + floor.id + "' height must be positive");
        }
        if (floor.shape && !structurallyValid(*floor.shape)) {
            return fail(MallError::InvalidPolygon, "floor '" + floor.id + "' shape needs at least 3 finite vertices");
        }
        for (const auto& area : floor.areas) {
            if (area.id.empty()) return fail(MallError::InvalidArgument, "area with empty id");
            if (!areaIds.insert(area.id).second) {
                return fail(MallError::DuplicateId, "duplicate area id '" + area.id + "'");
            }
            if (!structurallyValid(area.shape)) {
                return fail(MallError::InvalidPolygon, "area '" + area.id + "' shape needs at least 3 finite vertices");
            }
        }
    }

    std::unordered_set<std::string> connectedAreas;
    for (const auto& connection : project.connections) {
        if (!connectedAreas.insert(connection.areaId).second) {
            return fail(MallError::DuplicateId, "area '" + connection.areaId + "' has more than one connection");
        }
        const ConnectionValidation check = validateVerticalConnection(project, connection);
        if (check.error == MallError::NotFound) {
            return fail(MallError::NotFound, "connection references unknown area '" + connection.areaId + "'");
        }
        if (check.rule == ConnectionRule::UnknownFloor) {
            return fail(MallError::NotFound, "connection of '" + connection.areaId + "' references an unknown floor");
        }
        if (!check.ok()) {
            return fail(check.error, "connection of '" + connection.areaId + "': " + connectionRuleMessage(check.rule));
        }
    }
    return {};
}

} // namespace mall
