#include "mall/model/spatial_model.h"
#include "mall/core/logging.h"
#include "mall/core/util.h"
#include "mall/geometry/overlap_detector.h"
#include "mall/geometry/polygon_containment.h"
#include "mall/geometry/polygon_metrics.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <utility>

namespace mall {

std::vector<std::string> OutlineResult::violatingIds() const {
    std::vector<std::string> ids;
    ids.reserve(violations.size());
    for (const auto& v : violations) ids.push_back(v.entityId);
    return ids;
}

void refreshAreaProperties(AreaDefinition& area) {
    area.properties.area = polygonArea(area.shape);
    area.properties.perimeter = polygonPerimeter(area.shape);
}

SpatialModel::SpatialModel(std::size_t historyLimit)
    : project_(createEmptyProject("mall", "Untitled Mall")),
      history_(historyLimit) {}

ProjectCheck SpatialModel::loadProject(MallProject project) {
    ProjectCheck check = checkProjectStructure(project);
    if (!check.ok()) {
        MALL_LOG_WARN("loadProject rejected: %s", check.message.c_str());
        return check;
    }
    project_ = std::move(project);
    history_.clear();
    batchBase_.reset();
    return check;
}

// =============================================================================
// Lookup helpers
// =============================================================================

std::optional<std::size_t> SpatialModel::floorIndex(const std::string& floorId) const {
    for (std::size_t i = 0; i < project_.floors.size(); ++i) {
        if (project_.floors[i].id == floorId) return i;
    }
    return std::nullopt;
}

std::optional<SpatialModel::AreaLocation> SpatialModel::locateArea(const std::string& areaId) const {
    for (std::size_t f = 0; f < project_.floors.size(); ++f) {
        const auto& areas = project_.floors[f].areas;
        for (std::size_t a = 0; a < areas.size(); ++a) {
            if (areas[a].id == areaId) return AreaLocation{f, a};
        }
    }
    return std::nullopt;
}

const AreaDefinition* SpatialModel::findOverlap(
    const FloorDefinition& floor, const Polygon& shape, const std::string& skipId) const {
    for (const auto& other : floor.areas) {
        if (other.id == skipId) continue;
        if (doOverlap(shape, other.shape)) return &other;
    }
    return nullptr;
}

const FloorDefinition* SpatialModel::findFloor(const std::string& floorId) const {
    const auto idx = floorIndex(floorId);
    return idx ? &project_.floors[*idx] : nullptr;
}

const AreaDefinition* SpatialModel::findArea(const std::string& areaId) const {
    const auto loc = locateArea(areaId);
    return loc ? &project_.floors[loc->floor].areas[loc->area] : nullptr;
}

const FloorDefinition* SpatialModel::floorOfArea(const std::string& areaId) const {
    const auto loc = locateArea(areaId);
    return loc ? &project_.floors[loc->floor] : nullptr;
}

const Polygon& SpatialModel::effectiveShape(const FloorDefinition& floor) const {
    return mall::effectiveShape(project_, floor);
}

const VerticalConnection* SpatialModel::connectionForArea(const std::string& areaId) const {
    return mall::connectionForArea(project_, areaId);
}

std::vector<const VerticalConnection*> SpatialModel::connectionsForFloor(const std::string& floorId) const {
    return mall::connectionsForFloor(project_, floorId);
}

std::vector<ContainmentViolation> SpatialModel::collectContainmentViolations() const {
    std::vector<ContainmentViolation> out;
    for (const auto& floor : project_.floors) {
        if (floor.shape && !isContainedIn(*floor.shape, project_.outline)) {
            out.push_back({ContainmentViolation::Kind::FloorOutsideOutline, floor.id, floor.id});
        }
    }
    for (const auto& floor : project_.floors) {
        const Polygon& shape = effectiveShape(floor);
        for (const auto& area : floor.areas) {
            if (!isContainedIn(area.shape, shape)) {
                out.push_back({ContainmentViolation::Kind::AreaOutsideFloor, area.id, floor.id});
            }
        }
    }
    return out;
}

// =============================================================================
// Mutations
// =============================================================================

void SpatialModel::commit(const char* label, MallProject&& next) {
    next.revision = project_.revision + 1;
    next.updatedAtMs = std::max(nowEpochMs(), project_.updatedAtMs);
    if (history_.beginEntry(label, project_)) {
        history_.commitEntry(next);
    }
    project_ = std::move(next);
}

OutlineResult SpatialModel::setOutline(const Polygon& outline) {
    OutlineResult result{};
    const PolygonValidation check = validatePolygon(outline);
    if (!check.ok()) {
        result.error = check.error;
        result.polygonIssue = check.issue;
        MALL_LOG_WARN("setOutline rejected: %s", polygonIssueName(check.issue));
        return result;
    }

    MallProject next = project_;
    next.outline = outline;
    commit("Set outline", std::move(next));

    result.violations = collectContainmentViolations();
    if (!result.violations.empty()) {
        MALL_LOG_WARN("setOutline: %zu entities no longer contained", result.violations.size());
    }
    return result;
}

MallError SpatialModel::setSettings(const ProjectSettings& settings) {
    const MallError err = validateSettings(settings);
    if (err != MallError::Ok) return err;
    if (settings == project_.settings) return MallError::Ok;

    MallProject next = project_;
    next.settings = settings;
    commit("Change settings", std::move(next));
    return MallError::Ok;
}

FloorResult SpatialModel::addFloor(const FloorDefinition& def) {
    FloorResult result{};
    if (def.id.empty() || !(def.height > 0.0) || !std::isfinite(def.height)) {
        result.error = MallError::InvalidArgument;
        return result;
    }
    if (floorIndex(def.id)) {
        result.error = MallError::DuplicateId;
        return result;
    }
    for (const auto& floor : project_.floors) {
        if (floor.level == def.level) {
            result.error = MallError::DuplicateLevel;
            return result;
        }
    }
    if (def.shape) {
        const PolygonValidation check = validatePolygon(*def.shape);
        if (!check.ok()) {
            result.error = check.error;
            result.polygonIssue = check.issue;
            return result;
        }
    }

    FloorDefinition floor = def;
    floor.areas.clear();
    std::unordered_set<std::string> seen;
    for (const auto& candidate : def.areas) {
        if (candidate.id.empty()) {
            result.error = MallError::InvalidArgument;
            return result;
        }
        if (!seen.insert(candidate.id).second || locateArea(candidate.id)) {
            result.error = MallError::DuplicateId;
            return result;
        }
        const PolygonValidation check = validatePolygon(candidate.shape);
        if (!check.ok()) {
            result.error = check.error;
            result.polygonIssue = check.issue;
            return result;
        }
        if (const AreaDefinition* hit = findOverlap(floor, candidate.shape, std::string{})) {
            result.error = MallError::Overlap;
            result.overlap = OverlapPair{candidate.id, hit->id};
            MALL_LOG_WARN("addFloor rejected: areas '%s' and '%s' overlap", candidate.id.c_str(), hit->id.c_str());
            return result;
        }
        AreaDefinition area = candidate;
        refreshAreaProperties(area);
        floor.areas.push_back(std::move(area));
    }

    const Polygon& shape = mall::effectiveShape(project_, floor);
    result.contained = !floor.shape || isContainedIn(*floor.shape, project_.outline);
    if (!result.contained) {
        MALL_LOG_WARN("floor '%s' extends beyond the mall outline", floor.id.c_str());
    }
    for (const auto& area : floor.areas) {
        if (!isContainedIn(area.shape, shape)) {
            result.violations.push_back({ContainmentViolation::Kind::AreaOutsideFloor, area.id, floor.id});
        }
    }

    MallProject next = project_;
    next.floors.push_back(floor);
    commit("Add floor", std::move(next));
    result.floor = std::move(floor);
    return result;
}

RemoveFloorResult SpatialModel::removeFloor(const std::string& floorId) {
    RemoveFloorResult result{};
    const auto idx = floorIndex(floorId);
    if (!idx) {
        result.error = MallError::NotFound;
        return result;
    }
    if (project_.floors.size() <= 1) {
        result.error = MallError::LastFloor;
        return result;
    }

    MallProject next = project_;
    std::unordered_set<std::string> removedAreas;
    for (const auto& area : next.floors[*idx].areas) removedAreas.insert(area.id);
    next.floors.erase(next.floors.begin() + static_cast<std::ptrdiff_t>(*idx));

    std::vector<VerticalConnection> kept;
    kept.reserve(next.connections.size());
    for (auto& connection : next.connections) {
        if (removedAreas.count(connection.areaId)) {
            result.droppedConnections.push_back(connection.areaId);
            continue;
        }
        auto& ids = connection.floorIds;
        const auto before = ids.size();
        ids.erase(std::remove(ids.begin(), ids.end(), floorId), ids.end());
        if (ids.size() != before) {
            const ConnectionValidation check = validateVerticalConnection(next, connection);
            if (!check.ok()) {
                MALL_LOG_WARN("removeFloor: dropping connection of '%s' (%s)",
                    connection.areaId.c_str(), connectionRuleName(check.rule));
                result.droppedConnections.push_back(connection.areaId);
                continue;
            }
        }
        kept.push_back(std::move(connection));
    }
    next.connections = std::move(kept);

    commit("Remove floor", std::move(next));
    return result;
}

FloorResult SpatialModel::setFloorShape(const std::string& floorId, const std::optional<Polygon>& shape) {
    FloorResult result{};
    const auto idx = floorIndex(floorId);
    if (!idx) {
        result.error = MallError::NotFound;
        return result;
    }
    if (shape) {
        const PolygonValidation check = validatePolygon(*shape);
        if (!check.ok()) {
            result.error = check.error;
            result.polygonIssue = check.issue;
            return result;
        }
    }

    MallProject next = project_;
    FloorDefinition& floor = next.floors[*idx];
    floor.shape = shape;

    result.contained = !shape || isContainedIn(*shape, next.outline);
    if (!result.contained) {
        MALL_LOG_WARN("floor '%s' extends beyond the mall outline", floorId.c_str());
    }
    const Polygon& effective = mall::effectiveShape(next, floor);
    for (const auto& area : floor.areas) {
        if (!isContainedIn(area.shape, effective)) {
            result.violations.push_back({ContainmentViolation::Kind::AreaOutsideFloor, area.id, floor.id});
        }
    }
    result.floor = floor;

    commit("Set floor shape", std::move(next));
    return result;
}

AreaResult SpatialModel::addArea(const std::string& floorId, const AreaDefinition& def) {
    AreaResult result{};
    const auto idx = floorIndex(floorId);
    if (!idx) {
        result.error = MallError::NotFound;
        return result;
    }
    if (def.id.empty()) {
        result.error = MallError::InvalidArgument;
        return result;
    }
    if (locateArea(def.id)) {
        result.error = MallError::DuplicateId;
        return result;
    }

    const PolygonValidation check = validatePolygon(def.shape);
    if (!check.ok()) {
        result.error = check.error;
        result.polygonIssue = check.issue;
        MALL_LOG_WARN("addArea '%s' rejected: %s", def.id.c_str(), polygonIssueName(check.issue));
        return result;
    }
    result.smallArea = check.smallArea;

    const FloorDefinition& floor = project_.floors[*idx];
    if (const AreaDefinition* hit = findOverlap(floor, def.shape, def.id)) {
        result.error = MallError::Overlap;
        result.overlap = OverlapPair{def.id, hit->id};
        MALL_LOG_WARN("addArea rejected: '%s' overlaps '%s'", def.id.c_str(), hit->id.c_str());
        return result;
    }

    result.contained = isContainedIn(def.shape, effectiveShape(floor));
    if (!result.contained) {
        MALL_LOG_WARN("area '%s' extends beyond floor '%s'", def.id.c_str(), floorId.c_str());
    }

    AreaDefinition area = def;
    if (area.color.empty()) area.color = areaTypeColor(area.type);
    refreshAreaProperties(area);

    MallProject next = project_;
    next.floors[*idx].areas.push_back(area);
    commit("Add area", std::move(next));
    result.area = std::move(area);
    return result;
}

AreaResult SpatialModel::updateAreaShape(const std::string& areaId, const Polygon& shape) {
    AreaResult result{};
    const auto loc = locateArea(areaId);
    if (!loc) {
        result.error = MallError::NotFound;
        return result;
    }

    const PolygonValidation check = validatePolygon(shape);
    if (!check.ok()) {
        result.error = check.error;
        result.polygonIssue = check.issue;
        MALL_LOG_WARN("updateAreaShape '%s' rejected: %s", areaId.c_str(), polygonIssueName(check.issue));
        return result;
    }
    result.smallArea = check.smallArea;

    const FloorDefinition& floor = project_.floors[loc->floor];
    if (const AreaDefinition* hit = findOverlap(floor, shape, areaId)) {
        result.error = MallError::Overlap;
        result.overlap = OverlapPair{areaId, hit->id};
        MALL_LOG_WARN("updateAreaShape rejected: '%s' overlaps '%s'", areaId.c_str(), hit->id.c_str());
        return result;
    }

    result.contained = isContainedIn(shape, effectiveShape(floor));
    if (!result.contained) {
        MALL_LOG_WARN("area '%s' extends beyond floor '%s'", areaId.c_str(), floor.id.c_str());
    }

    MallProject next = project_;
    AreaDefinition& area = next.floors[loc->floor].areas[loc->area];
    area.shape = shape;
    refreshAreaProperties(area);
    result.area = area;

    commit("Edit area shape", std::move(next));
    return result;
}

MallError SpatialModel::removeArea(const std::string& areaId) {
    const auto loc = locateArea(areaId);
    if (!loc) return MallError::NotFound;

    MallProject next = project_;
    auto& areas = next.floors[loc->floor].areas;
    areas.erase(areas.begin() + static_cast<std::ptrdiff_t>(loc->area));
    auto& connections = next.connections;
    connections.erase(
        std::remove_if(connections.begin(), connections.end(),
            [&](const VerticalConnection& c) { return c.areaId == areaId; }),
        connections.end());

    commit("Remove area", std::move(next));
    return MallError::Ok;
}

ConnectionResult SpatialModel::setVerticalConnection(
    const std::string& areaId, const std::vector<std::string>& floorIds) {
    ConnectionResult result{};
    const AreaDefinition* area = findArea(areaId);
    if (!area) {
        result.error = MallError::NotFound;
        return result;
    }

    VerticalConnection connection{};
    connection.areaId = areaId;
    connection.floorIds = floorIds;
    if (!connectionTypeForArea(area->type, connection.type)) {
        result.error = MallError::ConnectionRuleViolation;
        result.rule = ConnectionRule::NotCirculationArea;
        MALL_LOG_WARN("connection rejected: '%s' is a %s area", areaId.c_str(), areaTypeName(area->type));
        return result;
    }

    const ConnectionValidation check = validateVerticalConnection(project_, connection);
    if (!check.ok()) {
        result.error = check.error;
        result.rule = check.rule;
        MALL_LOG_WARN("connection of '%s' rejected: %s", areaId.c_str(), connectionRuleMessage(check.rule));
        return result;
    }

    MallProject next = project_;
    auto it = std::find_if(next.connections.begin(), next.connections.end(),
        [&](const VerticalConnection& c) { return c.areaId == areaId; });
    if (it != next.connections.end()) {
        *it = connection;
    } else {
        next.connections.push_back(connection);
    }
    commit("Set vertical connection", std::move(next));
    result.connection = std::move(connection);
    return result;
}

MallError SpatialModel::removeVerticalConnection(const std::string& areaId) {
    auto it = std::find_if(project_.connections.begin(), project_.connections.end(),
        [&](const VerticalConnection& c) { return c.areaId == areaId; });
    if (it == project_.connections.end()) return MallError::NotFound;

    MallProject next = project_;
    next.connections.erase(next.connections.begin() + (it - project_.connections.begin()));
    commit("Remove vertical connection", std::move(next));
    return MallError::Ok;
}

// =============================================================================
// History
// =============================================================================

bool SpatialModel::undo() {
    if (batchBase_) return false;
    return history_.undo(project_);
}

bool SpatialModel::redo() {
    if (batchBase_) return false;
    return history_.redo(project_);
}

// commit() records nothing while the batch transaction is open, so the whole
// batch lands as a single before/after entry.
bool SpatialModel::beginBatch(const char* label) {
    if (batchBase_) return false;
    if (!history_.beginEntry(label, project_)) return false;
    batchBase_ = project_;
    return true;
}

void SpatialModel::commitBatch() {
    if (!batchBase_) return;
    batchBase_.reset();
    if (!history_.commitEntry(project_)) {
        MALL_LOG_DEBUG("batch made no changes; nothing recorded");
    }
}

void SpatialModel::rollbackBatch() {
    if (!batchBase_) return;
    project_ = std::move(*batchBase_);
    batchBase_.reset();
    history_.discardEntry();
}

} // namespace mall
