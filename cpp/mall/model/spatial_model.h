#ifndef MALLCAD_MALL_SPATIAL_MODEL_H
#define MALLCAD_MALL_SPATIAL_MODEL_H

#include "mall/model/mall_project.h"
#include "mall/model/project_check.h"
#include "mall/model/vertical_connection.h"
#include "mall/geometry/polygon_validation.h"
#include "mall/history/history_manager.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mall {

struct ContainmentViolation {
    enum class Kind : std::uint8_t {
        FloorOutsideOutline = 0,
        AreaOutsideFloor = 1,
    };

    Kind kind{Kind::AreaOutsideFloor};
    std::string entityId;
    std::string floorId; // owning floor for areas, the floor itself otherwise
};

// Both ids of a blocking overlap: the candidate and the committed area it hits.
struct OverlapPair {
    std::string areaId;
    std::string otherAreaId;

    bool empty() const noexcept { return areaId.empty() && otherAreaId.empty(); }
};

struct AreaResult {
    MallError error{MallError::Ok};
    PolygonIssue polygonIssue{PolygonIssue::None};
    OverlapPair overlap;
    bool contained{true};  // advisory
    bool smallArea{false}; // advisory
    AreaDefinition area;

    bool ok() const noexcept { return error == MallError::Ok; }
};

struct FloorResult {
    MallError error{MallError::Ok};
    PolygonIssue polygonIssue{PolygonIssue::None};
    OverlapPair overlap;
    bool contained{true}; // floor inside the outline, advisory
    std::vector<ContainmentViolation> violations; // areas outside the floor
    FloorDefinition floor;

    bool ok() const noexcept { return error == MallError::Ok; }
};

struct OutlineResult {
    MallError error{MallError::Ok};
    PolygonIssue polygonIssue{PolygonIssue::None};
    std::vector<ContainmentViolation> violations;

    bool ok() const noexcept { return error == MallError::Ok; }
    std::vector<std::string> violatingIds() const;
};

struct RemoveFloorResult {
    MallError error{MallError::Ok};
    // Area ids of every connection deleted: those owned by areas on the floor
    // and those left breaking their rule once the floor is gone.
    std::vector<std::string> droppedConnections;

    bool ok() const noexcept { return error == MallError::Ok; }
};

struct ConnectionResult {
    MallError error{MallError::Ok};
    ConnectionRule rule{ConnectionRule::None};
    VerticalConnection connection;

    bool ok() const noexcept { return error == MallError::Ok; }
};

// Single mutable owner of the MallProject tree. Every mutation validates
// first and writes once; a rejected call leaves the project untouched.
// Not thread-safe: callers serialize access.
class SpatialModel {
public:
    explicit SpatialModel(std::size_t historyLimit = kDefaultHistoryLength);

    const MallProject& project() const noexcept { return project_; }

    // Structural validation, then replace. Clears history and closes any
    // open batch without restoring it.
    ProjectCheck loadProject(MallProject project);

    // ---------------------------------------------------------------------
    // Mutations
    // ---------------------------------------------------------------------

    // Commits any simple polygon; returns floors/areas no longer contained.
    OutlineResult setOutline(const Polygon& outline);
    MallError setSettings(const ProjectSettings& settings);

    FloorResult addFloor(const FloorDefinition& def);
    RemoveFloorResult removeFloor(const std::string& floorId);
    // std::nullopt reverts the floor to the outline.
    FloorResult setFloorShape(const std::string& floorId, const std::optional<Polygon>& shape);

    // Overlap with another area on the floor blocks; leaving the floor only flags.
    AreaResult addArea(const std::string& floorId, const AreaDefinition& def);
    AreaResult updateAreaShape(const std::string& areaId, const Polygon& shape);
    MallError removeArea(const std::string& areaId);

    // Creates or replaces the connection owned by areaId. The type follows
    // the area type.
    ConnectionResult setVerticalConnection(const std::string& areaId, const std::vector<std::string>& floorIds);
    MallError removeVerticalConnection(const std::string& areaId);

    // ---------------------------------------------------------------------
    // Queries
    // ---------------------------------------------------------------------

    const FloorDefinition* findFloor(const std::string& floorId) const;
    const AreaDefinition* findArea(const std::string& areaId) const;
    const FloorDefinition* floorOfArea(const std::string& areaId) const;
    const Polygon& effectiveShape(const FloorDefinition& floor) const;
    const VerticalConnection* connectionForArea(const std::string& areaId) const;
    std::vector<const VerticalConnection*> connectionsForFloor(const std::string& floorId) const;

    // Floors outside the outline, then areas outside their floor, in tree order.
    std::vector<ContainmentViolation> collectContainmentViolations() const;

    // ---------------------------------------------------------------------
    // History
    // ---------------------------------------------------------------------

    bool canUndo() const noexcept { return history_.canUndo(); }
    bool canRedo() const noexcept { return history_.canRedo(); }
    // Both return false while a batch is open.
    bool undo();
    bool redo();
    const HistoryManager& history() const noexcept { return history_; }

    // Groups the mutations made until commitBatch into one undo step.
    // rollbackBatch restores the project captured by beginBatch and records
    // nothing. Returns false when a batch is already open.
    bool beginBatch(const char* label);
    void commitBatch();
    void rollbackBatch();
    bool inBatch() const noexcept { return batchBase_.has_value(); }

private:
    struct AreaLocation {
        std::size_t floor;
        std::size_t area;
    };

    std::optional<std::size_t> floorIndex(const std::string& floorId) const;
    std::optional<AreaLocation> locateArea(const std::string& areaId) const;

    // First area on floor (other than skipId) whose shape overlaps shape.
    const AreaDefinition* findOverlap(const FloorDefinition& floor, const Polygon& shape, const std::string& skipId) const;

    // Bumps revision and updatedAt, records history, replaces the project.
    void commit(const char* label, MallProject&& next);

    MallProject project_;
    HistoryManager history_;
    std::optional<MallProject> batchBase_;
};

// Recomputes area.properties.area and .perimeter from area.shape.
void refreshAreaProperties(AreaDefinition& area);

} // namespace mall

#endif // MALLCAD_MALL_SPATIAL_MODEL_H
