#pragma once

#include "mall/core/constants.h"
#include "mall/core/types.h"
#include "mall/geometry/polygon_validation.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace mall {

enum class DrawingMode : std::uint8_t { Rectangle = 0, Polygon = 1 };

// Idle -> CollectingPoints -> Previewing -> Committed | Cancelled
enum class DrawingState : std::uint8_t {
    Idle = 0,
    CollectingPoints = 1,
    Previewing = 2,
    Committed = 3,
    Cancelled = 4,
};

struct DrawingConfig {
    double gridSize = kDefaultGridSize;
    bool snapToGrid = true;
    double minArea = kMinPolygonArea;
    double closeDistanceFactor = kCloseDistanceGridFactor;
};

struct DrawingResult {
    MallError error{MallError::Ok};
    PolygonIssue issue{PolygonIssue::None};
    Polygon polygon;

    bool ok() const noexcept { return error == MallError::Ok; }
};

const char* drawingStateName(DrawingState state) noexcept;

// Builds one candidate polygon from pointer input. The session never touches
// the model: the committed polygon is handed to SpatialModel by the caller.
class DrawingSession {
public:
    // Throws std::invalid_argument when config.gridSize is not positive.
    explicit DrawingSession(DrawingMode mode, const DrawingConfig& config = DrawingConfig{});

    DrawingMode mode() const noexcept { return mode_; }
    DrawingState state() const noexcept { return state_; }
    const DrawingConfig& config() const noexcept { return config_; }
    const std::vector<Point2D>& points() const noexcept { return points_; }
    const std::optional<Point2D>& preview() const noexcept { return preview_; }
    bool isActive() const noexcept {
        return state_ == DrawingState::CollectingPoints || state_ == DrawingState::Previewing;
    }

    // Starts a new shape from Idle, Committed or Cancelled.
    MallError begin(const Point2D& point);

    // Rectangle mode completes on the second corner; polygon mode completes
    // when the point lands within closeDistanceFactor * gridSize of the first
    // point with at least three points collected. A completion that fails
    // validation keeps the session active and returns the failure.
    MallError addPoint(const Point2D& point);

    MallError updatePreview(const Point2D& point);

    // Drops the last collected point; the session goes Idle when none remain.
    bool undoPoint();

    // Collected points plus the preview point, open. Rectangle mode yields the
    // rectangle spanned by the first point and the preview.
    Polygon currentPolygon() const;

    bool canComplete() const;
    DrawingResult complete();
    const DrawingResult& result() const noexcept { return result_; }

    void cancel();
    void reset();

private:
    Point2D snap(const Point2D& point) const;
    Polygon candidate() const;

    DrawingMode mode_;
    DrawingConfig config_;
    DrawingState state_ = DrawingState::Idle;
    std::vector<Point2D> points_;
    std::optional<Point2D> preview_;
    DrawingResult result_;
};

} // namespace mall
