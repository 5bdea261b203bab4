#include "mall/interaction/drawing_session.h"
#include "mall/core/logging.h"
#include "mall/geometry/grid_snapper.h"
#include "mall/geometry/polygon_metrics.h"
#include "mall/geometry/shapes.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace mall {

namespace {
    Polygon spanRectangle(const Point2D& a, const Point2D& b) {
        const double x0 = std::min(a.x, b.x);
        const double y0 = std::min(a.y, b.y);
        return rectangleToPolygon(x0, y0, std::abs(b.x - a.x), std::abs(b.y - a.y));
    }
} // namespace

const char* drawingStateName(DrawingState state) noexcept {
    switch (state) {
        case DrawingState::Idle: return "Idle";
        case DrawingState::CollectingPoints: return "CollectingPoints";
        case DrawingState::Previewing: return "Previewing";
        case DrawingState::Committed: return "Committed";
        case DrawingState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

DrawingSession::DrawingSession(DrawingMode mode, const DrawingConfig& config)
    : mode_(mode), config_(config) {
    if (!(config_.gridSize > 0.0) || !std::isfinite(config_.gridSize)) {
        throw std::invalid_argument("DrawingSession: gridSize must be positive");
    }
}

Point2D DrawingSession::snap(const Point2D& point) const {
    return config_.snapToGrid ? snapToGrid(point, config_.gridSize) : point;
}

MallError DrawingSession::begin(const Point2D& point) {
    if (isActive()) return MallError::InvalidState;
    points_.clear();
    preview_.reset();
    result_ = DrawingResult{};
    points_.push_back(snap(point));
    state_ = DrawingState::CollectingPoints;
    return MallError::Ok;
}

MallError DrawingSession::addPoint(const Point2D& point) {
    if (!isActive()) return MallError::InvalidState;
    const Point2D p = snap(point);

    if (mode_ == DrawingMode::Rectangle) {
        preview_ = p;
        const DrawingResult r = complete();
        return r.error;
    }

    const double closeDistance = config_.closeDistanceFactor * config_.gridSize;
    if (points_.size() >= kMinPolygonVertices && distance(p, points_.front()) <= closeDistance) {
        preview_.reset();
        const DrawingResult r = complete();
        return r.error;
    }

    // A repeated click on the last point adds nothing.
    if (!points_.empty() && points_.back() == p) return MallError::Ok;
    points_.push_back(p);
    state_ = DrawingState::CollectingPoints;
    preview_.reset();
    return MallError::Ok;
}

MallError DrawingSession::updatePreview(const Point2D& point) {
    if (!isActive()) return MallError::InvalidState;
    preview_ = snap(point);
    state_ = DrawingState::Previewing;
    return MallError::Ok;
}

bool DrawingSession::undoPoint() {
    if (!isActive() || points_.empty()) return false;
    points_.pop_back();
    preview_.reset();
    state_ = points_.empty() ? DrawingState::Idle : DrawingState::CollectingPoints;
    return true;
}

Polygon DrawingSession::currentPolygon() const {
    if (mode_ == DrawingMode::Rectangle) {
        if (points_.empty() || !preview_) return Polygon{points_, false};
        return spanRectangle(points_.front(), *preview_);
    }
    Polygon out{points_, false};
    if (preview_ && (points_.empty() || points_.back() != *preview_)) {
        out.vertices.push_back(*preview_);
    }
    return out;
}

Polygon DrawingSession::candidate() const {
    if (mode_ == DrawingMode::Rectangle) {
        if (points_.empty() || !preview_) return Polygon{};
        return spanRectangle(points_.front(), *preview_);
    }
    return Polygon{points_, true};
}

bool DrawingSession::canComplete() const {
    if (!isActive()) return false;
    if (mode_ == DrawingMode::Rectangle) {
        return !points_.empty() && preview_ &&
               points_.front().x != preview_->x && points_.front().y != preview_->y;
    }
    return points_.size() >= kMinPolygonVertices;
}

DrawingResult DrawingSession::complete() {
    DrawingResult r{};
    if (!isActive()) {
        r.error = MallError::InvalidState;
        return r;
    }

    r.polygon = candidate();
    const PolygonValidation check = validatePolygon(r.polygon);
    if (!check.ok()) {
        r.error = check.error;
        r.issue = check.issue;
        MALL_LOG_DEBUG("drawing: candidate rejected (%s)", polygonIssueName(check.issue));
        return r;
    }
    if (polygonArea(r.polygon) < config_.minArea) {
        r.error = MallError::InvalidPolygon;
        r.issue = PolygonIssue::ZeroArea;
        MALL_LOG_DEBUG("drawing: candidate below minimum area");
        return r;
    }

    state_ = DrawingState::Committed;
    preview_.reset();
    result_ = r;
    return r;
}

void DrawingSession::cancel() {
    if (!isActive()) return;
    points_.clear();
    preview_.reset();
    state_ = DrawingState::Cancelled;
}

void DrawingSession::reset() {
    points_.clear();
    preview_.reset();
    result_ = DrawingResult{};
    state_ = DrawingState::Idle;
}

} // namespace mall
