#pragma once

/**
 * @file constants.h
 * @brief Tolerances and model defaults shared by the geometry and model layers.
 *
 * Frontend defaults (grid size, floor height, history depth) mirror these values.
 */

#include <cstddef>

namespace mall {

// =============================================================================
// Geometry Tolerances (world units, meters)
// =============================================================================

/// Distance under which a point counts as lying on a segment
constexpr double kOnEdgeTolerance = 1e-6;

/// Cross products with magnitude below this are treated as collinear
constexpr double kOrientationEpsilon = 1e-9;

/// Polygons smaller than this are accepted but reported with a warning
constexpr double kMinPolygonArea = 1e-4;

/// Minimum vertex count of a closed polygon
constexpr std::size_t kMinPolygonVertices = 3;

// =============================================================================
// Model Defaults
// =============================================================================

constexpr double kDefaultGridSize = 1.0;
constexpr double kDefaultFloorHeight = 4.0;
constexpr double kDefaultOutlineHalfExtent = 50.0;

/// Undo/redo depth
constexpr std::size_t kDefaultHistoryLength = 50;

/// A polygon draft closes when the pointer comes back within
/// (factor * gridSize) of its first point
constexpr double kCloseDistanceGridFactor = 2.0;

// =============================================================================
// Persistence
// =============================================================================

constexpr const char* kProjectFormatVersion = "1.0.0";
constexpr int kProjectFormatMajor = 1;

} // namespace mall
