#pragma once

#include "mall/model/mall_project.h"

#include <string>

namespace mall {

// A single entry in the undo/redo stack. Whole-project snapshots: projects are
// small (tens of polygons) and a snapshot pair keeps undo exact.
struct HistoryEntry {
    std::string label;
    MallProject before;
    MallProject after;
};

struct HistoryTransaction {
    bool active = false;
    HistoryEntry entry;
};

} // namespace mall
