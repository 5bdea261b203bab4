#pragma once

#include "mall/model/mall_project.h"

#include <string>

namespace mall {

struct ProjectCheck {
    MallError error{MallError::Ok};
    std::string message;

    bool ok() const noexcept { return error == MallError::Ok; }
};

// Structural validation of a whole project, used before a project replaces
// the model state (load, import):
//   - settings in range, floor heights > 0
//   - every polygon has >= 3 finite vertices
//   - floor ids, area ids and floor levels unique, ids non-empty
//   - connections reference existing circulation areas and floors and obey
//     their type rules, at most one connection per area
// Containment is not checked here; it stays advisory.
ProjectCheck checkProjectStructure(const MallProject& project);

} // namespace mall
