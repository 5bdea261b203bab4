#ifndef MALLCAD_MALL_PROJECT_CODEC_H
#define MALLCAD_MALL_PROJECT_CODEC_H

#include "mall/model/mall_project.h"

#include <string>

namespace mall {

struct ImportResult {
    MallError error{MallError::Ok};
    std::string message; // first problem found, empty on success
    MallProject project; // default-constructed unless ok()

    bool ok() const noexcept { return error == MallError::Ok; }
};

// Deterministic JSON document (sorted keys, two-space indent) with a
// top-level "version". import(export(p)) == p for any valid project.
std::string exportProject(const MallProject& project);

// Parses and structurally validates a document. Never returns a partially
// populated project: any violation yields an error and an empty project.
//   InvalidDocument     malformed JSON, missing field, wrong type, unknown enum
//   UnsupportedVersion  major version other than the current one
//   InvalidPolygon, DuplicateId, DuplicateLevel, NotFound, InvalidArgument,
//   ConnectionRuleViolation as reported by checkProjectStructure
ImportResult importProject(const std::string& text);

// "1.2.3" -> 1. Returns -1 when the string does not start with a number.
int parseMajorVersion(const std::string& version);

} // namespace mall

#endif // MALLCAD_MALL_PROJECT_CODEC_H
