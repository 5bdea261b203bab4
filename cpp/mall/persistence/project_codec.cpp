#include "mall/persistence/project_codec.h"
#include "mall/core/constants.h"
#include "mall/core/logging.h"
#include "mall/model/project_check.h"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace mall {

namespace {

// Raised while decoding; importProject turns it into an ImportResult.
class DocumentError : public std::runtime_error {
public:
    DocumentError(MallError code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    MallError code() const noexcept { return code_; }

private:
    MallError code_;
};

[[noreturn]] void malformed(const std::string& what) {
    throw DocumentError(MallError::InvalidDocument, what);
}

// =============================================================================
// Encode
// =============================================================================

json encodePolygon(const Polygon& polygon) {
    json vertices = json::array();
    for (const auto& v : polygon.vertices) {
        vertices.push_back(json{{"x", v.x}, {"y", v.y}});
    }
    return {{"vertices", std::move(vertices)}, {"isClosed", polygon.isClosed}};
}

json encodeArea(const AreaDefinition& area) {
    json j;
    j["id"] = area.id;
    j["name"] = area.name;
    j["type"] = areaTypeName(area.type);
    j["status"] = areaStatusName(area.status);
    j["shape"] = encodePolygon(area.shape);
    j["color"] = area.color;
    j["visible"] = area.visible;
    j["locked"] = area.locked;
    j["merchantId"] = area.merchantId;
    j["properties"] = {
        {"area", area.properties.area},
        {"perimeter", area.properties.perimeter},
        {"notes", area.properties.notes},
    };
    return j;
}

json encodeFloor(const FloorDefinition& floor) {
    json j;
    j["id"] = floor.id;
    j["name"] = floor.name;
    j["level"] = floor.level;
    j["height"] = floor.height;
    j["shape"] = floor.shape ? encodePolygon(*floor.shape) : json(nullptr);
    j["color"] = floor.color;
    j["visible"] = floor.visible;
    j["locked"] = floor.locked;
    json areas = json::array();
    for (const auto& area : floor.areas) areas.push_back(encodeArea(area));
    j["areas"] = std::move(areas);
    return j;
}

// =============================================================================
// Decode
// =============================================================================

const json& require(const json& obj, const char* key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end()) malformed(where + ": missing field '" + key + "'");
    return *it;
}

const json& requireObject(const json& obj, const char* key, const std::string& where) {
    const json& v = require(obj, key, where);
    if (!v.is_object()) malformed(where + "." + key + ": expected object");
    return v;
}

const json& requireArray(const json& obj, const char* key, const std::string& where) {
    const json& v = require(obj, key, where);
    if (!v.is_array()) malformed(where + "." + key + ": expected array");
    return v;
}

std::string requireString(const json& obj, const char* key, const std::string& where) {
    const json& v = require(obj, key, where);
    if (!v.is_string()) malformed(where + "." + key + ": expected string");
    return v.get<std::string>();
}

double requireNumber(const json& obj, const char* key, const std::string& where) {
    const json& v = require(obj, key, where);
    if (!v.is_number()) malformed(where + "." + key + ": expected number");
    return v.get<double>();
}

std::string optString(const json& obj, const char* key, const std::string& where, std::string fallback = {}) {
    auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    if (!it->is_string()) malformed(where + "." + key + ": expected string");
    return it->get<std::string>();
}

bool optBool(const json& obj, const char* key, const std::string& where, bool fallback) {
    auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    if (!it->is_boolean()) malformed(where + "." + key + ": expected boolean");
    return it->get<bool>();
}

double optNumber(const json& obj, const char* key, const std::string& where, double fallback) {
    auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    if (!it->is_number()) malformed(where + "." + key + ": expected number");
    return it->get<double>();
}

// nlohmann keeps non-negative integers as uint64; anything above INT64_MAX
// would wrap on get<int64_t>().
std::int64_t toInt64(const json& v, const std::string& what) {
    if (!v.is_number_integer()) malformed(what + ": expected integer");
    if (v.is_number_unsigned()
        && v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        malformed(what + ": out of range");
    }
    return v.get<std::int64_t>();
}

std::int64_t optInteger(const json& obj, const char* key, const std::string& where, std::int64_t fallback) {
    auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    return toInt64(*it, where + "." + key);
}

int requireInt(const json& obj, const char* key, const std::string& where) {
    const std::int64_t v = toInt64(require(obj, key, where), where + "." + key);
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        malformed(where + "." + key + ": out of range");
    }
    return static_cast<int>(v);
}

Polygon decodePolygon(const json& j, const std::string& where) {
    if (!j.is_object()) malformed(where + ": expected polygon object");
    const json& vertices = requireArray(j, "vertices", where);

    Polygon polygon{};
    polygon.isClosed = optBool(j, "isClosed", where, true);
    polygon.vertices.reserve(vertices.size());
    for (const auto& v : vertices) {
        if (!v.is_object()) malformed(where + ".vertices: expected point object");
        polygon.vertices.push_back({requireNumber(v, "x", where), requireNumber(v, "y", where)});
    }
    return polygon;
}

AreaDefinition decodeArea(const json& j, const std::string& where) {
    if (!j.is_object()) malformed(where + ": expected object");
    AreaDefinition area{};
    area.id = requireString(j, "id", where);
    const std::string at = where + "[" + area.id + "]";
    area.name = requireString(j, "name", at);

    const std::string type = requireString(j, "type", at);
    if (!parseAreaType(type, area.type)) malformed(at + ": unknown area type '" + type + "'");
    const std::string status = requireString(j, "status", at);
    if (!parseAreaStatus(status, area.status)) malformed(at + ": unknown area status '" + status + "'");

    area.shape = decodePolygon(require(j, "shape", at), at + ".shape");
    area.color = optString(j, "color", at);
    area.visible = optBool(j, "visible", at, true);
    area.locked = optBool(j, "locked", at, false);
    area.merchantId = optString(j, "merchantId", at);

    auto props = j.find("properties");
    if (props != j.end()) {
        if (!props->is_object()) malformed(at + ".properties: expected object");
        area.properties.area = optNumber(*props, "area", at + ".properties", 0.0);
        area.properties.perimeter = optNumber(*props, "perimeter", at + ".properties", 0.0);
        area.properties.notes = optString(*props, "notes", at + ".properties");
    }
    return area;
}

FloorDefinition decodeFloor(const json& j, const std::string& where) {
    if (!j.is_object()) malformed(where + ": expected object");
    FloorDefinition floor{};
    floor.id = requireString(j, "id", where);
    const std::string at = where + "[" + floor.id + "]";
    floor.name = requireString(j, "name", at);

    floor.level = requireInt(j, "level", at);
    floor.height = requireNumber(j, "height", at);

    const json& shape = require(j, "shape", at);
    if (!shape.is_null()) floor.shape = decodePolygon(shape, at + ".shape");

    floor.color = optString(j, "color", at);
    floor.visible = optBool(j, "visible", at, true);
    floor.locked = optBool(j, "locked", at, false);

    for (const auto& area : requireArray(j, "areas", at)) {
        floor.areas.push_back(decodeArea(area, at + ".areas"));
    }
    return floor;
}

VerticalConnection decodeConnection(const json& j, const std::string& where) {
    if (!j.is_object()) malformed(where + ": expected object");
    VerticalConnection connection{};
    connection.areaId = requireString(j, "areaId", where);
    const std::string type = requireString(j, "type", where);
    if (!parseConnectionType(type, connection.type)) malformed(where + ": unknown connection type '" + type + "'");
    for (const auto& id : requireArray(j, "floorIds", where)) {
        if (!id.is_string()) malformed(where + ".floorIds: expected string");
        connection.floorIds.push_back(id.get<std::string>());
    }
    return connection;
}

MallProject decodeProject(const json& doc) {
    if (!doc.is_object()) malformed("document: expected object");

    const json& version = require(doc, "version", "document");
    if (!version.is_string()) malformed("document.version: expected string");
    const int major = parseMajorVersion(version.get<std::string>());
    if (major < 0) malformed("document.version: not a version string");
    if (major != kProjectFormatMajor) {
        throw DocumentError(MallError::UnsupportedVersion,
            "unsupported document version " + version.get<std::string>());
    }

    const json& m = requireObject(doc, "mall", "document");
    MallProject project{};
    project.id = requireString(m, "id", "mall");
    project.name = requireString(m, "name", "mall");
    project.description = optString(m, "description", "mall");
    project.outline = decodePolygon(require(m, "outline", "mall"), "mall.outline");

    project.settings.gridSize = requireNumber(m, "gridSize", "mall");
    const std::string unit = requireString(m, "unit", "mall");
    if (!parseLengthUnit(unit, project.settings.unit)) malformed("mall.unit: unknown unit '" + unit + "'");
    project.settings.snapToGrid = optBool(m, "snapToGrid", "mall", true);
    project.settings.defaultFloorHeight = optNumber(m, "defaultFloorHeight", "mall", kDefaultFloorHeight);

    project.createdAtMs = optInteger(m, "createdAt", "mall", 0);
    project.updatedAtMs = optInteger(m, "updatedAt", "mall", project.createdAtMs);
    const std::int64_t revision = optInteger(m, "revision", "mall", 1);
    if (revision < 0 || revision > static_cast<std::int64_t>(UINT32_MAX)) malformed("mall.revision: out of range");
    project.revision = static_cast<std::uint32_t>(revision);

    for (const auto& floor : requireArray(doc, "floors", "document")) {
        project.floors.push_back(decodeFloor(floor, "floors"));
    }

    auto connections = doc.find("connections");
    if (connections != doc.end()) {
        if (!connections->is_array()) malformed("document.connections: expected array");
        for (const auto& connection : *connections) {
            project.connections.push_back(decodeConnection(connection, "connections"));
        }
    }
    return project;
}

} // namespace

int parseMajorVersion(const std::string& version) {
    if (version.empty() || !std::isdigit(static_cast<unsigned char>(version[0]))) return -1;
    int major = 0;
    for (char c : version) {
        if (c == '.') break;
        if (!std::isdigit(static_cast<unsigned char>(c))) return -1;
        major = major * 10 + (c - '0');
        if (major > 100000) return -1;
    }
    return major;
}

std::string exportProject(const MallProject& project) {
    json doc;
    doc["version"] = kProjectFormatVersion;

    json m;
    m["id"] = project.id;
    m["name"] = project.name;
    m["description"] = project.description;
    m["outline"] = encodePolygon(project.outline);
    m["gridSize"] = project.settings.gridSize;
    m["unit"] = lengthUnitName(project.settings.unit);
    m["snapToGrid"] = project.settings.snapToGrid;
    m["defaultFloorHeight"] = project.settings.defaultFloorHeight;
    m["createdAt"] = project.createdAtMs;
    m["updatedAt"] = project.updatedAtMs;
    m["revision"] = project.revision;
    doc["mall"] = std::move(m);

    json floors = json::array();
    for (const auto& floor : project.floors) floors.push_back(encodeFloor(floor));
    doc["floors"] = std::move(floors);

    json connections = json::array();
    for (const auto& c : project.connections) {
        json entry;
        entry["areaId"] = c.areaId;
        entry["type"] = connectionTypeName(c.type);
        entry["floorIds"] = c.floorIds;
        connections.push_back(std::move(entry));
    }
    doc["connections"] = std::move(connections);

    return doc.dump(2);
}

ImportResult importProject(const std::string& text) {
    ImportResult result{};
    const json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        result.error = MallError::InvalidDocument;
        result.message = "malformed JSON";
        MALL_LOG_WARN("import failed: %s", result.message.c_str());
        return result;
    }

    MallProject project;
    try {
        project = decodeProject(doc);
    } catch (const DocumentError& e) {
        result.error = e.code();
        result.message = e.what();
        MALL_LOG_WARN("import failed: %s", result.message.c_str());
        return result;
    }

    ProjectCheck check = checkProjectStructure(project);
    if (!check.ok()) {
        result.error = check.error;
        result.message = std::move(check.message);
        MALL_LOG_WARN("import failed: %s", result.message.c_str());
        return result;
    }

    result.project = std::move(project);
    return result;
}

} // namespace mall
