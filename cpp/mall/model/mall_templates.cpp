#include "mall/model/mall_templates.h"
#include "mall/core/constants.h"
#include "mall/core/logging.h"
#include "mall/geometry/shapes.h"

namespace mall {

Polygon centeredRectangle(double width, double height) {
    return translatePolygon(rectangleToPolygon(0.0, 0.0, width, height), -width / 2.0, -height / 2.0);
}

//    +--------+
//    |        |
//    |   +----+
//    |   |
//    +---+
Polygon lShapeOutline(double width, double height, double armWidth, double armHeight) {
    const double hw = width / 2.0;
    const double hh = height / 2.0;
    const double step = -hh + (height - armHeight);
    Polygon p{};
    p.vertices = {
        {-hw, -hh}, {hw, -hh}, {hw, step},
        {-hw + armWidth, step}, {-hw + armWidth, hh}, {-hw, hh},
    };
    return p;
}

//    +---+   +---+
//    |   |   |   |
//    |   +---+   |
//    |           |
//    +-----------+
Polygon uShapeOutline(double width, double height, double courtWidth, double courtHeight) {
    const double hw = width / 2.0;
    const double hh = height / 2.0;
    const double side = (width - courtWidth) / 2.0;
    Polygon p{};
    p.vertices = {
        {-hw, -hh}, {hw, -hh}, {hw, hh},
        {hw - side, hh}, {hw - side, hh - courtHeight},
        {-hw + side, hh - courtHeight}, {-hw + side, hh}, {-hw, hh},
    };
    return p;
}

//    +-----------+
//    |           |
//    +---+   +---+
//        |   |
//        +---+
Polygon tShapeOutline(double width, double height, double stemWidth, double stemHeight) {
    const double hw = width / 2.0;
    const double hh = height / 2.0;
    const double hs = stemWidth / 2.0;
    const double bar = -hh + (height - stemHeight);
    Polygon p{};
    p.vertices = {
        {-hw, -hh}, {hw, -hh}, {hw, bar}, {hs, bar},
        {hs, hh}, {-hs, hh}, {-hs, bar}, {-hw, bar},
    };
    return p;
}

const std::vector<MallTemplate>& mallTemplates() {
    static const std::vector<MallTemplate> kTemplates = {
        {"rectangle", "Rectangle", "Standard rectangular layout",
            centeredRectangle(100.0, 80.0), 3, kDefaultFloorHeight},
        {"l-shape", "L-shape", "Corner plot with two street frontages",
            lShapeOutline(120.0, 100.0, 40.0, 60.0), 3, kDefaultFloorHeight},
        {"u-shape", "U-shape", "Wings around a central court",
            uShapeOutline(120.0, 100.0, 40.0, 60.0), 3, kDefaultFloorHeight},
        {"t-shape", "T-shape", "Wide frontage with a projecting entrance wing",
            tShapeOutline(120.0, 100.0, 40.0, 50.0), 3, kDefaultFloorHeight},
        {"circle", "Circle", "32-sided landmark rotunda",
            regularPolygon(Point2D{0.0, 0.0}, 50.0, 32), 3, kDefaultFloorHeight},
    };
    return kTemplates;
}

const MallTemplate* findTemplate(const std::string& id) {
    for (const auto& tpl : mallTemplates()) {
        if (tpl.id == id) return &tpl;
    }
    return nullptr;
}

TemplateResult applyTemplate(SpatialModel& model, const MallTemplate& tpl) {
    TemplateResult result{};
    if (!model.beginBatch("Apply template")) {
        result.error = MallError::InvalidState;
        return result;
    }

    const OutlineResult outline = model.setOutline(tpl.outline);
    if (!outline.ok()) {
        model.rollbackBatch();
        result.error = outline.error;
        result.polygonIssue = outline.polygonIssue;
        return result;
    }

    for (int level = 1; level <= tpl.suggestedFloors; ++level) {
        FloorDefinition floor = createDefaultFloor("floor-" + std::to_string(level), level);
        floor.height = tpl.defaultFloorHeight;
        const FloorResult added = model.addFloor(floor);
        if (added.error == MallError::DuplicateLevel) continue;
        if (!added.ok()) {
            MALL_LOG_WARN("applyTemplate '%s' rolled back: floor '%s' rejected (%s)",
                tpl.id.c_str(), floor.id.c_str(), errorName(added.error));
            model.rollbackBatch();
            result.error = added.error;
            result.floorIds.clear();
            return result;
        }
        result.floorIds.push_back(added.floor.id);
    }

    model.commitBatch();
    return result;
}

} // namespace mall
