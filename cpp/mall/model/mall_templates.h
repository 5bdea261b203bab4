#pragma once

#include "mall/model/spatial_model.h"

#include <string>
#include <vector>

namespace mall {

// Canned outline plus suggested floor stack. Plain data.
struct MallTemplate {
    std::string id;
    std::string name;
    std::string description;
    Polygon outline;
    int suggestedFloors{3};
    double defaultFloorHeight{4.0};
};

// Outlines are centred on the origin.
Polygon centeredRectangle(double width, double height);
Polygon lShapeOutline(double width, double height, double armWidth, double armHeight);
Polygon uShapeOutline(double width, double height, double courtWidth, double courtHeight);
Polygon tShapeOutline(double width, double height, double stemWidth, double stemHeight);

// rectangle, l-shape, u-shape, t-shape, circle.
const std::vector<MallTemplate>& mallTemplates();
const MallTemplate* findTemplate(const std::string& id);

struct TemplateResult {
    MallError error{MallError::Ok};
    PolygonIssue polygonIssue{PolygonIssue::None};
    std::vector<std::string> floorIds; // floors created, bottom-up

    bool ok() const noexcept { return error == MallError::Ok; }
};

// Routes the template through model.setOutline, then addFloor for levels
// 1..suggestedFloors, as one undo step. Levels already present are left
// alone. Any failure rolls the model back to its state before the call.
TemplateResult applyTemplate(SpatialModel& model, const MallTemplate& tpl);

} // namespace mall
