#ifndef VGEDIT_ENTITY_GRAPHIC_OBJECT_H
#define VGEDIT_ENTITY_GRAPHIC_OBJECT_H

#include "vgedit/core/editor_constants.h"
#include "vgedit/core/types.h"
#include "vgedit/curve/curve_tessellation.h"
#include "vgedit/math/vector_math.h"

#include <cstdint>
#include <string>
#include <vector>

namespace vgedit {

enum class RotationReference : std::uint8_t {
    Center = 0,   // object centroid
    Origin = 1,   // world origin
    Absolute = 2, // caller supplied pivot
};

const char* rotationReferenceName(RotationReference ref) noexcept;

// A drawable object in world coordinates.
//
// For Curve objects `vertices` is the tessellated polyline derived from
// `controlPoints`; edit the controls and re-tessellate, never the cache.
struct GraphicObject {
    ObjectKind kind{ObjectKind::Point};
    std::string name;
    std::vector<Vec2> vertices;
    bool filled{false};

    // Curve only.
    std::vector<Vec2> controlPoints;
    curve::CurveBasis basis{curve::CurveBasis::Polyline};
    std::uint32_t steps{editor_constants::CURVE_STEPS};

    Vec2 centroid() const noexcept;
};

// Names are stored on a single line of the scene file, so they may not
// contain '\r' or '\n'.
bool isValidObjectName(const std::string& name) noexcept;

// Factories. Degenerate input yields ValidationError and leaves out untouched.
EngineError makePoint(const std::string& name, const Vec2& position, GraphicObject& out);
EngineError makeLine(const std::string& name, const Vec2& start, const Vec2& end, GraphicObject& out);
EngineError makePolygon(const std::string& name, const std::vector<Vec2>& vertices, bool filled, GraphicObject& out);
EngineError makeCurve(
    const std::string& name,
    curve::CurveBasis basis,
    const std::vector<Vec2>& controls,
    std::uint32_t steps,
    GraphicObject& out);

// Re-checks the construction invariants of an existing object.
EngineError validateObject(const GraphicObject& object);

Vec2 rotationPivot(const GraphicObject& object, RotationReference ref, const Vec2& absolutePivot) noexcept;

// Transforms are all-or-nothing: if the result would violate the object's
// invariants the object is left as it was.
EngineError transformObject(GraphicObject& object, const Mat3& matrix);
EngineError translateObject(GraphicObject& object, const Vec2& offset);
// Uniform scale about the centroid. factor must be positive.
EngineError scaleObject(GraphicObject& object, double factor);
EngineError rotateObject(
    GraphicObject& object,
    double angleDeg,
    RotationReference ref,
    const Vec2& absolutePivot = Vec2{});

} // namespace vgedit

#endif // VGEDIT_ENTITY_GRAPHIC_OBJECT_H
