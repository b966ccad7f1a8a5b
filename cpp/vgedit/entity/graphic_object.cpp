#include "vgedit/entity/graphic_object.h"
#include "vgedit/core/logging.h"

#include <cmath>
#include <utility>

namespace vgedit {

namespace {

bool allFinite(const std::vector<Vec2>& points) noexcept {
    for (const Vec2& p : points) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) return false;
    }
    return true;
}

} // namespace

bool isValidObjectName(const std::string& name) noexcept {
    return name.find_first_of("\r\n") == std::string::npos;
}

const char* rotationReferenceName(RotationReference ref) noexcept {
    switch (ref) {
        case RotationReference::Center: return "center";
        case RotationReference::Origin: return "origin";
        case RotationReference::Absolute: return "absolute";
    }
    return "unknown";
}

Vec2 GraphicObject::centroid() const noexcept {
    if (vertices.empty()) return Vec2{};
    Vec2 sum{};
    for (const Vec2& v : vertices) sum += v;
    return sum / static_cast<double>(vertices.size());
}

EngineError validateObject(const GraphicObject& object) {
    if (!isValidObjectName(object.name)) {
        VGEDIT_LOG_WARN("object name contains a line break");
        return EngineError::ValidationError;
    }
    if (!allFinite(object.vertices)) {
        VGEDIT_LOG_WARN("object '%s' has non-finite coordinates", object.name.c_str());
        return EngineError::ValidationError;
    }
    switch (object.kind) {
        case ObjectKind::Point:
            if (object.vertices.size() == 1) return EngineError::Ok;
            break;
        case ObjectKind::Line:
            if (object.vertices.size() == 2 && object.vertices[0] != object.vertices[1]) return EngineError::Ok;
            break;
        case ObjectKind::Polygon:
            if (object.vertices.size() >= 3) return EngineError::Ok;
            break;
        case ObjectKind::Curve:
            if (!allFinite(object.controlPoints)) break;
            if (object.vertices.size() < 2) break;
            return curve::validateControlCount(object.basis, object.controlPoints.size());
    }
    VGEDIT_LOG_WARN("object '%s' is not a valid %s (%zu vertices)",
        object.name.c_str(), objectKindName(object.kind), object.vertices.size());
    return EngineError::ValidationError;
}

EngineError makePoint(const std::string& name, const Vec2& position, GraphicObject& out) {
    GraphicObject obj{};
    obj.kind = ObjectKind::Point;
    obj.name = name;
    obj.vertices = {position};
    const EngineError err = validateObject(obj);
    if (err != EngineError::Ok) return err;
    out = std::move(obj);
    return EngineError::Ok;
}

EngineError makeLine(const std::string& name, const Vec2& start, const Vec2& end, GraphicObject& out) {
    GraphicObject obj{};
    obj.kind = ObjectKind::Line;
    obj.name = name;
    obj.vertices = {start, end};
    const EngineError err = validateObject(obj);
    if (err != EngineError::Ok) return err;
    out = std::move(obj);
    return EngineError::Ok;
}

EngineError makePolygon(const std::string& name, const std::vector<Vec2>& vertices, bool filled, GraphicObject& out) {
    GraphicObject obj{};
    obj.kind = ObjectKind::Polygon;
    obj.name = name;
    obj.vertices = vertices;
    obj.filled = filled;
    const EngineError err = validateObject(obj);
    if (err != EngineError::Ok) return err;
    out = std::move(obj);
    return EngineError::Ok;
}

EngineError makeCurve(
    const std::string& name,
    curve::CurveBasis basis,
    const std::vector<Vec2>& controls,
    std::uint32_t steps,
    GraphicObject& out
) {
    if (!isValidObjectName(name)) {
        VGEDIT_LOG_WARN("curve name contains a line break");
        return EngineError::ValidationError;
    }
    if (!allFinite(controls)) {
        VGEDIT_LOG_WARN("curve '%s' has non-finite control points", name.c_str());
        return EngineError::ValidationError;
    }
    GraphicObject obj{};
    obj.kind = ObjectKind::Curve;
    obj.name = name;
    obj.basis = basis;
    obj.steps = steps;
    obj.controlPoints = controls;

    curve::TessellateOptions opts{};
    opts.steps = steps;
    const EngineError err = curve::CurveTessellator(opts).tessellate(basis, controls, obj.vertices);
    if (err != EngineError::Ok) return err;

    out = std::move(obj);
    return EngineError::Ok;
}

Vec2 rotationPivot(const GraphicObject& object, RotationReference ref, const Vec2& absolutePivot) noexcept {
    switch (ref) {
        case RotationReference::Center: return object.centroid();
        case RotationReference::Origin: return Vec2{};
        case RotationReference::Absolute: return absolutePivot;
    }
    return object.centroid();
}

EngineError transformObject(GraphicObject& object, const Mat3& matrix) {
    GraphicObject next = object;
    if (next.kind == ObjectKind::Curve) {
        next.controlPoints = transformed(object.controlPoints, matrix);
        curve::TessellateOptions opts{};
        opts.steps = next.steps;
        const EngineError err = curve::CurveTessellator(opts).tessellate(next.basis, next.controlPoints, next.vertices);
        if (err != EngineError::Ok) return err;
    } else {
        next.vertices = transformed(object.vertices, matrix);
    }

    const EngineError err = validateObject(next);
    if (err != EngineError::Ok) return err;
    object = std::move(next);
    return EngineError::Ok;
}

EngineError translateObject(GraphicObject& object, const Vec2& offset) {
    if (!std::isfinite(offset.x) || !std::isfinite(offset.y)) return EngineError::InvalidOperation;
    return transformObject(object, translationMatrix(offset.x, offset.y));
}

EngineError scaleObject(GraphicObject& object, double factor) {
    if (!(factor > 0.0) || !std::isfinite(factor)) return EngineError::InvalidOperation;
    return transformObject(object, aroundPivot(scaleMatrix(factor, factor), object.centroid()));
}

EngineError rotateObject(GraphicObject& object, double angleDeg, RotationReference ref, const Vec2& absolutePivot) {
    if (!std::isfinite(angleDeg)) return EngineError::InvalidOperation;
    const Vec2 pivot = rotationPivot(object, ref, absolutePivot);
    return transformObject(object, aroundPivot(rotationMatrix(angleDeg), pivot));
}

} // namespace vgedit
